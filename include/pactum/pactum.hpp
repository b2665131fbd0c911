// ============================================================================
// pactum/pactum.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete pactum library.
//
// USAGE:
// ------
//   #include <pactum/pactum.hpp>
//   using namespace pactum;
//
// ============================================================================

#pragma once

// Core primitives
#include "pactum/core/check.hpp"
#include "pactum/core/clock.hpp"
#include "pactum/core/error.hpp"
#include "pactum/core/logging.hpp"
#include "pactum/core/result.hpp"
#include "pactum/core/undo_log.hpp"

// Escrow domain
#include "pactum/escrow/config.hpp"
#include "pactum/escrow/events.hpp"
#include "pactum/escrow/fee.hpp"
#include "pactum/escrow/ledger.hpp"
#include "pactum/escrow/task.hpp"
#include "pactum/escrow/task_registry.hpp"
#include "pactum/escrow/types.hpp"
#include "pactum/escrow/value_transfer.hpp"
