// ============================================================================
// Example 01: Escrow Lifecycle
// ============================================================================
//
// Walks one task through Open -> Assigned -> Completed and another through
// Open -> Cancelled, printing balances and the event stream.
//
// RUN:
//   cd build && ./examples/01_escrow_lifecycle
//
// ============================================================================

#include "pactum/pactum.hpp"

#include <iostream>
#include <variant>

using namespace pactum;
using namespace std::chrono_literals;

namespace {

// Prints each notification as it is delivered
class PrintingSink : public EventSink {
   public:
    void OnEvent(const Event& event) override {
        std::cout << "  event: " << EventName(event);
        if (const auto* paid = std::get_if<PaymentReleased>(&event)) {
            std::cout << " (" << paid->amount << " to " << paid->freelancer << ")";
        }
        std::cout << std::endl;
    }
};

void PrintBalances(const InMemoryLedger& ledger, const TaskRegistry& registry) {
    std::cout << "  balances: client=" << ledger.BalanceOf(Identity("alice"))
              << " freelancer=" << ledger.BalanceOf(Identity("bob"))
              << " owner=" << ledger.BalanceOf(registry.GetOwner()) << " held=" << registry.GetHeldBalance()
              << std::endl;
}

}  // namespace

int main() {
    std::cout << "=== Pactum Example 01: Escrow Lifecycle ===" << std::endl;
    std::cout << std::endl;

    const Identity owner("platform");
    const Identity client("alice");
    const Identity freelancer("bob");

    InMemoryLedger ledger;
    SystemClock clock;
    PrintingSink sink;
    if (auto ec = ledger.Mint(client, 1'000)) {
        std::cerr << "cannot fund " << client << ": " << ec.message() << std::endl;
        return 1;
    }

    auto config = RegistryConfig::FromEnvironment(owner);
    if (config.IsErr()) {
        std::cerr << "bad configuration: " << config.Error().message() << std::endl;
        return 1;
    }
    auto created = TaskRegistry::Create(config.Value(), ledger, clock, &sink);
    if (created.IsErr()) {
        std::cerr << "cannot create registry: " << created.Error().message() << std::endl;
        return 1;
    }
    TaskRegistry& registry = *created.Value();

    // Example 1: Happy path with dual confirmation
    std::cout << "--- Example 1: Dual Confirmation ---" << std::endl;
    auto id = registry.CreateTask(client, "Landing page", "Responsive, three sections", clock.Now() + 24h, 400);
    if (id.IsErr()) {
        std::cerr << "create failed: " << id.Error().message() << std::endl;
        return 1;
    }
    PrintBalances(ledger, registry);

    auto early = registry.CompleteTask(client, id.Value());
    std::cout << "  client approves before submission: " << early.Error().message() << std::endl;

    if (auto r = registry.AcceptTask(freelancer, id.Value()); r.IsErr()) {
        std::cerr << "accept failed: " << r.Error().message() << std::endl;
        return 1;
    }
    if (auto r = registry.CompleteTask(freelancer, id.Value()); r.IsErr()) {
        std::cerr << "submit failed: " << r.Error().message() << std::endl;
        return 1;
    }
    if (auto r = registry.CompleteTask(client, id.Value()); r.IsErr()) {
        std::cerr << "approve failed: " << r.Error().message() << std::endl;
        return 1;
    }
    std::cout << "  status: " << registry.GetTask(id.Value()).Value().status << std::endl;
    PrintBalances(ledger, registry);
    std::cout << std::endl;

    // Example 2: Cancellation refunds in full
    std::cout << "--- Example 2: Cancellation ---" << std::endl;
    auto cancelled = registry.CreateTask(client, "Copy editing", "", clock.Now() + 1h, 250);
    if (cancelled.IsErr()) {
        std::cerr << "create failed: " << cancelled.Error().message() << std::endl;
        return 1;
    }
    PrintBalances(ledger, registry);
    if (auto r = registry.CancelTask(client, cancelled.Value()); r.IsErr()) {
        std::cerr << "cancel failed: " << r.Error().message() << std::endl;
        return 1;
    }
    PrintBalances(ledger, registry);
    std::cout << std::endl;

    std::cout << "completed tasks: alice=" << registry.GetCompletedTaskCount(client)
              << " bob=" << registry.GetCompletedTaskCount(freelancer) << std::endl;
    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
