// ============================================================================
// pactum/core/result.hpp - Result Type for Registry Operations
// ============================================================================
//
// Result<T, E> holds either a success value (T) or an error (E). Every
// registry operation returns one, so a rejected call is part of the return
// type rather than a hidden exception. E defaults to pactum::Error
// (std::error_code), and Err() accepts an Errc directly.
//
// USAGE:
// ------
//   Result<TaskId> Create(...) {
//       if (title.empty()) return Err(Errc::InvalidInput);
//       return Ok(next_id);
//   }
//
//   auto id = registry.CreateTask(client, "Logo", "", deadline, 100);
//   if (id.IsErr()) {
//       std::cerr << id.Error().message() << std::endl;
//   }
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "pactum/core/error.hpp"

namespace pactum {

template <typename T, typename E = Error>
class Result;

// ============================================================================
// Ok and Err Tag Types
// ============================================================================

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// Unit type for Result<void, E>
struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

// ============================================================================
// Result<T, E> - Success or Error
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Get value (undefined behavior if IsErr())
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Get error (undefined behavior if IsOk())
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    T ValueOr(T default_value) const {
        if (IsOk()) return std::get<0>(data_);
        return default_value;
    }

    // Map: Transform success value, forwarding the error untouched
    template <typename F>
    auto Map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        if (IsOk()) {
            return Ok(func(Value()));
        }
        return Err(Error());
    }

    // AndThen: Chain an operation that itself returns a Result
    template <typename F>
    auto AndThen(F&& func) && -> std::invoke_result_t<F, T&&> {
        if (IsOk()) {
            return func(std::move(*this).Value());
        }
        return Err(std::move(*this).Error());
    }

   private:
    std::variant<T, E> data_;
};

// ============================================================================
// Result<void, E> Specialization
// ============================================================================
// For state transitions that succeed without producing a value

template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(E(std::move(err.error))) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }

   private:
    std::optional<E> error_;
};

}  // namespace pactum
