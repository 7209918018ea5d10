// ============================================================================
// handoff/core/result.hpp - Value-or-Error Outcome
// ============================================================================
//
// Result<T, E> holds either a success value (T) or an error (E). It is the
// return type of every fallible handoff operation, since the library is
// built without exceptions.
//
// A committed channel outcome is itself a Result<T, Error>: readers receive
// exactly what the writer settled, whether that was a value or an error.
//
// USAGE:
// ------
//   auto [writer, reader] = SingleAssignmentChannel<int>::Create();
//
//   Result<void, Error> committed = writer.CommitValue(7);
//   Result<int, Error> got = reader.Get();
//   if (got.IsOk()) {
//       Use(got.Value());
//   } else if (got.Error() == Errc::BrokenContract) {
//       ...
//   }
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace handoff {

template <typename T, typename E>
class Result;

// ============================================================================
// Ok and Err Tag Types
// ============================================================================
// Carry the payload until it meets the Result type it converts into, so the
// factories below need no template arguments at the call site.

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
// Result<T, E>
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

    // Undefined behavior if IsErr()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Undefined behavior if IsOk()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    T ValueOr(T default_value) const {
        if (IsOk()) return std::get<0>(data_);
        return default_value;
    }

   private:
    std::variant<T, E> data_;
};

// ============================================================================
// Result<void, E>
// ============================================================================
// Outcome of commits, waits and void channels: success carries no value.

template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

// ============================================================================
// Comparison
// ============================================================================

template <typename T, typename E>
bool operator==(const Result<T, E>& lhs, const Result<T, E>& rhs) {
    if (lhs.IsOk() != rhs.IsOk()) return false;
    if (lhs.IsOk()) return lhs.Value() == rhs.Value();
    return lhs.Error() == rhs.Error();
}

template <typename E>
bool operator==(const Result<void, E>& lhs, const Result<void, E>& rhs) {
    if (lhs.IsOk() != rhs.IsOk()) return false;
    return lhs.IsOk() || lhs.Error() == rhs.Error();
}

template <typename T, typename E>
bool operator!=(const Result<T, E>& lhs, const Result<T, E>& rhs) {
    return !(lhs == rhs);
}

}  // namespace handoff
