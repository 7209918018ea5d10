// ============================================================================
// handoff/core/error.hpp - Error Codes for handoff
// ============================================================================
//
// Every failure the library reports is a std::error_code. Channel misuse and
// writer abandonment use the handoff category; payloads committed through
// Writer::CommitError() may come from any category and are delivered as-is.
//
// USAGE:
// ------
//   auto result = reader.Get();
//   if (result.IsErr() && result.Error() == Errc::BrokenContract) {
//       // the writer went away without committing
//   }
//
// ============================================================================

#pragma once

#include <system_error>

namespace handoff {

enum class Errc {
    BrokenContract = 1,
    AlreadyCommitted,
    AlreadyRetrieved,
    Invalidated,
    NoState,
    InvalidArgument,
};

const std::error_category& HandoffCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

}  // namespace handoff

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<handoff::Errc> : true_type {};
}  // namespace std
