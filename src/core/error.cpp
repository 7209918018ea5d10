// ============================================================================
// handoff/core/error.cpp - Error Category Implementation
// ============================================================================

#include "handoff/core/error.hpp"

#include <string>

namespace handoff {

namespace {

class HandoffCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "handoff"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::BrokenContract:
                return "Writer released without committing a result";
            case Errc::AlreadyCommitted:
                return "Result already committed";
            case Errc::AlreadyRetrieved:
                return "Result already retrieved";
            case Errc::Invalidated:
                return "Reader was converted to a shared reader";
            case Errc::NoState:
                return "Handle has no associated channel state";
            case Errc::InvalidArgument:
                return "Invalid argument";
            default:
                return "Unknown handoff error";
        }
    }
};

}  // namespace

const std::error_category& HandoffCategory() noexcept {
    static const HandoffCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), HandoffCategory()};
}

}  // namespace handoff
