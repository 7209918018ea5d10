// ============================================================================
// handoff/execution/stop_token_adapter.hpp - std::stop_token Interop
// ============================================================================
//
// Lets standard stop requests (std::jthread, std::stop_source, P2300
// receivers) stop handoff producers, and lets a ScopedThread's cancellation
// stop standard consumers.
//
//   std::stop_token  --StopTokenLink-->      CancellationSource
//   CancellationToken --CancellationLink-->  std::stop_source
//
// ScopedThread::Options::stop_token is built on StopTokenLink, so most code
// never names these types directly.
//
// USAGE:
// ------
//   // A jthread's stop request abandons the channel's producer
//   std::jthread owner([w = std::move(writer)](std::stop_token st) mutable {
//       auto [token, link] = handoff::execution::FromStopToken(st);
//       Produce(token, w);
//   });
//
//   // Destroying the ScopedThread also stops a std::stop_source
//   std::stop_source ss;
//   auto link = handoff::execution::LinkCancellation(thread.GetCancellationToken(), ss);
//
// ============================================================================

#pragma once

#include "handoff/core/cancellation.hpp"

#include <memory>
#include <optional>
#include <stop_token>

namespace handoff::execution {

// ============================================================================
// StopTokenLink - std::stop_token -> CancellationSource
// ============================================================================
// While alive, a stop request on `st` cancels `target`. Holds the source's
// shared state rather than the source itself, so the link keeps working when
// the CancellationSource (or the ScopedThread owning it) is moved. A token
// that is already stopped cancels `target` during construction.
class StopTokenLink {
   public:
    StopTokenLink(std::stop_token st, const CancellationSource& target) {
        if (st.stop_possible() && target.state_) {
            callback_.emplace(std::move(st), CancelTarget{target.state_});
        }
    }

    StopTokenLink(const StopTokenLink&) = delete;
    StopTokenLink& operator=(const StopTokenLink&) = delete;

    // False when the stop_token could never be stopped.
    bool Active() const noexcept { return callback_.has_value(); }

   private:
    struct CancelTarget {
        std::shared_ptr<CancellationState> state;
        void operator()() const { state->Cancel(); }
    };

    std::optional<std::stop_callback<CancelTarget>> callback_;
};

// A CancellationToken driven by a std::stop_token. Cancellation propagates
// only while `link` is alive.
struct StopTokenBridge {
    CancellationToken token;
    std::shared_ptr<StopTokenLink> link;
};

inline StopTokenBridge FromStopToken(std::stop_token st) {
    CancellationSource source;
    auto link = std::make_shared<StopTokenLink>(std::move(st), source);
    return {source.GetToken(), std::move(link)};
}

// ============================================================================
// CancellationLink - CancellationToken -> std::stop_source
// ============================================================================
// While alive, cancelling `token` requests a stop on `target`. Destruction
// waits for a forwarding call already in progress on another thread.
class CancellationLink {
   public:
    CancellationLink(CancellationToken token, std::stop_source target)
        : guard_(std::move(token), [target = std::move(target)]() mutable { target.request_stop(); }) {}

   private:
    CancellationCallbackGuard guard_;
};

[[nodiscard]] inline std::unique_ptr<CancellationLink> LinkCancellation(CancellationToken token,
                                                                        std::stop_source target) {
    return std::make_unique<CancellationLink>(std::move(token), std::move(target));
}

}  // namespace handoff::execution
