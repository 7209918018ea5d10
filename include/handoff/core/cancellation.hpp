// ============================================================================
// handoff/core/cancellation.hpp - Cooperative Cancellation
// ============================================================================
//
// A CancellationSource owns a cancellation flag; the CancellationTokens it
// hands out observe it. Nothing is interrupted preemptively: a thread body
// polls its token (or sleeps on it) and returns on its own.
//
// ScopedThread owns one source per thread and passes the token into the
// thread body, so destroying the ScopedThread asks the body to stop.
//
// USAGE:
// ------
//   CancellationSource source;
//   auto token = source.GetToken();
//
//   std::thread worker([token] {
//       while (!token.IsCancelled()) {
//           DoSomeWork();
//           token.WaitForCancellation(10ms);  // interruptible pause
//       }
//   });
//
//   source.Cancel();
//   worker.join();
//
// ============================================================================

#pragma once

#include "handoff/core/deadline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace handoff {

class CancellationSource;

namespace execution {
class StopTokenLink;
}  // namespace execution

// ============================================================================
// CancellationState - Shared between one source and its tokens
// ============================================================================
class CancellationState {
   public:
    CancellationState() = default;

    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Returns true only for the call that flipped the flag. Callbacks run on
    // this thread one at a time, outside the lock.
    bool Cancel() {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.notify_all();
        while (!callbacks_.empty()) {
            Registration next = std::move(callbacks_.front());
            callbacks_.erase(callbacks_.begin());
            running_handle_ = next.handle;
            running_thread_ = std::this_thread::get_id();

            lock.unlock();
            next.callback();
            lock.lock();

            running_handle_ = 0;
            cv_.notify_all();
        }
        return true;
    }

    // Callbacks registered after cancellation run immediately, on the
    // registering thread, outside the lock. Such registrations return 0.
    size_t RegisterCallback(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                size_t handle = next_handle_++;
                callbacks_.push_back(Registration{handle, std::move(callback)});
                return handle;
            }
        }
        callback();
        return 0;
    }

    // After this returns the callback is neither pending nor running, unless
    // it is called from inside that very callback.
    void UnregisterCallback(size_t handle) {
        if (handle == 0) return;

        std::unique_lock<std::mutex> lock(mutex_);
        auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                               [handle](const Registration& r) { return r.handle == handle; });
        if (it != callbacks_.end()) {
            callbacks_.erase(it);
            return;
        }
        if (running_handle_ == handle && running_thread_ != std::this_thread::get_id()) {
            cv_.wait(lock, [this, handle] { return running_handle_ != handle; });
        }
    }

    // Blocks until cancelled or until timeout elapses.
    // Returns true if cancellation was observed.
    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) {
        auto deadline = detail::SteadyDeadline(timeout);
        std::unique_lock<std::mutex> lock(mutex_);
        if (!deadline) {
            cv_.wait(lock, [this] { return IsCancelled(); });
            return true;
        }
        return cv_.wait_until(lock, *deadline, [this] { return IsCancelled(); });
    }

   private:
    struct Registration {
        size_t handle;
        std::function<void()> callback;
    };

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Registration> callbacks_;
    size_t next_handle_{1};
    // Callback currently executing inside Cancel(), 0 if none
    size_t running_handle_{0};
    std::thread::id running_thread_;
};

// ============================================================================
// CancellationToken - Read-only view of a source
// ============================================================================
class CancellationToken {
   public:
    // A default token is never cancelled.
    CancellationToken() : state_(nullptr) {}

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    // True while cancellation has NOT been requested.
    explicit operator bool() const noexcept { return !IsCancelled(); }

    size_t OnCancel(std::function<void()> callback) {
        if (state_) {
            return state_->RegisterCallback(std::move(callback));
        }
        return 0;
    }

    void Unregister(size_t handle) {
        if (state_) {
            state_->UnregisterCallback(handle);
        }
    }

    // Interruptible sleep. Returns true if the token was cancelled before
    // the timeout elapsed. A token without a source simply sleeps.
    template <typename Rep, typename Period>
    bool WaitForCancellation(const std::chrono::duration<Rep, Period>& timeout) const {
        if (!state_) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        return state_->WaitFor(timeout);
    }

    bool IsValid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] static CancellationToken None() { return CancellationToken{}; }

   private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationSource - Issues tokens and requests cancellation
// ============================================================================
class CancellationSource {
   public:
    CancellationSource() : state_(std::make_shared<CancellationState>()) {}

    // Movable; a moved-from source has no state and never cancels anything.
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;
    CancellationSource(CancellationSource&&) = default;
    CancellationSource& operator=(CancellationSource&&) = default;

    [[nodiscard]] CancellationToken GetToken() const { return CancellationToken(state_); }

    // Returns true if this call performed the cancellation.
    bool Cancel() { return state_ && state_->Cancel(); }

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

   private:
    friend class execution::StopTokenLink;

    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationCallbackGuard - Unregisters its callback on scope exit
// ============================================================================
class CancellationCallbackGuard {
   public:
    CancellationCallbackGuard(CancellationToken token, std::function<void()> callback)
        : token_(std::move(token)), handle_(token_.OnCancel(std::move(callback))) {}

    ~CancellationCallbackGuard() { token_.Unregister(handle_); }

    CancellationCallbackGuard(const CancellationCallbackGuard&) = delete;
    CancellationCallbackGuard& operator=(const CancellationCallbackGuard&) = delete;

   private:
    CancellationToken token_;
    size_t handle_;
};

}  // namespace handoff
