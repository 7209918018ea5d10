// ============================================================================
// handoff/core/channel.hpp - Single-Assignment Result Channel
// ============================================================================
//
// A SingleAssignmentChannel<T> carries exactly one outcome, a value of type
// T or an Error, from one writer thread to its reader(s).
//
//   Writer<T>        - move-only, commits the outcome once.
//   Reader<T>        - move-only, retrieves the value once.
//   SharedReader<T>  - copyable, every copy may read the outcome any
//                      number of times.
//
// RULES:
// ------
// 1. SETTLES ONCE: the first CommitValue()/CommitError() wins; every later
//    commit returns Errc::AlreadyCommitted and changes nothing.
// 2. NO ORPHANED READERS: a Writer destroyed (or overwritten by move) before
//    committing settles the channel with Errc::BrokenContract, so no reader
//    blocks forever.
// 3. ONE RETRIEVAL: Reader::Get() hands the value out once; the next call
//    returns Errc::AlreadyRetrieved. A committed error is not consumed and is
//    returned on every call.
// 4. SHARE INVALIDATES: Reader::Share() moves the state into a SharedReader;
//    the original reader then fails every operation with Errc::Invalidated.
//
// The commit happens-before any reader observes readiness: settlement and
// waiting go through the same mutex/condition-variable pair.
//
// USAGE:
// ------
//   auto [writer, reader] = SingleAssignmentChannel<int>::Create();
//
//   ScopedThread producer([w = std::move(writer)]() mutable {
//       std::this_thread::sleep_for(10ms);
//       auto committed = w.CommitValue(42);
//   });
//
//   auto result = reader.Get();  // blocks until committed
//   if (result.IsOk()) std::cout << result.Value() << std::endl;  // 42
//
// FAN-OUT:
// --------
//   SharedReader<Config> config = reader.Share();
//   for (auto& worker : workers) worker.Start(config);  // copies
//
// ============================================================================

#pragma once

#include "handoff/core/deadline.hpp"
#include "handoff/core/error.hpp"
#include "handoff/core/result.hpp"

#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace handoff {

enum class WaitStatus {
    Ready,
    TimedOut,
};

template <typename T>
class Writer;

template <typename T>
class Reader;

template <typename T>
class SharedReader;

template <typename T>
class SingleAssignmentChannel;

namespace detail {

// ============================================================================
// ChannelState - Shared by the writer and every reader of one channel
// ============================================================================
template <typename T>
class ChannelState {
   public:
    using Outcome = Result<T, Error>;

    ChannelState() = default;

    ChannelState(const ChannelState&) = delete;
    ChannelState& operator=(const ChannelState&) = delete;

    Result<void, Error> Settle(Outcome outcome) {
        if (!TrySettle(std::move(outcome))) {
            return Err(Errc::AlreadyCommitted);
        }
        return Ok();
    }

    // Writer released without committing.
    void Abandon() {
        // Nothing to do when the writer already settled the channel.
        TrySettle(Outcome(Err(Errc::BrokenContract)));
    }

    bool IsReady() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slot_.has_value();
    }

    void Wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return slot_.has_value(); });
    }

    // Timeouts too large for the clock wait without a bound.
    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        return WaitUntilSteady(SteadyDeadline(timeout));
    }

    template <typename Clock, typename Duration>
    bool WaitUntil(const std::chrono::time_point<Clock, Duration>& deadline) const {
        return WaitUntilSteady(SteadyDeadline(deadline));
    }

    // Single-reader retrieval: moves the value out.
    Outcome Take() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return slot_.has_value(); });
        if (retrieved_) {
            return Err(Errc::AlreadyRetrieved);
        }
        if (slot_->IsErr()) {
            return Err(slot_->Error());
        }
        retrieved_ = true;
        return std::move(*slot_);
    }

    // Shared retrieval: copies the outcome, consumes nothing.
    Outcome Peek() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return slot_.has_value(); });
        if (retrieved_) {
            return Err(Errc::AlreadyRetrieved);
        }
        return *slot_;
    }

    // Runs callback once the channel settles: on the committing thread after
    // the lock is released, or right here if it is already settled.
    void OnSettled(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!slot_.has_value()) {
                callbacks_.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

   private:
    bool WaitUntilSteady(const std::optional<std::chrono::steady_clock::time_point>& deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!deadline) {
            cv_.wait(lock, [this] { return slot_.has_value(); });
            return true;
        }
        return cv_.wait_until(lock, *deadline, [this] { return slot_.has_value(); });
    }

    bool TrySettle(Outcome outcome) {
        std::vector<std::function<void()>> to_call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (slot_.has_value()) {
                return false;
            }
            slot_.emplace(std::move(outcome));
            to_call = std::move(callbacks_);
            cv_.notify_all();
        }
        for (auto& callback : to_call) {
            callback();
        }
        return true;
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<Outcome> slot_;  // empty until settled
    bool retrieved_ = false;
    std::vector<std::function<void()>> callbacks_;
};

template <typename T>
using ChannelStatePtr = std::shared_ptr<ChannelState<T>>;

}  // namespace detail

// ============================================================================
// Writer<T>
// ============================================================================
template <typename T>
class Writer {
   public:
    // An empty writer; every commit returns Errc::NoState.
    Writer() = default;

    ~Writer() { Release(); }

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    Writer(Writer&& other) noexcept = default;

    // Overwriting a live, uncommitted writer breaks its contract first.
    Writer& operator=(Writer&& other) noexcept {
        if (this != &other) {
            Release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    template <typename V>
    [[nodiscard]] Result<void, Error> CommitValue(V&& value)
        requires(!std::is_void_v<T> && std::constructible_from<T, V &&>)
    {
        if (!state_) {
            return Err(Errc::NoState);
        }
        return state_->Settle(Ok(T(std::forward<V>(value))));
    }

    [[nodiscard]] Result<void, Error> CommitValue()
        requires std::is_void_v<T>
    {
        if (!state_) {
            return Err(Errc::NoState);
        }
        return state_->Settle(Ok());
    }

    // A default-constructed (zero) error code is rejected with
    // Errc::InvalidArgument and leaves the channel unsettled.
    [[nodiscard]] Result<void, Error> CommitError(Error error) {
        if (!state_) {
            return Err(Errc::NoState);
        }
        if (!error) {
            return Err(Errc::InvalidArgument);
        }
        return state_->Settle(Err(std::move(error)));
    }

    bool IsCommitted() const { return state_ && state_->IsReady(); }

    bool Valid() const noexcept { return state_ != nullptr; }

   private:
    friend class SingleAssignmentChannel<T>;

    explicit Writer(detail::ChannelStatePtr<T> state) : state_(std::move(state)) {}

    void Release() {
        if (state_) {
            state_->Abandon();
            state_.reset();
        }
    }

    detail::ChannelStatePtr<T> state_;
};

// ============================================================================
// Reader<T>
// ============================================================================
template <typename T>
class Reader {
   public:
    Reader() = default;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    Reader(Reader&& other) noexcept
        : state_(std::move(other.state_)), invalidated_(std::exchange(other.invalidated_, false)) {}

    Reader& operator=(Reader&& other) noexcept {
        if (this != &other) {
            state_ = std::move(other.state_);
            invalidated_ = std::exchange(other.invalidated_, false);
        }
        return *this;
    }

    // Blocks until settled. Returns the value (once), or the committed error.
    [[nodiscard]] Result<T, Error> Get() {
        if (!state_) {
            return Err(Unusable());
        }
        return state_->Take();
    }

    Result<void, Error> Wait() const {
        if (!state_) {
            return Err(Unusable());
        }
        state_->Wait();
        return Ok();
    }

    // Never consumes the value: a later Get() still succeeds.
    template <typename Rep, typename Period>
    Result<WaitStatus, Error> WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        if (!state_) {
            return Err(Unusable());
        }
        return Ok(state_->WaitFor(timeout) ? WaitStatus::Ready : WaitStatus::TimedOut);
    }

    template <typename Clock, typename Duration>
    Result<WaitStatus, Error> WaitUntil(const std::chrono::time_point<Clock, Duration>& deadline) const {
        if (!state_) {
            return Err(Unusable());
        }
        return Ok(state_->WaitUntil(deadline) ? WaitStatus::Ready : WaitStatus::TimedOut);
    }

    bool IsReady() const { return state_ && state_->IsReady(); }

    bool Valid() const noexcept { return state_ != nullptr; }

    // Converts into a multi-read handle. This reader is left invalidated.
    // Sharing a reader without state yields an empty SharedReader that
    // reports the same error this reader would (Invalidated or NoState).
    [[nodiscard]] SharedReader<T> Share() {
        if (!state_) {
            return SharedReader<T>(Unusable());
        }
        invalidated_ = true;
        return SharedReader<T>(std::move(state_));
    }

   private:
    friend class SingleAssignmentChannel<T>;

    explicit Reader(detail::ChannelStatePtr<T> state) : state_(std::move(state)) {}

    Errc Unusable() const noexcept { return invalidated_ ? Errc::Invalidated : Errc::NoState; }

    detail::ChannelStatePtr<T> state_;
    bool invalidated_ = false;
};

// ============================================================================
// SharedReader<T>
// ============================================================================
template <typename T>
class SharedReader {
    static_assert(std::is_void_v<T> || std::is_copy_constructible_v<T>,
                  "SharedReader<T> hands out copies and requires a copyable T");

   public:
    SharedReader() = default;

    // Blocks until settled, then returns a copy of the outcome.
    [[nodiscard]] Result<T, Error> Get() const {
        if (!state_) {
            return Err(empty_reason_);
        }
        return state_->Peek();
    }

    Result<void, Error> Wait() const {
        if (!state_) {
            return Err(empty_reason_);
        }
        state_->Wait();
        return Ok();
    }

    template <typename Rep, typename Period>
    Result<WaitStatus, Error> WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        if (!state_) {
            return Err(empty_reason_);
        }
        return Ok(state_->WaitFor(timeout) ? WaitStatus::Ready : WaitStatus::TimedOut);
    }

    template <typename Clock, typename Duration>
    Result<WaitStatus, Error> WaitUntil(const std::chrono::time_point<Clock, Duration>& deadline) const {
        if (!state_) {
            return Err(empty_reason_);
        }
        return Ok(state_->WaitUntil(deadline) ? WaitStatus::Ready : WaitStatus::TimedOut);
    }

    // callback runs exactly once after settlement, on the committing thread,
    // or immediately on this thread if the channel is already settled.
    Result<void, Error> OnReady(std::function<void()> callback) const {
        if (!state_) {
            return Err(empty_reason_);
        }
        state_->OnSettled(std::move(callback));
        return Ok();
    }

    bool IsReady() const { return state_ && state_->IsReady(); }

    bool Valid() const noexcept { return state_ != nullptr; }

   private:
    friend class Reader<T>;

    explicit SharedReader(detail::ChannelStatePtr<T> state) : state_(std::move(state)) {}

    explicit SharedReader(Errc empty_reason) : empty_reason_(empty_reason) {}

    detail::ChannelStatePtr<T> state_;
    // What operations report while state_ is empty
    Errc empty_reason_ = Errc::NoState;
};

// ============================================================================
// SingleAssignmentChannel<T> - Factory
// ============================================================================
template <typename T>
struct Channel {
    Writer<T> writer;
    Reader<T> reader;
};

template <typename T>
class SingleAssignmentChannel {
   public:
    SingleAssignmentChannel() = delete;

    [[nodiscard]] static Channel<T> Create() {
        auto state = std::make_shared<detail::ChannelState<T>>();
        return Channel<T>{Writer<T>(state), Reader<T>(std::move(state))};
    }
};

}  // namespace handoff
