// ============================================================================
// handoff/execution/sender.hpp - SharedReader<T> -> P2300 Sender Adapter
// ============================================================================
//
// Exposes a channel's outcome as a P2300 sender so it composes with stdexec
// algorithms (then, when_all, sync_wait, ...).
//
// DESIGN:
// -------
// start() registers a continuation on the channel. When the writer settles
// it, the continuation runs on the committing thread and completes the
// receiver with set_value(Result<T, Error>). If the channel is already
// settled, start() completes inline.
//
// handoff is built with -fno-exceptions, so errors (including
// Errc::BrokenContract) travel in the value channel, never set_error.
//
// USAGE:
// ------
//   auto [writer, reader] = SingleAssignmentChannel<int>::Create();
//
//   auto doubled = handoff::execution::AsSender(reader.Share())
//                | stdexec::then([](Result<int, Error> r) { return r.ValueOr(0) * 2; });
//
//   ScopedThread producer([w = std::move(writer)]() mutable { auto c = w.CommitValue(21); });
//   auto [value] = stdexec::sync_wait(std::move(doubled)).value();  // 42
//
// ============================================================================

#pragma once

#include "handoff/core/channel.hpp"

#include <stdexec/execution.hpp>
#include <utility>

namespace handoff::execution {

// ============================================================================
// ReaderOperation<T, Receiver> - operation_state
// ============================================================================
template <typename T, typename Receiver>
class ReaderOperation {
   public:
    ReaderOperation(SharedReader<T> reader, Receiver rcvr) noexcept
        : reader_(std::move(reader)), receiver_(std::move(rcvr)) {}

    ReaderOperation(ReaderOperation&&) = delete;
    ReaderOperation& operator=(ReaderOperation&&) = delete;

    void start() noexcept {
        // An empty reader cannot register; Complete() reports Errc::NoState.
        auto registered = reader_.OnReady([this] { Complete(); });
        if (registered.IsErr()) {
            Complete();
        }
    }

   private:
    void Complete() noexcept { stdexec::set_value(std::move(receiver_), reader_.Get()); }

    SharedReader<T> reader_;
    Receiver receiver_;
};

// ============================================================================
// ReaderSender<T>
// ============================================================================
template <typename T>
class ReaderSender {
   public:
    using sender_concept = stdexec::sender_t;

    explicit ReaderSender(SharedReader<T> reader) noexcept : reader_(std::move(reader)) {}

    // Copyable: every connection reads the same outcome.
    template <class Receiver>
    auto connect(Receiver rcvr) const noexcept -> ReaderOperation<T, Receiver> {
        return ReaderOperation<T, Receiver>{reader_, std::move(rcvr)};
    }

    template <class, class...>
    static consteval auto get_completion_signatures() noexcept {
        return stdexec::completion_signatures<stdexec::set_value_t(Result<T, Error>)>{};
    }

   private:
    SharedReader<T> reader_;
};

template <typename T>
ReaderSender<T> AsSender(SharedReader<T> reader) noexcept {
    return ReaderSender<T>{std::move(reader)};
}

// Consumes a single-use reader by sharing it.
template <typename T>
ReaderSender<T> AsSender(Reader<T>&& reader) noexcept {
    return ReaderSender<T>{reader.Share()};
}

}  // namespace handoff::execution
