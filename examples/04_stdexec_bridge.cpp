// ============================================================================
// Example 04: Channels as P2300 Senders
// ============================================================================
//
// AsSender() exposes a channel's outcome to stdexec pipelines. The outcome
// arrives as a Result<T, Error> in the value channel.
//
// Build with:
//   cmake -B build -G Ninja -DENABLE_STDEXEC=ON && ninja -C build
//
// RUN:
//   cd build && ./examples/04_stdexec_bridge
//
// ============================================================================

#ifdef HANDOFF_HAS_STDEXEC

#include "handoff/execution/sender.hpp"
#include "handoff/handoff.hpp"

#include <chrono>
#include <iostream>
#include <stdexec/execution.hpp>
#include <thread>

using namespace handoff;
using namespace std::chrono_literals;

void demo_then() {
    std::cout << "--- Demo 1: Reader as sender ---" << std::endl;

    auto [writer, reader] = SingleAssignmentChannel<int>::Create();
    auto sender = execution::AsSender(std::move(reader)) | stdexec::then([](Result<int, Error> r) {
                      std::cout << "  [then] received " << r.ValueOr(-1) << std::endl;
                      return r.ValueOr(0) * 2;
                  });

    ScopedThread producer([w = std::move(writer)]() mutable {
        std::this_thread::sleep_for(10ms);
        if (auto committed = w.CommitValue(21); committed.IsErr()) {
            std::cerr << "commit failed: " << committed.Error().message() << std::endl;
        }
    });

    auto [value] = stdexec::sync_wait(std::move(sender)).value();
    std::cout << "  Result: " << value << std::endl;
    std::cout << std::endl;
}

void demo_when_all() {
    std::cout << "--- Demo 2: when_all over two channels ---" << std::endl;

    auto left = SingleAssignmentChannel<int>::Create();
    auto right = SingleAssignmentChannel<int>::Create();

    auto sender = stdexec::when_all(execution::AsSender(left.reader.Share()),
                                    execution::AsSender(right.reader.Share())) |
                  stdexec::then([](Result<int, Error> a, Result<int, Error> b) { return a.ValueOr(0) + b.ValueOr(0); });

    ScopedThread first([w = std::move(left.writer)]() mutable {
        if (auto committed = w.CommitValue(10); committed.IsErr()) {
            std::cerr << "commit failed: " << committed.Error().message() << std::endl;
        }
    });
    ScopedThread second([w = std::move(right.writer)]() mutable {
        if (auto committed = w.CommitValue(32); committed.IsErr()) {
            std::cerr << "commit failed: " << committed.Error().message() << std::endl;
        }
    });

    auto [sum] = stdexec::sync_wait(std::move(sender)).value();
    std::cout << "  Sum: " << sum << std::endl;
    std::cout << std::endl;
}

void demo_broken_contract() {
    std::cout << "--- Demo 3: abandoned writer ---" << std::endl;

    auto [writer, reader] = SingleAssignmentChannel<int>::Create();
    auto sender = execution::AsSender(reader.Share());
    writer = Writer<int>();

    auto [outcome] = stdexec::sync_wait(std::move(sender)).value();
    std::cout << "  Outcome: " << outcome.Error().message() << std::endl;
    std::cout << std::endl;
}

int main() {
    std::cout << "=== handoff Example 04: stdexec Bridge ===" << std::endl;
    std::cout << std::endl;

    demo_then();
    demo_when_all();
    demo_broken_contract();

    std::cout << "=== Done! ===" << std::endl;
    return 0;
}

#else

#include <iostream>

int main() {
    std::cout << "This example requires ENABLE_STDEXEC=ON." << std::endl;
    std::cout << "Rebuild with: cmake -B build -DENABLE_STDEXEC=ON" << std::endl;
    return 1;
}

#endif
