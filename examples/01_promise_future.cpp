// ============================================================================
// Example 01: Handing a Result Across Threads
// ============================================================================
//
// A producer thread computes a value and commits it through a Writer; the
// main thread blocks on the matching Reader. Also shows what a reader sees
// when the producer fails or gives up.
//
// RUN:
//   cd build && ./examples/01_promise_future
//
// ============================================================================

#include "handoff/handoff.hpp"

#include <chrono>
#include <iostream>
#include <system_error>
#include <thread>

using namespace handoff;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== handoff Example 01: Writer / Reader ===" << std::endl;
    std::cout << std::endl;

    // Example 1: value committed by another thread
    std::cout << "--- Example 1: Cross-Thread Value ---" << std::endl;
    {
        auto [writer, reader] = SingleAssignmentChannel<int>::Create();

        ScopedThread producer([w = std::move(writer)]() mutable {
            std::this_thread::sleep_for(50ms);
            if (auto committed = w.CommitValue(42); committed.IsErr()) {
                std::cerr << "commit failed: " << committed.Error().message() << std::endl;
            }
        });

        std::cout << "Waiting for the producer..." << std::endl;
        auto result = reader.Get();
        if (result.IsOk()) {
            std::cout << "Result: " << result.Value() << std::endl;
        }

        // The value has been moved out; a second Get reports it
        std::cout << "Second Get: " << reader.Get().Error().message() << std::endl;
    }
    std::cout << std::endl;

    // Example 2: the producer reports an error instead of a value
    std::cout << "--- Example 2: Committed Error ---" << std::endl;
    {
        auto [writer, reader] = SingleAssignmentChannel<std::string>::Create();
        ScopedThread producer([w = std::move(writer)]() mutable {
            auto committed = w.CommitError(std::make_error_code(std::errc::host_unreachable));
            if (committed.IsErr()) {
                std::cerr << "commit failed: " << committed.Error().message() << std::endl;
            }
        });

        auto result = reader.Get();
        std::cout << "Error: " << result.Error().message() << std::endl;
    }
    std::cout << std::endl;

    // Example 3: the producer returns without committing
    std::cout << "--- Example 3: Broken Contract ---" << std::endl;
    {
        auto [writer, reader] = SingleAssignmentChannel<int>::Create();
        ScopedThread producer([w = std::move(writer)]() mutable {
            std::this_thread::sleep_for(10ms);
            // w goes out of scope here
        });

        auto result = reader.Get();
        if (result.IsErr() && result.Error() == Errc::BrokenContract) {
            std::cout << "Reader woke up: " << result.Error().message() << std::endl;
        }
    }
    std::cout << std::endl;

    // Example 4: bounded waiting
    std::cout << "--- Example 4: Timed Wait ---" << std::endl;
    {
        auto [writer, reader] = SingleAssignmentChannel<void>::Create();

        auto status = reader.WaitFor(20ms);
        std::cout << "Before commit: " << (status.Value() == WaitStatus::Ready ? "ready" : "timed out")
                  << std::endl;

        if (auto committed = writer.CommitValue(); committed.IsErr()) {
            std::cerr << "commit failed: " << committed.Error().message() << std::endl;
        }
        status = reader.WaitFor(20ms);
        std::cout << "After commit: " << (status.Value() == WaitStatus::Ready ? "ready" : "timed out")
                  << std::endl;
    }
    std::cout << std::endl;

    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
