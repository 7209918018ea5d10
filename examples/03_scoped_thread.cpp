// ============================================================================
// Example 03: Cancellable Scoped Threads
// ============================================================================
//
// A ScopedThread requests cancellation and joins when it goes out of scope.
// Bodies that take a CancellationToken can poll it or sleep on it.
//
// RUN:
//   cd build && ./examples/03_scoped_thread
//
// ============================================================================

#include "handoff/handoff.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stop_token>
#include <thread>

using namespace handoff;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== handoff Example 03: ScopedThread ===" << std::endl;
    std::cout << std::endl;

    // Example 1: destruction cancels a ticking thread
    std::cout << "--- Example 1: Cancel on Scope Exit ---" << std::endl;
    std::atomic<int> ticks{0};
    {
        ScopedThread::Options options;
        options.name = "ticker";

        ScopedThread ticker(options, [&ticks](CancellationToken token) {
            while (!token.WaitForCancellation(10ms)) {
                ticks++;
            }
            std::cout << "  [ticker] cancelled after " << ticks.load() << " ticks" << std::endl;
        });
        std::this_thread::sleep_for(55ms);
    }
    std::cout << std::endl;

    // Example 2: a worker cancelled before it produced anything
    std::cout << "--- Example 2: Cancellation Breaks the Contract ---" << std::endl;
    {
        auto [writer, reader] = SingleAssignmentChannel<int>::Create();
        {
            ScopedThread worker([w = std::move(writer)](CancellationToken token) mutable {
                if (token.WaitForCancellation(10s)) {
                    return;  // w is dropped unsent
                }
                if (auto committed = w.CommitValue(1); committed.IsErr()) {
                    std::cerr << "commit failed: " << committed.Error().message() << std::endl;
                }
            });
            std::cout << "Requesting cancel: " << (worker.RequestCancel() ? "issued" : "already issued")
                      << std::endl;
        }
        std::cout << "Reader: " << reader.Get().Error().message() << std::endl;
    }
    std::cout << std::endl;

    // Example 3: forward cancellation to a std::stop_source
    std::cout << "--- Example 3: stop_token Interop ---" << std::endl;
    {
        std::stop_source ss;
        std::unique_ptr<execution::CancellationLink> link;
        {
            ScopedThread worker([](CancellationToken token) { token.WaitForCancellation(10s); });
            link = execution::LinkCancellation(worker.GetCancellationToken(), ss);
        }
        std::cout << "stop_source stop_requested: " << std::boolalpha << ss.stop_requested() << std::endl;
    }
    std::cout << std::endl;

    // Example 4: an outside std::stop_source shuts a producer down
    std::cout << "--- Example 4: Stopping from a std::stop_source ---" << std::endl;
    {
        std::stop_source shutdown;
        auto [writer, reader] = SingleAssignmentChannel<int>::Create();

        ScopedThread::Options options;
        options.stop_token = shutdown.get_token();
        ScopedThread producer(options, [w = std::move(writer)](CancellationToken token) mutable {
            if (!token.WaitForCancellation(10s)) {
                if (auto committed = w.CommitValue(7); committed.IsErr()) {
                    std::cerr << "commit failed: " << committed.Error().message() << std::endl;
                }
            }
        });

        shutdown.request_stop();
        std::cout << "Reader: " << reader.Get().Error().message() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
