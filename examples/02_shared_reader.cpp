// ============================================================================
// Example 02: Broadcasting One Result to Many Threads
// ============================================================================
//
// Reader::Share() turns the single-use reader into a copyable SharedReader.
// Every copy observes the same committed outcome, any number of times.
//
// RUN:
//   cd build && ./examples/02_shared_reader
//
// ============================================================================

#include "handoff/handoff.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace handoff;
using namespace std::chrono_literals;

namespace {

std::mutex g_print_mutex;

void Print(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_print_mutex);
    std::cout << line << std::endl;
}

}  // namespace

int main() {
    std::cout << "=== handoff Example 02: SharedReader ===" << std::endl;
    std::cout << std::endl;

    auto [writer, reader] = SingleAssignmentChannel<std::string>::Create();
    auto config = reader.Share();

    // The original reader is spent after Share()
    std::cout << "Original reader: " << reader.Get().Error().message() << std::endl;

    auto registered = config.OnReady([] { Print("  [OnReady] configuration published"); });
    if (registered.IsErr()) {
        std::cerr << "OnReady failed: " << registered.Error().message() << std::endl;
        return 1;
    }

    {
        std::vector<ScopedThread> workers;
        for (int i = 0; i < 4; ++i) {
            ScopedThread::Options options;
            options.name = "worker-" + std::to_string(i);
            workers.emplace_back(options, [i, config] {
                auto result = config.Get();
                if (result.IsOk()) {
                    Print("  [worker " + std::to_string(i) + "] got \"" + result.Value() + "\"");
                }
            });
        }

        std::this_thread::sleep_for(20ms);
        Print("Publishing configuration...");
        if (auto committed = writer.CommitValue("mode=fast"); committed.IsErr()) {
            std::cerr << "commit failed: " << committed.Error().message() << std::endl;
        }
    }

    // Late readers still see the value
    std::cout << "Late read: " << config.Get().Value() << std::endl;
    std::cout << std::endl;

    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
