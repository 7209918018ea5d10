// ============================================================================
// handoff/thread/scoped_thread.hpp - Auto-Joining, Cancellable Thread
// ============================================================================
//
// ScopedThread owns a std::thread plus a CancellationSource. Destroying it
// (or move-assigning over it) while the thread still runs first requests
// cancellation, then joins. A ScopedThread therefore never outlives its
// scope by accident, and never terminates the process the way an unjoined
// std::thread does.
//
// If the body accepts a CancellationToken as its first parameter, it
// receives the token of this thread's source and is expected to poll it.
// Cancellation is cooperative: a body that ignores its token is simply
// joined once it returns.
//
// USAGE:
// ------
//   auto [writer, reader] = SingleAssignmentChannel<int>::Create();
//
//   ScopedThread producer([w = std::move(writer)](CancellationToken token) mutable {
//       while (!token.IsCancelled()) {
//           if (auto v = TryCompute()) {
//               auto committed = w.CommitValue(*v);
//               return;
//           }
//       }
//       // returning without a commit hands readers Errc::BrokenContract
//   });
//
//   ScopedThread::Options opts;
//   opts.name = "ticker";
//   opts.cpu_affinity = CpuAffinity::SingleCore(1);
//   ScopedThread ticker(opts, [](CancellationToken token) {
//       while (!token.WaitForCancellation(100ms)) Tick();
//   });
//
//   // Also stopped by an outside std::stop_source
//   opts.stop_token = shutdown.get_token();
//
// ============================================================================

#pragma once

#include "handoff/core/cancellation.hpp"
#include "handoff/execution/stop_token_adapter.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace handoff {

// ============================================================================
// CpuAffinity - CPU Core Binding
// ============================================================================
struct CpuAffinity {
    std::vector<int> cpus;

    // No restriction: the thread may run on any core.
    static CpuAffinity None() { return CpuAffinity{}; }

    static CpuAffinity SingleCore(int cpu) { return CpuAffinity{{cpu}}; }

    // Inclusive range [first, last]
    static CpuAffinity Range(int first, int last) {
        CpuAffinity affinity;
        for (int cpu = first; cpu <= last; ++cpu) {
            affinity.cpus.push_back(cpu);
        }
        return affinity;
    }

    static CpuAffinity Cores(std::vector<int> cores) { return CpuAffinity{std::move(cores)}; }

    bool IsSet() const { return !cpus.empty(); }
};

class ScopedThread {
   public:
    // ========================================================================
    // Options
    // ========================================================================
    // Applied on the new thread before the body runs, best effort: a thread
    // that cannot be renamed, pinned or reprioritized still runs the body.
    struct Options {
        // Empty keeps the name inherited from the creating thread. Linux
        // keeps the first 15 characters.
        std::string name;

        // Cores outside [0, CPU_SETSIZE) are ignored
        CpuAffinity cpu_affinity;

        // 0 leaves the inherited nice value alone; others are clamped to
        // [-20, 19]. Negative values need CAP_SYS_NICE.
        int nice_value = 0;

        // A stop request on this token cancels the thread, exactly like
        // RequestCancel(). Already stopped: the body starts cancelled.
        std::stop_token stop_token;

        Options() = default;
    };

    // ========================================================================
    // Construction
    // ========================================================================

    // Not associated with any thread.
    ScopedThread() = default;

    template <typename F, typename... Args>
        requires(!std::same_as<std::remove_cvref_t<F>, ScopedThread> &&
                 !std::same_as<std::remove_cvref_t<F>, Options>)
    explicit ScopedThread(F&& func, Args&&... args)
        : ScopedThread(Options{}, std::forward<F>(func), std::forward<Args>(args)...) {}

    template <typename F, typename... Args>
    ScopedThread(const Options& options, F&& func, Args&&... args)
        : stop_link_(LinkStopToken(options.stop_token, source_)),
          thread_(&ScopedThread::Run<std::decay_t<F>, std::decay_t<Args>...>, options, source_.GetToken(),
                  std::forward<F>(func), std::forward<Args>(args)...) {}

    // Requests cancellation and joins if still joinable.
    ~ScopedThread();

    ScopedThread(const ScopedThread&) = delete;
    ScopedThread& operator=(const ScopedThread&) = delete;

    ScopedThread(ScopedThread&&) noexcept = default;
    ScopedThread& operator=(ScopedThread&& other) noexcept;

    // ========================================================================
    // Thread Control
    // ========================================================================

    bool Joinable() const noexcept { return thread_.joinable(); }

    // Aborts via HANDOFF_CHECK when not joinable or called from the thread
    // itself (which would deadlock).
    void Join();

    // The cancellation source stays usable after detaching.
    void Detach();

    // Returns true only for the call that issued the request.
    bool RequestCancel() { return source_.Cancel(); }

    [[nodiscard]] CancellationToken GetCancellationToken() const { return source_.GetToken(); }

    CancellationSource& GetCancellationSource() noexcept { return source_; }

    std::thread::id GetId() const noexcept { return thread_.get_id(); }

   private:
    static void ApplyOptions(const Options& options);

    static std::unique_ptr<execution::StopTokenLink> LinkStopToken(const std::stop_token& st,
                                                                   const CancellationSource& source);

    template <typename F, typename... Args>
    static void Run(Options options, CancellationToken token, F func, Args... args) {
        ApplyOptions(options);
        if constexpr (std::is_invocable_v<F, CancellationToken, Args...>) {
            std::invoke(std::move(func), std::move(token), std::move(args)...);
        } else {
            std::invoke(std::move(func), std::move(args)...);
        }
    }

    void CancelAndJoin();

    // Declared before thread_: the thread is started with one of its tokens,
    // possibly already cancelled through stop_link_.
    CancellationSource source_;
    std::unique_ptr<execution::StopTokenLink> stop_link_;
    std::thread thread_;
};

}  // namespace handoff
