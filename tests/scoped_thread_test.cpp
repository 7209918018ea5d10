// ============================================================================
// ScopedThread Tests
// ============================================================================

#include "handoff/thread/scoped_thread.hpp"

#include "handoff/core/channel.hpp"

#include <gtest/gtest.h>
#include <pthread.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace handoff;
using namespace std::chrono_literals;

// ============================================================================
// Lifetime
// ============================================================================

TEST(ScopedThreadTest, DefaultIsNotJoinable) {
    ScopedThread thread;
    EXPECT_FALSE(thread.Joinable());
    EXPECT_EQ(thread.GetId(), std::thread::id());
}

TEST(ScopedThreadTest, DestructorJoins) {
    std::atomic<bool> finished{false};
    {
        ScopedThread thread([&finished] {
            std::this_thread::sleep_for(10ms);
            finished = true;
        });
        EXPECT_TRUE(thread.Joinable());
    }
    EXPECT_TRUE(finished.load());
}

TEST(ScopedThreadTest, DestructorRequestsCancellation) {
    std::atomic<int> iterations{0};
    std::atomic<bool> saw_cancel{false};
    {
        ScopedThread thread([&](CancellationToken token) {
            while (!token.IsCancelled()) {
                iterations++;
                token.WaitForCancellation(1ms);
            }
            saw_cancel = true;
        });
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(saw_cancel.load());
    EXPECT_GT(iterations.load(), 0);
}

TEST(ScopedThreadTest, DestructorCancelsInterruptibleSleep) {
    auto start = std::chrono::steady_clock::now();
    {
        ScopedThread thread([](CancellationToken token) { token.WaitForCancellation(1h); });
    }
    EXPECT_TRUE(std::chrono::steady_clock::now() - start < 30s);
}

TEST(ScopedThreadTest, ExplicitJoin) {
    int value = 0;
    ScopedThread thread([&value] { value = 5; });
    thread.Join();

    EXPECT_FALSE(thread.Joinable());
    EXPECT_EQ(value, 5);
    // Join does not cancel
    EXPECT_FALSE(thread.GetCancellationToken().IsCancelled());
}

// ============================================================================
// Arguments
// ============================================================================

TEST(ScopedThreadTest, ForwardsArguments) {
    std::string seen;
    {
        ScopedThread thread([&seen](int count, std::string text) { seen = std::to_string(count) + text; }, 3,
                            std::string("x"));
    }
    EXPECT_EQ(seen, "3x");
}

TEST(ScopedThreadTest, TokenComesBeforeArguments) {
    std::atomic<bool> token_valid{false};
    std::atomic<int> seen{0};
    {
        ScopedThread thread(
            [&](CancellationToken token, int value) {
                token_valid = token.IsValid();
                seen = value;
            },
            11);
    }
    EXPECT_TRUE(token_valid.load());
    EXPECT_EQ(seen.load(), 11);
}

TEST(ScopedThreadTest, BodyTokenMatchesHandleToken) {
    auto channel = SingleAssignmentChannel<void>::Create();
    ScopedThread thread([w = std::move(channel.writer)](CancellationToken token) mutable {
        token.WaitForCancellation(10s);
        if (token.IsCancelled()) {
            auto committed = w.CommitValue();
            EXPECT_TRUE(committed.IsOk());
        }
    });

    EXPECT_TRUE(thread.RequestCancel());
    EXPECT_TRUE(channel.reader.Get().IsOk());
}

TEST(ScopedThreadTest, MoveOnlyArgument) {
    auto channel = SingleAssignmentChannel<int>::Create();
    {
        ScopedThread thread(
            [](Writer<int> writer) {
                auto committed = writer.CommitValue(99);
                EXPECT_TRUE(committed.IsOk());
            },
            std::move(channel.writer));
    }
    EXPECT_EQ(channel.reader.Get().Value(), 99);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(ScopedThreadTest, RequestCancelOnlyOnce) {
    ScopedThread thread([](CancellationToken token) { token.WaitForCancellation(10s); });

    EXPECT_TRUE(thread.RequestCancel());
    EXPECT_FALSE(thread.RequestCancel());
    EXPECT_TRUE(thread.GetCancellationToken().IsCancelled());
    thread.Join();
}

TEST(ScopedThreadTest, CancellationSourceIsShared) {
    ScopedThread thread([](CancellationToken token) { token.WaitForCancellation(10s); });

    auto token = thread.GetCancellationToken();
    EXPECT_TRUE(thread.GetCancellationSource().Cancel());
    EXPECT_TRUE(token.IsCancelled());
}

// ============================================================================
// Move Semantics
// ============================================================================

TEST(ScopedThreadTest, MoveConstruction) {
    std::atomic<bool> ran{false};
    ScopedThread first([&ran] { ran = true; });
    auto id = first.GetId();

    ScopedThread second = std::move(first);
    EXPECT_FALSE(first.Joinable());
    EXPECT_TRUE(second.Joinable());
    EXPECT_EQ(second.GetId(), id);

    second.Join();
    EXPECT_TRUE(ran.load());
}

TEST(ScopedThreadTest, MoveAssignmentCancelsPrevious) {
    std::atomic<bool> first_cancelled{false};
    std::atomic<bool> second_ran{false};

    ScopedThread target([&first_cancelled](CancellationToken token) {
        token.WaitForCancellation(10s);
        first_cancelled = token.IsCancelled();
    });
    ScopedThread other([&second_ran](CancellationToken token) {
        token.WaitForCancellation(10s);
        second_ran = true;
    });
    auto other_token = other.GetCancellationToken();

    target = std::move(other);
    EXPECT_TRUE(first_cancelled.load());

    // The moved-in thread keeps its own source
    EXPECT_FALSE(other_token.IsCancelled());
    EXPECT_TRUE(target.RequestCancel());
    EXPECT_TRUE(other_token.IsCancelled());
    target.Join();
    EXPECT_TRUE(second_ran.load());
}

TEST(ScopedThreadTest, VectorOfThreads) {
    constexpr int kThreads = 8;
    std::atomic<int> count{0};
    {
        std::vector<ScopedThread> threads;
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&count] { count++; });
        }
    }
    EXPECT_EQ(count.load(), kThreads);
}

// ============================================================================
// Detach
// ============================================================================

TEST(ScopedThreadTest, DetachedThreadKeepsRunning) {
    auto channel = SingleAssignmentChannel<int>::Create();
    ScopedThread thread([w = std::move(channel.writer)]() mutable {
        std::this_thread::sleep_for(5ms);
        auto committed = w.CommitValue(8);
        EXPECT_TRUE(committed.IsOk());
    });
    thread.Detach();
    EXPECT_FALSE(thread.Joinable());

    EXPECT_EQ(channel.reader.Get().Value(), 8);
}

// ============================================================================
// CpuAffinity
// ============================================================================

TEST(CpuAffinityTest, NoneIsNotSet) {
    EXPECT_FALSE(CpuAffinity::None().IsSet());
    EXPECT_FALSE(ScopedThread::Options{}.cpu_affinity.IsSet());
}

TEST(CpuAffinityTest, RangeIsInclusive) {
    auto affinity = CpuAffinity::Range(2, 5);
    EXPECT_EQ(affinity.cpus, (std::vector<int>{2, 3, 4, 5}));
    EXPECT_EQ(CpuAffinity::Range(0, 0).cpus, std::vector<int>{0});
    EXPECT_FALSE(CpuAffinity::Range(3, 1).IsSet());
}

TEST(CpuAffinityTest, SingleCoreAndCores) {
    EXPECT_EQ(CpuAffinity::SingleCore(3).cpus, std::vector<int>{3});
    EXPECT_EQ(CpuAffinity::Cores({0, 4, 7}).cpus, (std::vector<int>{0, 4, 7}));
}

// ============================================================================
// Options
// ============================================================================

namespace {

std::string CurrentThreadName() {
    char name[16] = {};
    EXPECT_EQ(pthread_getname_np(pthread_self(), name, sizeof(name)), 0);
    return name;
}

// Cores the calling thread may run on
std::vector<int> AllowedCores() {
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    EXPECT_EQ(pthread_getaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset), 0);
    std::vector<int> cores;
    for (int cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
        if (CPU_ISSET(cpu, &cpuset)) {
            cores.push_back(cpu);
        }
    }
    return cores;
}

}  // namespace

TEST(ScopedThreadTest, OptionsNameThread) {
    ScopedThread::Options options;
    options.name = "handoff-worker";

    std::string name;
    {
        ScopedThread thread(options, [&name] { name = CurrentThreadName(); });
    }
    EXPECT_EQ(name, "handoff-worker");
}

TEST(ScopedThreadTest, OptionsWithToken) {
    ScopedThread::Options options;
    options.name = "a-rather-long-thread-name";
    options.cpu_affinity = CpuAffinity::None();

    std::string name;
    bool token_valid = false;
    {
        ScopedThread thread(options, [&](CancellationToken token) {
            name = CurrentThreadName();
            token_valid = token.IsValid();
        });
    }
    EXPECT_EQ(name, "a-rather-long-t");
    EXPECT_TRUE(token_valid);
}

TEST(ScopedThreadTest, OptionsPinToCore) {
    const int core = sched_getcpu();
    ASSERT_GE(core, 0);

    ScopedThread::Options options;
    options.cpu_affinity = CpuAffinity::SingleCore(core);

    std::vector<int> allowed;
    int observed = -1;
    {
        ScopedThread thread(options, [&] {
            allowed = AllowedCores();
            observed = sched_getcpu();
        });
    }
    EXPECT_EQ(allowed, std::vector<int>{core});
    EXPECT_EQ(observed, core);
}

TEST(ScopedThreadTest, OptionsPinToSeveralCores) {
    const auto usable = AllowedCores();
    if (usable.size() < 2) {
        GTEST_SKIP() << "Need at least 2 usable CPUs";
    }

    ScopedThread::Options options;
    options.cpu_affinity = CpuAffinity::Cores({usable[0], usable[1]});

    std::vector<int> allowed;
    {
        ScopedThread thread(options, [&allowed] { allowed = AllowedCores(); });
    }
    EXPECT_EQ(allowed, (std::vector<int>{usable[0], usable[1]}));
}

TEST(ScopedThreadTest, UnusableOptionsStillRunBody) {
    ScopedThread::Options options;
    options.cpu_affinity = CpuAffinity::SingleCore(-1);
    options.nice_value = -20;  // needs CAP_SYS_NICE; may be refused

    std::vector<int> before = AllowedCores();
    std::vector<int> inside;
    bool ran = false;
    {
        ScopedThread thread(options, [&] {
            inside = AllowedCores();
            ran = true;
        });
    }
    EXPECT_TRUE(ran);
    EXPECT_EQ(inside, before);
}

TEST(ScopedThreadTest, OptionsRaiseNice) {
    ScopedThread::Options options;
    options.nice_value = 1000;  // clamped to 19

    int observed = 0;
    {
        ScopedThread thread(options, [&observed] {
            observed = getpriority(PRIO_PROCESS, static_cast<id_t>(syscall(SYS_gettid)));
        });
    }
    EXPECT_EQ(observed, 19);
}

// ============================================================================
// External stop_token
// ============================================================================

TEST(ScopedThreadTest, StopTokenCancelsThread) {
    std::stop_source shutdown;
    ScopedThread::Options options;
    options.stop_token = shutdown.get_token();

    std::atomic<bool> woke{false};
    ScopedThread thread(options, [&woke](CancellationToken token) { woke = token.WaitForCancellation(30s); });

    std::this_thread::sleep_for(5ms);
    EXPECT_FALSE(thread.GetCancellationSource().IsCancelled());

    shutdown.request_stop();
    thread.Join();

    EXPECT_TRUE(woke.load());
    EXPECT_TRUE(thread.GetCancellationSource().IsCancelled());
}

TEST(ScopedThreadTest, AlreadyStoppedTokenStartsCancelled) {
    std::stop_source shutdown;
    shutdown.request_stop();

    ScopedThread::Options options;
    options.stop_token = shutdown.get_token();

    bool cancelled_at_start = false;
    {
        ScopedThread thread(options, [&](CancellationToken token) { cancelled_at_start = token.IsCancelled(); });
    }
    EXPECT_TRUE(cancelled_at_start);
}

TEST(ScopedThreadTest, StopTokenFollowsMovedThread) {
    std::stop_source shutdown;
    ScopedThread::Options options;
    options.stop_token = shutdown.get_token();

    auto [writer, reader] = SingleAssignmentChannel<int>::Create();
    ScopedThread moved;
    {
        ScopedThread original(options, [w = std::move(writer)](CancellationToken token) mutable {
            token.WaitForCancellation(30s);
            // returns without committing: the reader sees BrokenContract
        });
        moved = std::move(original);
    }

    shutdown.request_stop();
    EXPECT_EQ(reader.Get().Error(), Errc::BrokenContract);
}

TEST(ScopedThreadTest, StopTokenIgnoredAfterDestruction) {
    std::stop_source shutdown;
    ScopedThread::Options options;
    options.stop_token = shutdown.get_token();
    {
        ScopedThread thread(options, [] {});
    }
    EXPECT_TRUE(shutdown.request_stop());
}

// ============================================================================
// Misuse
// ============================================================================

TEST(ScopedThreadDeathTest, JoinWithoutThreadAborts) {
    ScopedThread thread;
    EXPECT_DEATH(thread.Join(), "not joinable");
}

TEST(ScopedThreadDeathTest, JoinFromOwnThreadAborts) {
    EXPECT_DEATH(
        {
            ScopedThread* self = nullptr;
            std::atomic<bool> ready{false};
            ScopedThread thread([&] {
                while (!ready.load()) {
                    std::this_thread::yield();
                }
                self->Join();
            });
            self = &thread;
            ready = true;
            std::this_thread::sleep_for(10s);
        },
        "inside the joined thread");
}
