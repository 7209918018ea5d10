// ============================================================================
// handoff/thread/scoped_thread.cpp - ScopedThread Implementation (Linux)
// ============================================================================

#include "handoff/thread/scoped_thread.hpp"

#include "handoff/core/check.hpp"

#include <pthread.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace handoff {

namespace {

constexpr size_t kMaxThreadNameLength = 15;

// Options are best effort: a failed setting is reported once on stderr and
// the body runs regardless.
void ReportOptionFailure(const char* what, int err) {
    std::fprintf(stderr, "[handoff] ScopedThread: %s failed: %s\n", what, std::strerror(err));
}

void NameCurrentThread(const std::string& name) {
    const std::string truncated = name.substr(0, kMaxThreadNameLength);
    if (int err = pthread_setname_np(pthread_self(), truncated.c_str()); err != 0) {
        ReportOptionFailure("pthread_setname_np", err);
    }
}

void PinCurrentThread(const CpuAffinity& affinity) {
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    for (int cpu : affinity.cpus) {
        if (cpu >= 0 && cpu < CPU_SETSIZE) {
            CPU_SET(cpu, &cpuset);
        }
    }
    if (CPU_COUNT(&cpuset) == 0) {
        ReportOptionFailure("cpu_affinity", EINVAL);
        return;
    }
    if (int err = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset); err != 0) {
        ReportOptionFailure("pthread_setaffinity_np", err);
    }
}

void ReniceCurrentThread(int nice_value) {
    nice_value = std::clamp(nice_value, -20, 19);

    // PRIO_PROCESS with a kernel thread id affects only this thread on Linux
    const auto tid = static_cast<id_t>(syscall(SYS_gettid));
    if (setpriority(PRIO_PROCESS, tid, nice_value) != 0) {
        ReportOptionFailure("setpriority", errno);
    }
}

}  // namespace

ScopedThread::~ScopedThread() {
    CancelAndJoin();
}

ScopedThread& ScopedThread::operator=(ScopedThread&& other) noexcept {
    if (this != &other) {
        CancelAndJoin();
        source_ = std::move(other.source_);
        stop_link_ = std::move(other.stop_link_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

void ScopedThread::Join() {
    HANDOFF_CHECK(thread_.joinable(), "Join() on a ScopedThread that is not joinable");
    HANDOFF_CHECK(thread_.get_id() != std::this_thread::get_id(), "Join() called from inside the joined thread");
    thread_.join();
}

void ScopedThread::Detach() {
    HANDOFF_CHECK(thread_.joinable(), "Detach() on a ScopedThread that is not joinable");
    thread_.detach();
}

void ScopedThread::ApplyOptions(const Options& options) {
    if (!options.name.empty()) {
        NameCurrentThread(options.name);
    }
    if (options.cpu_affinity.IsSet()) {
        PinCurrentThread(options.cpu_affinity);
    }
    if (options.nice_value != 0) {
        ReniceCurrentThread(options.nice_value);
    }
}

std::unique_ptr<execution::StopTokenLink> ScopedThread::LinkStopToken(const std::stop_token& st,
                                                                      const CancellationSource& source) {
    if (!st.stop_possible()) {
        return nullptr;
    }
    return std::make_unique<execution::StopTokenLink>(st, source);
}

void ScopedThread::CancelAndJoin() {
    if (!thread_.joinable()) {
        return;
    }
    source_.Cancel();
    thread_.join();
}

}  // namespace handoff
