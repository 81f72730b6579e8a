#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <set>
#include <sys/types.h>

// Cancellation state of one pipeline invocation plus the process groups it has alive.
// A group stays attached after its leader is reaped, until the caller has drained its
// output, so cancel() still reaches grandchildren. Signalling, reaping and detaching
// share one lock; a detached group is never signalled.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    bool is_cancelled() const { return cancelled_.load(); }

    // Marks the token cancelled and sends SIGTERM to every live group
    void cancel();

    // Registers a freshly spawned group leader; returns false when the token is
    // already cancelled so the caller can tear the child down at once
    bool attach(pid_t pgid);
    void detach(pid_t pgid);

    // Signals the group only while it is attached; signal 0 probes for live members
    bool signal(pid_t pgid, int signum);

    // Non-blocking reap of the group leader; the group stays attached
    std::optional<int> try_reap(pid_t pgid);
    int reap(pid_t pgid);

    size_t live_groups() const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::set<pid_t> groups_;
};
