#include "CancellationToken.hpp"
#include "LogUtils.hpp"
#include "ProcessUtils.hpp"
#include <csignal>

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
    for (pid_t pgid : groups_) {
        LogUtils::debug("Sending SIGTERM to process group {}", pgid);
        ProcessUtils::signal_group(pgid, SIGTERM);
    }
}

bool CancellationToken::attach(pid_t pgid) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.insert(pgid);
    return !cancelled_.load();
}

void CancellationToken::detach(pid_t pgid) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.erase(pgid);
}

bool CancellationToken::signal(pid_t pgid, int signum) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.count(pgid) == 0) {
        return false;
    }
    return ProcessUtils::signal_group(pgid, signum);
}

std::optional<int> CancellationToken::try_reap(pid_t pgid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ProcessUtils::try_wait(pgid);
}

int CancellationToken::reap(pid_t pgid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ProcessUtils::wait_blocking(pgid);
}

size_t CancellationToken::live_groups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}
