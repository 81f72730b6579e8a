#include "SignalManager.hpp"
#include "LogUtils.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <pthread.h>

namespace SignalManager {

static std::map<int, std::vector<SignalCallback>> callbacks;
static std::mutex cb_mutex;
static std::thread watcher;
static std::atomic<bool> stopping{false};
static sigset_t watched_set;
static sigset_t previous_mask;
static bool active = false;

static void dispatch(int signum) {
    std::vector<SignalCallback> targets;
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        auto it = callbacks.find(signum);
        if (it != callbacks.end()) {
            targets = it->second;
        }
    }
    for (auto& cb : targets) {
        cb(signum);
    }
}

static void watch_loop() {
    while (true) {
        int signum = 0;
        if (sigwait(&watched_set, &signum) != 0) {
            continue;
        }
        if (stopping.load()) {
            return;
        }
        LogUtils::debug("Signal {} received", signum);
        dispatch(signum);
    }
}

void register_signal(int signum, SignalCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    callbacks[signum].push_back(std::move(cb));
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (active || callbacks.empty()) {
        return;
    }

    sigemptyset(&watched_set);
    for (const auto& kv : callbacks) {
        sigaddset(&watched_set, kv.first);
    }
    if (pthread_sigmask(SIG_BLOCK, &watched_set, &previous_mask) != 0) {
        throw std::runtime_error("SignalManager: pthread_sigmask failed");
    }

    stopping.store(false);
    watcher = std::thread(watch_loop);
    active = true;
}

void teardown() {
    int wake_signal = 0;
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        if (!active) {
            return;
        }
        wake_signal = callbacks.begin()->first;
        active = false;
    }

    stopping.store(true);
    pthread_kill(watcher.native_handle(), wake_signal);
    watcher.join();
    pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
}

}
