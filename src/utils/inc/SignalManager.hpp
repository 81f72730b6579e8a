#pragma once
#include <functional>
#include <csignal>

// Signals registered here are blocked in every thread and consumed by one watcher
// thread through sigwait, so callbacks run in normal thread context and may lock.
namespace SignalManager {

using SignalCallback = std::function<void(int)>;

void register_signal(int signum, SignalCallback cb);

// Must run before any other thread is started so the blocked mask is inherited
void setup();

// Stops the watcher thread and restores the previous signal mask of the caller
void teardown();

}
