#include "SignalManager.hpp"
#include <cassert>
#include <iostream>
#include <atomic>
#include <csignal>
#include <signal.h>
#include <thread>
#include <chrono>
#include <unistd.h>

std::atomic<int> callback_count{0};
std::atomic<int> last_signal{0};

void test_normal_callback(int signum) {
    callback_count++;
    last_signal = signum;
}

void wait_for_count(int expected) {
    for (int i = 0; i < 50 && callback_count < expected; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void test_signal_manager_basic() {
    callback_count = 0;

    SignalManager::register_signal(SIGUSR1, test_normal_callback);
    SignalManager::register_signal(SIGUSR1, [](int){ callback_count++; });
    SignalManager::setup();

    kill(getpid(), SIGUSR1);
    wait_for_count(2);

    assert(callback_count == 2);
    assert(last_signal == SIGUSR1);
    SignalManager::teardown();
    std::cout << "test_signal_manager_basic passed" << std::endl;
}

void test_signal_manager_order() {
    callback_count = 0;

    SignalManager::register_signal(SIGUSR2, [] (int) { callback_count += 10; });
    SignalManager::register_signal(SIGUSR2, [] (int) { callback_count = callback_count * 2; });
    SignalManager::setup();

    kill(getpid(), SIGUSR2);
    wait_for_count(20);

    assert(callback_count == 20);
    SignalManager::teardown();
    std::cout << "test_signal_manager_order passed" << std::endl;
}

void test_teardown_restores_mask() {
    SignalManager::teardown();

    sigset_t current;
    pthread_sigmask(SIG_BLOCK, nullptr, &current);
    assert(!sigismember(&current, SIGUSR1));
    assert(!sigismember(&current, SIGUSR2));
    std::cout << "test_teardown_restores_mask passed" << std::endl;
}

int main() {
    test_signal_manager_basic();
    test_signal_manager_order();
    test_teardown_restores_mask();

    std::cout << "All SignalManager tests passed!" << std::endl;
    return 0;
}
