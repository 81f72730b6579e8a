#include "RunRegistry.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>

void test_acquire_and_release() {
    RunRegistry registry;
    auto first = registry.acquire("build");
    auto second = registry.acquire("build");
    assert(registry.active_runs("build") == 2);
    assert(registry.active_runs("deploy") == 0);

    registry.release("build", first);
    assert(registry.active_runs("build") == 1);
    registry.release("build", second);
    assert(registry.active_runs("build") == 0);
    assert(registry.active_actions().empty());

    // Releasing twice is harmless
    registry.release("build", second);
    std::cout << "test_acquire_and_release passed.\n";
}

void test_stop_cancels_every_run() {
    RunRegistry registry;
    auto first = registry.acquire("build");
    auto second = registry.acquire("build");
    auto other = registry.acquire("deploy");

    registry.stop("build");
    assert(first->is_cancelled());
    assert(second->is_cancelled());
    assert(!other->is_cancelled());
    assert(registry.is_cancelled("build"));
    assert(!registry.is_cancelled("deploy"));

    // Runs joining while the stop is pending start cancelled
    auto late = registry.acquire("build");
    assert(late->is_cancelled());

    // Recovery runs ignore the pending stop
    auto recovery = registry.acquire("build", false);
    assert(!recovery->is_cancelled());

    for (const auto& token : {first, second, late, recovery}) {
        registry.release("build", token);
    }
    assert(!registry.is_cancelled("build"));

    // The stop flag does not outlive the runs it was aimed at
    auto fresh = registry.acquire("build");
    assert(!fresh->is_cancelled());
    registry.release("build", fresh);
    registry.release("deploy", other);
    std::cout << "test_stop_cancels_every_run passed.\n";
}

void test_stop_idle_action() {
    RunRegistry registry;
    registry.stop("nothing");
    assert(!registry.is_cancelled("nothing"));
    auto token = registry.acquire("nothing");
    assert(!token->is_cancelled());
    registry.release("nothing", token);
    std::cout << "test_stop_idle_action passed.\n";
}

void test_stop_all() {
    RunRegistry registry;
    auto a = registry.acquire("a");
    auto b = registry.acquire("b");
    auto ids = registry.active_actions();
    assert(ids.size() == 2);
    assert(std::find(ids.begin(), ids.end(), "a") != ids.end());

    registry.stop_all();
    assert(a->is_cancelled() && b->is_cancelled());
    registry.release("a", a);
    registry.release("b", b);
    std::cout << "test_stop_all passed.\n";
}

int main() {
    test_acquire_and_release();
    test_stop_cancels_every_run();
    test_stop_idle_action();
    test_stop_all();

    std::cout << "All RunRegistry tests passed!\n";
    return 0;
}
