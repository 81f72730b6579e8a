#include "CancellationToken.hpp"
#include <cassert>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

pid_t spawn_group_leader() {
    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        pause();
        _exit(0);
    }
    assert(pid > 0);
    setpgid(pid, pid);
    return pid;
}

}

void test_attach_and_reap() {
    CancellationToken token;
    pid_t pid = spawn_group_leader();

    assert(token.attach(pid));
    assert(token.live_groups() == 1);
    assert(!token.try_reap(pid).has_value());

    assert(token.signal(pid, SIGKILL));
    assert(token.reap(pid) == 128 + SIGKILL);

    // The group stays attached until detached, but has no members left
    assert(token.live_groups() == 1);
    assert(!token.signal(pid, 0));

    // Detached groups are never signalled again
    token.detach(pid);
    assert(token.live_groups() == 0);
    assert(!token.signal(pid, SIGTERM));
    std::cout << "test_attach_and_reap passed.\n";
}

void test_cancel_terminates_groups() {
    CancellationToken token;
    pid_t first = spawn_group_leader();
    pid_t second = spawn_group_leader();
    token.attach(first);
    token.attach(second);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    token.cancel();
    assert(token.is_cancelled());
    assert(token.reap(first) == 128 + SIGTERM);
    assert(token.reap(second) == 128 + SIGTERM);
    token.detach(first);
    token.detach(second);
    assert(token.live_groups() == 0);
    std::cout << "test_cancel_terminates_groups passed.\n";
}

void test_attach_after_cancel() {
    CancellationToken token;
    token.cancel();

    pid_t pid = spawn_group_leader();
    assert(!token.attach(pid));
    assert(token.live_groups() == 1);
    token.signal(pid, SIGKILL);
    token.reap(pid);

    token.detach(pid);
    assert(token.live_groups() == 0);
    std::cout << "test_attach_after_cancel passed.\n";
}

// A grandchild left behind by an exited leader is still cancelled
void test_cancel_reaches_orphaned_group_members() {
    // Orphans come back to this process so their exit status can be checked
    assert(prctl(PR_SET_CHILD_SUBREAPER, 1) == 0);

    int fds[2];
    assert(pipe(fds) == 0);
    pid_t leader = fork();
    if (leader == 0) {
        setpgid(0, 0);
        pid_t grandchild = fork();
        if (grandchild == 0) {
            pause();
            _exit(0);
        }
        ssize_t written = write(fds[1], &grandchild, sizeof(grandchild));
        _exit(written == sizeof(grandchild) ? 0 : 1);
    }
    assert(leader > 0);
    setpgid(leader, leader);
    close(fds[1]);

    CancellationToken token;
    assert(token.attach(leader));

    pid_t grandchild = 0;
    assert(read(fds[0], &grandchild, sizeof(grandchild)) == sizeof(grandchild));
    close(fds[0]);
    assert(token.reap(leader) == 0);
    assert(token.signal(leader, 0));

    token.cancel();
    int status = 0;
    assert(waitpid(grandchild, &status, 0) == grandchild);
    assert(WIFSIGNALED(status) && WTERMSIG(status) == SIGTERM);

    assert(!token.signal(leader, 0));
    token.detach(leader);
    prctl(PR_SET_CHILD_SUBREAPER, 0);
    std::cout << "test_cancel_reaches_orphaned_group_members passed.\n";
}

int main() {
    test_attach_and_reap();
    test_cancel_terminates_groups();
    test_attach_after_cancel();
    test_cancel_reaches_orphaned_group_members();

    std::cout << "All CancellationToken tests passed!\n";
    return 0;
}
