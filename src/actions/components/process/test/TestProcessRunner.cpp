#include "ProcessRunner.hpp"
#include "EngineError.hpp"
#include <cassert>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

RunConfig shell_script(const std::string& script) {
    RunConfig run;
    run.program = "/bin/sh";
    run.argv = {ArgSpec::make_literal("-c"), ArgSpec::make_literal(script)};
    return run;
}

StepResult run_script(const RunConfig& run, std::vector<std::string>* log_lines = nullptr,
                      const WorkflowConfig& config = WorkflowConfig()) {
    CancellationToken token;
    auto command = ProcessRunner::prepare("step", run, Scope(), config);
    return ProcessRunner::run(command, token, [log_lines](const std::string& line) {
        if (log_lines) log_lines->push_back(line);
    });
}

// Script whose leader exits at once, leaving a sleeper that holds stdout open
RunConfig orphan_script(const std::filesystem::path& pid_file) {
    return shell_script("sleep 30 & echo $! > '" + pid_file.string() + "'; exit 0");
}

// Waits for the orphan left by orphan_script; returns the signal that ended it
int reap_orphan(const std::filesystem::path& pid_file) {
    pid_t pid = 0;
    std::ifstream(pid_file) >> pid;
    std::filesystem::remove(pid_file);
    assert(pid > 0);

    int status = 0;
    assert(::waitpid(pid, &status, 0) == pid);
    return WIFSIGNALED(status) ? WTERMSIG(status) : 0;
}

long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

}

void test_capture_streams() {
    std::vector<std::string> log_lines;
    auto result = run_script(shell_script("printf 'a\\nb\\rc'; printf 'err\\n' >&2; exit 3"), &log_lines);

    assert(result.exit_code == 3);
    assert(result.stdout_text == "a\nb\nc");
    assert(result.stderr_text == "err");
    assert(result.duration_ms >= 0);

    bool saw_stdout = false;
    bool saw_stderr = false;
    for (const auto& line : log_lines) {
        if (line == "[stdout] c") saw_stdout = true;
        if (line == "[stderr] err") saw_stderr = true;
    }
    assert(saw_stdout && saw_stderr);
    std::cout << "test_capture_streams passed.\n";
}

void test_inherit_mode_captures_nothing() {
    auto run = shell_script("echo visible");
    run.capture = false;
    auto result = run_script(run);
    assert(result.exit_code == 0);
    assert(result.stdout_text.empty());
    std::cout << "test_inherit_mode_captures_nothing passed.\n";
}

void test_file_mode() {
    auto path = std::filesystem::temp_directory_path() / ("flowrun_out_" + std::to_string(::getpid()) + ".txt");
    {
        std::ofstream stale(path);
        stale << "stale content that must be truncated\n";
    }

    auto run = shell_script("echo first; echo second");
    run.stdout_mode = StreamMode::file(path.string());
    auto result = run_script(run);
    assert(result.exit_code == 0);
    assert(result.stdout_text.empty());

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    assert(content.str() == "first\nsecond\n");
    std::filesystem::remove(path);
    std::cout << "test_file_mode passed.\n";
}

void test_environment_layers() {
    WorkflowConfig config;
    config.app.env = {{"FLOWRUN_A", "app"}, {"FLOWRUN_B", "app"}, {"FLOWRUN_C", "app"}};
    Action action;
    action.key = "demo";
    action.env = {{"FLOWRUN_B", "action"}, {"FLOWRUN_C", "action"}};

    auto run = shell_script("echo $FLOWRUN_A-$FLOWRUN_B-$FLOWRUN_C-$HOME");
    run.env = {{"FLOWRUN_C", "step"}};

    CancellationToken token;
    auto command = ProcessRunner::prepare("env", run, Scope(), config, &action);
    auto result = ProcessRunner::run(command, token, nullptr);
    const char* home = std::getenv("HOME");
    assert(result.stdout_text == std::string("app-action-step-") + (home ? home : ""));
    std::cout << "test_environment_layers passed.\n";
}

void test_workdir_and_shell_mode() {
    RunConfig run;
    run.program = "pwd; echo";
    run.argv = {ArgSpec::make_literal("two words")};
    run.shell = true;
    run.workdir = Value("/");

    auto result = run_script(run);
    assert(result.exit_code == 0);
    assert(result.stdout_text == "/\ntwo words");
    std::cout << "test_workdir_and_shell_mode passed.\n";
}

void test_runtime_override() {
    WorkflowConfig config;
    config.runtime["python"] = RuntimeConfig{Value("/bin/echo")};

    RunConfig run;
    run.program = "python";
    run.argv = {ArgSpec::make_literal("resolved")};

    auto command = ProcessRunner::prepare("rt", run, Scope(), config);
    assert(command.program == "/bin/echo");
    CancellationToken token;
    auto result = ProcessRunner::run(command, token, nullptr);
    assert(result.stdout_text == "resolved");
    std::cout << "test_runtime_override passed.\n";
}

void test_signalled_child_exit_code() {
    auto result = run_script(shell_script("kill -9 $$"));
    assert(result.exit_code == 128 + SIGKILL);
    std::cout << "test_signalled_child_exit_code passed.\n";
}

void test_launch_errors() {
    RunConfig missing;
    missing.program = "/definitely/not/a/program";
    try {
        run_script(missing);
        assert(false && "Should throw on missing program");
    } catch (const ProcessLaunchError& e) {
        assert(e.kind() == ErrorKind::Launch);
        assert(e.step_id() == "step");
    }

    auto bad_dir = shell_script("true");
    bad_dir.workdir = Value("/definitely/not/a/dir");
    try {
        run_script(bad_dir);
        assert(false && "Should throw on missing workdir");
    } catch (const ProcessLaunchError& e) {
        std::string msg = e.what();
        assert(msg.find("working directory") != std::string::npos);
    }
    std::cout << "test_launch_errors passed.\n";
}

void test_timeout() {
    auto run = shell_script("sleep 5");
    run.timeout_ms = 300;
    auto start = std::chrono::steady_clock::now();
    try {
        run_script(run);
        assert(false && "Should time out");
    } catch (const TimeoutError& e) {
        assert(e.kind() == ErrorKind::Timeout);
    }
    assert(elapsed_ms(start) < 2000);
    std::cout << "test_timeout passed.\n";
}

void test_cancellation_terminates_group() {
    CancellationToken token;
    auto command = ProcessRunner::prepare("cancel", shell_script("sleep 10 & sleep 10; wait"), Scope(), WorkflowConfig());

    std::thread stopper([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        ProcessRunner::run(command, token, nullptr);
        assert(false && "Should be cancelled");
    } catch (const CancelledError& e) {
        assert(e.step_id() == "cancel");
    }
    stopper.join();

    // poll interval plus grace period
    assert(elapsed_ms(start) < 200 + 100 + 1000 + 500);
    assert(token.live_groups() == 0);
    std::cout << "test_cancellation_terminates_group passed.\n";
}

void test_cancellation_escalates_to_kill() {
    CancellationToken token;
    auto command = ProcessRunner::prepare("stubborn", shell_script("trap '' TERM; sleep 10"), Scope(), WorkflowConfig());

    std::thread stopper([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        ProcessRunner::run(command, token, nullptr);
        assert(false && "Should be cancelled");
    } catch (const CancelledError&) {
    }
    stopper.join();

    long took = elapsed_ms(start);
    assert(took >= 1000);
    assert(took < 200 + 100 + 1000 + 1000);
    std::cout << "test_cancellation_escalates_to_kill passed.\n";
}

void test_cancellation_after_leader_exit() {
    // Orphaned sleepers are reparented here so their fate can be checked
    assert(::prctl(PR_SET_CHILD_SUBREAPER, 1) == 0);
    auto pid_file = std::filesystem::temp_directory_path() / ("flowrun_orphan_" + std::to_string(::getpid()) + ".pid");

    CancellationToken token;
    auto command = ProcessRunner::prepare("orphan", orphan_script(pid_file), Scope(), WorkflowConfig());

    std::thread stopper([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        ProcessRunner::run(command, token, nullptr);
        assert(false && "Should be cancelled");
    } catch (const CancelledError& e) {
        assert(e.step_id() == "orphan");
    }
    stopper.join();

    assert(elapsed_ms(start) < 500 + 100 + 1000 + 1000);
    assert(token.live_groups() == 0);
    const int signum = reap_orphan(pid_file);
    assert(signum == SIGTERM || signum == SIGKILL);

    ::prctl(PR_SET_CHILD_SUBREAPER, 0);
    std::cout << "test_cancellation_after_leader_exit passed.\n";
}

void test_timeout_after_leader_exit() {
    assert(::prctl(PR_SET_CHILD_SUBREAPER, 1) == 0);
    auto pid_file = std::filesystem::temp_directory_path() / ("flowrun_orphan_" + std::to_string(::getpid()) + ".pid");

    auto run = orphan_script(pid_file);
    run.timeout_ms = 300;
    auto start = std::chrono::steady_clock::now();
    try {
        run_script(run);
        assert(false && "Should time out while the stream is held open");
    } catch (const TimeoutError& e) {
        assert(e.step_id() == "step");
    }
    assert(elapsed_ms(start) < 2000);
    assert(reap_orphan(pid_file) == SIGKILL);

    ::prctl(PR_SET_CHILD_SUBREAPER, 0);
    std::cout << "test_timeout_after_leader_exit passed.\n";
}

void test_cancelled_token_never_spawns() {
    CancellationToken token;
    token.cancel();
    auto command = ProcessRunner::prepare("early", shell_script("exit 0"), Scope(), WorkflowConfig());
    try {
        ProcessRunner::run(command, token, nullptr);
        assert(false && "Should refuse to start");
    } catch (const CancelledError&) {
    }
    std::cout << "test_cancelled_token_never_spawns passed.\n";
}

int main() {
    test_capture_streams();
    test_inherit_mode_captures_nothing();
    test_file_mode();
    test_environment_layers();
    test_workdir_and_shell_mode();
    test_runtime_override();
    test_signalled_child_exit_code();
    test_launch_errors();
    test_timeout();
    test_cancellation_terminates_group();
    test_cancellation_escalates_to_kill();
    test_cancellation_after_leader_exit();
    test_timeout_after_leader_exit();
    test_cancelled_token_never_spawns();

    std::cout << "All tests passed!\n";
    return 0;
}
