#include "ProcessRunner.hpp"
#include "ArgvBuilder.hpp"
#include "EngineError.hpp"
#include "LineSplitter.hpp"
#include "LogUtils.hpp"
#include "ProcessUtils.hpp"
#include "StringUtils.hpp"
#include "TemplateRenderer.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <fmt/format.h>

extern char** environ;

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Pipe make_pipe(const std::string& step_id) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ProcessLaunchError(fmt::format("Failed to create pipe: {}", std::strerror(errno)), step_id);
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

// Written by the child when it cannot reach exec
struct LaunchFailure {
    int stage = 0;   // 1 = chdir, 2 = exec
    int error = 0;
};

// Drains one captured stream on its own thread
class StreamReader {
public:
    StreamReader(const char* name, FileDescriptor fd, std::mutex& log_mutex,
                 const RunLogger& log, const std::atomic<bool>& abandon)
        : name_(name), fd_(std::move(fd)), log_mutex_(log_mutex), log_(log), abandon_(abandon) {}

    ~StreamReader() { join(); }

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    void start() {
        thread_ = std::thread([this] { drain(); });
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool finished() const { return finished_.load(); }

    std::string text() const { return StringUtils::join(lines_, "\n"); }

private:
    void drain() {
        char buffer[4096];
        while (!abandon_.load()) {
            pollfd pfd{fd_.get(), POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(ProcessRunner::poll_interval.count()));
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t n = ::read(fd_.get(), buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) {
                break;
            }
            for (auto& line : splitter_.feed(buffer, static_cast<size_t>(n))) {
                emit(std::move(line));
            }
        }

        std::string rest = splitter_.finish();
        if (!rest.empty()) {
            emit(std::move(rest));
        }
        finished_.store(true);
    }

    void emit(std::string line) {
        if (log_) {
            std::lock_guard<std::mutex> lock(log_mutex_);
            try {
                log_(fmt::format("[{}] {}", name_, line));
            } catch (const std::exception& e) {
                LogUtils::warn("Run logger failed on {} line: {}", name_, e.what());
            }
        }
        lines_.push_back(std::move(line));
    }

    const char* name_;
    FileDescriptor fd_;
    std::mutex& log_mutex_;
    const RunLogger& log_;
    const std::atomic<bool>& abandon_;
    LineSplitter splitter_;
    std::vector<std::string> lines_;
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

std::vector<std::string> PreparedCommand::exec_argv() const {
    if (shell) {
        std::string line = program;
        for (const auto& arg : args) {
            line += " " + StringUtils::shell_quote(arg);
        }
        return {"/bin/sh", "-c", line};
    }

    std::vector<std::string> argv{program};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::string PreparedCommand::command_line() const {
    std::string line = shell ? program : StringUtils::shell_quote(program);
    for (const auto& arg : args) {
        line += " " + StringUtils::shell_quote(arg);
    }
    return line;
}

std::string ProcessRunner::resolve_program(const std::string& program, const Scope& scope, const WorkflowConfig& config) {
    auto it = config.runtime.find(program);
    if (it == config.runtime.end() || it->second.executable.is_null()) {
        return program;
    }
    std::string executable = TemplateRenderer::render_string(it->second.executable, scope);
    return executable.empty() ? program : executable;
}

PreparedCommand ProcessRunner::prepare(const std::string& step_id,
                                       const RunConfig& run,
                                       const Scope& scope,
                                       const WorkflowConfig& config,
                                       const Action* action) {
    PreparedCommand command;
    command.step_id = step_id;

    const std::string program = TemplateRenderer::render_string(run.program, scope);
    if (StringUtils::trimmed(program).empty()) {
        throw ConfigError("run.program is required", step_id);
    }
    command.program = resolve_program(program, scope, config);
    command.args = ArgvBuilder::build(run.argv, scope);

    const auto& workdir = run.workdir ? run.workdir : config.app.workdir;
    if (workdir) {
        std::string dir = TemplateRenderer::render_string(*workdir, scope);
        if (!dir.empty()) {
            command.workdir = dir;
        }
    }

    command.shell = run.shell.value_or(config.app.shell);

    // process env <- app.env <- action env <- step env
    command.env = ProcessUtils::current_environment();
    for (const auto& [key, value] : config.app.env) {
        command.env[key] = TemplateRenderer::render_string(value, scope);
    }
    if (action) {
        for (const auto& [key, value] : action->env) {
            command.env[key] = TemplateRenderer::render_string(value, scope);
        }
    }
    for (const auto& [key, value] : run.env) {
        command.env[key] = TemplateRenderer::render_string(value, scope);
    }

    auto render_mode = [&](StreamMode mode, const char* stream) {
        if (mode.kind == StreamMode::Kind::File) {
            mode.path = TemplateRenderer::render_string(mode.path, scope);
            if (mode.path.empty()) {
                throw ConfigError(fmt::format("{} file path rendered empty", stream), step_id);
            }
        }
        return mode;
    };
    command.stdout_mode = render_mode(run.effective_stdout(), "stdout");
    command.stderr_mode = render_mode(run.effective_stderr(), "stderr");
    command.timeout_ms = run.timeout_ms;
    return command;
}

StepResult ProcessRunner::run(const PreparedCommand& command, CancellationToken& token, const RunLogger& log) {
    const std::string& step_id = command.step_id;
    if (token.is_cancelled()) {
        throw CancelledError(step_id);
    }

    // Everything the child needs is built before fork
    std::vector<std::string> argv_strings = command.exec_argv();
    std::vector<char*> argv = to_c_array(argv_strings);

    std::vector<std::string> env_strings;
    env_strings.reserve(command.env.size());
    for (const auto& [key, value] : command.env) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp = to_c_array(env_strings);

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    FileDescriptor stdout_file;
    FileDescriptor stderr_file;

    auto open_stream = [&](const StreamMode& mode, Pipe& pipe, FileDescriptor& file) -> int {
        switch (mode.kind) {
            case StreamMode::Kind::Capture:
                pipe = make_pipe(step_id);
                return pipe.write_end.get();
            case StreamMode::Kind::File:
                file = FileDescriptor(::open(mode.path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
                if (!file) {
                    throw ProcessLaunchError(fmt::format("Cannot open output file '{}': {}",
                                                         mode.path, std::strerror(errno)), step_id);
                }
                return file.get();
            case StreamMode::Kind::Inherit:
                break;
        }
        return -1;
    };

    const int child_stdout = open_stream(command.stdout_mode, stdout_pipe, stdout_file);
    const int child_stderr = open_stream(command.stderr_mode, stderr_pipe, stderr_file);
    FileDescriptor dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    Pipe status = make_pipe(step_id);
    const char* workdir = command.workdir ? command.workdir->c_str() : nullptr;

    const auto start = std::chrono::steady_clock::now();
    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessLaunchError(fmt::format("fork failed: {}", std::strerror(errno)), step_id);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setsid();
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        if (dev_null) ::dup2(dev_null.get(), STDIN_FILENO);
        if (child_stdout >= 0) ::dup2(child_stdout, STDOUT_FILENO);
        if (child_stderr >= 0) ::dup2(child_stderr, STDERR_FILENO);

        LaunchFailure failure;
        if (workdir != nullptr && ::chdir(workdir) != 0) {
            failure.stage = 1;
            failure.error = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            failure.stage = 2;
            failure.error = errno;
        }
        ssize_t ignored = ::write(status.write_end.get(), &failure, sizeof(failure));
        (void)ignored;
        ::_exit(127);
    }

    // Parent keeps only the read ends
    status.write_end.reset();
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    stdout_file.reset();
    stderr_file.reset();

    LaunchFailure failure;
    ssize_t got;
    do {
        got = ::read(status.read_end.get(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        try {
            ProcessUtils::wait_blocking(pid);
        } catch (const std::runtime_error& e) {
            LogUtils::warn("Step {}: {}", step_id, e.what());
        }
        if (failure.stage == 1) {
            throw ProcessLaunchError(fmt::format("Cannot change to working directory '{}': {}",
                                                 command.workdir.value_or(""), std::strerror(failure.error)), step_id);
        }
        throw ProcessLaunchError(fmt::format("Failed to start '{}': {}",
                                             argv_strings.front(), std::strerror(failure.error)), step_id);
    }
    status.read_end.reset();

    // The child leads its own session, so its pid is the process group id
    const pid_t pgid = pid;
    const bool attached = token.attach(pgid);
    LogUtils::debug("Step {} spawned pid {}", step_id, pid);

    std::atomic<bool> abandon{false};
    std::mutex log_mutex;
    std::unique_ptr<StreamReader> stdout_reader;
    std::unique_ptr<StreamReader> stderr_reader;
    if (stdout_pipe.read_end) {
        stdout_reader = std::make_unique<StreamReader>("stdout", std::move(stdout_pipe.read_end), log_mutex, log, abandon);
        stdout_reader->start();
    }
    if (stderr_pipe.read_end) {
        stderr_reader = std::make_unique<StreamReader>("stderr", std::move(stderr_pipe.read_end), log_mutex, log, abandon);
        stderr_reader->start();
    }

    auto stop_readers = [&]() {
        abandon.store(true);
        if (stdout_reader) stdout_reader->join();
        if (stderr_reader) stderr_reader->join();
    };

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (command.timeout_ms > 0) {
        deadline = start + std::chrono::milliseconds(command.timeout_ms);
    }
    auto past_deadline = [&]() {
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    };
    auto readers_finished = [&]() {
        return (!stdout_reader || stdout_reader->finished()) && (!stderr_reader || stderr_reader->finished());
    };

    enum class Outcome { Exited, Cancelled, TimedOut };
    Outcome outcome = Outcome::Exited;
    std::optional<int> exit_code;

    // Takes the whole group down, grandchildren included; the leader is reaped
    // if it is still running. A graceful stop allows terminate_grace after SIGTERM.
    auto terminate_group = [&](bool graceful) {
        if (graceful) {
            LogUtils::debug("Terminating process group {} of step {}", pgid, step_id);
            token.signal(pgid, SIGTERM);
            const auto grace_end = std::chrono::steady_clock::now() + terminate_grace;
            while (std::chrono::steady_clock::now() < grace_end) {
                if (!exit_code) exit_code = token.try_reap(pgid);
                if (exit_code && !token.signal(pgid, 0)) {
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
        LogUtils::debug("Killing process group {} of step {}", pgid, step_id);
        token.signal(pgid, SIGKILL);
        if (!exit_code) exit_code = token.reap(pgid);
    };

    try {
        while (true) {
            if (!attached || token.is_cancelled()) {
                outcome = Outcome::Cancelled;
                break;
            }
            if (past_deadline()) {
                outcome = Outcome::TimedOut;
                break;
            }
            exit_code = token.try_reap(pgid);
            if (exit_code) {
                if (token.is_cancelled()) {
                    outcome = Outcome::Cancelled;
                }
                break;
            }
            std::this_thread::sleep_for(poll_interval);
        }

        // The leader is gone but its group may still hold the streams open
        while (outcome == Outcome::Exited && !readers_finished()) {
            if (token.is_cancelled()) {
                outcome = Outcome::Cancelled;
            } else if (past_deadline()) {
                outcome = Outcome::TimedOut;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        if (outcome == Outcome::Cancelled) {
            terminate_group(true);
        } else if (outcome == Outcome::TimedOut) {
            terminate_group(false);
        }
    } catch (const std::runtime_error& e) {
        // waitpid failure: release the readers before the error leaves this frame
        token.detach(pgid);
        stop_readers();
        throw ProcessLaunchError(fmt::format("Lost track of step {} (pid {}): {}", step_id, pid, e.what()), step_id);
    }

    if (outcome != Outcome::Exited) {
        stop_readers();
        token.detach(pgid);
        if (outcome == Outcome::Cancelled) {
            throw CancelledError(step_id);
        }
        throw TimeoutError(fmt::format("Step {} timed out after {} ms", step_id, command.timeout_ms), step_id);
    }

    if (stdout_reader) stdout_reader->join();
    if (stderr_reader) stderr_reader->join();
    token.detach(pgid);

    StepResult result;
    result.exit_code = *exit_code;
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (stdout_reader) result.stdout_text = stdout_reader->text();
    if (stderr_reader) result.stderr_text = stderr_reader->text();
    return result;
}
