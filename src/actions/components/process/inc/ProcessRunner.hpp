#pragma once

#include "CancellationToken.hpp"
#include "ConfigData.hpp"
#include "RunConfig.hpp"
#include "Scope.hpp"
#include "StepResult.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

// A run step with every template rendered, ready to spawn
struct PreparedCommand {
    std::string step_id;
    std::string program;
    std::vector<std::string> args;
    std::optional<std::string> workdir;
    bool shell = false;
    std::map<std::string, std::string> env;
    StreamMode stdout_mode;
    StreamMode stderr_mode;
    int64_t timeout_ms = 0;

    // argv handed to exec; shell mode wraps the quoted command line in /bin/sh -c
    std::vector<std::string> exec_argv() const;

    // Human readable form for logs and dry runs
    std::string command_line() const;
};

class ProcessRunner {
public:
    static constexpr std::chrono::milliseconds poll_interval{100};
    static constexpr std::chrono::milliseconds terminate_grace{1000};

    static PreparedCommand prepare(const std::string& step_id,
                                   const RunConfig& run,
                                   const Scope& scope,
                                   const WorkflowConfig& config,
                                   const Action* action = nullptr);

    // Spawns the command in its own process group and waits for it while draining
    // captured streams. Throws CancelledError, TimeoutError or ProcessLaunchError.
    static StepResult run(const PreparedCommand& command, CancellationToken& token, const RunLogger& log);

private:
    static std::string resolve_program(const std::string& program, const Scope& scope, const WorkflowConfig& config);
};
