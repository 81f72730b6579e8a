#include "StepExecutionStrategy.hpp"
#include "EngineError.hpp"
#include "LogUtils.hpp"
#include "ProcessRunner.hpp"
#include <mutex>


void StepExecutionStrategy::emit(const StepInvocation& invocation, const std::string& line) const {
    LogUtils::info("{}", line);
    if (invocation.log) {
        invocation.log(line);
    }
}

// Implementation of production environment strategy
StepResult ProductionStepStrategy::execute(const StepInvocation& invocation) {
    auto command = ProcessRunner::prepare(invocation.step_id, invocation.run, invocation.scope,
                                          config_, &invocation.action);
    emit(invocation, "[run] " + invocation.step_id + ": " + command.command_line());

    if (command.workdir) {
        LogUtils::debug("Step {} working directory: {}", invocation.step_id, *command.workdir);
    }

    auto result = ProcessRunner::run(command, invocation.token, invocation.log);
    LogUtils::debug("Step completed: {} (exit code {}, {} ms)",
                    invocation.step_id, result.exit_code, result.duration_ms);
    return result;
}


// Implementation of debug environment strategy
static std::mutex log_mutex;
StepResult DebugStepStrategy::execute(const StepInvocation& invocation) {
    if (invocation.token.is_cancelled()) {
        throw CancelledError(invocation.step_id);
    }

    auto command = ProcessRunner::prepare(invocation.step_id, invocation.run, invocation.scope,
                                          config_, &invocation.action);

    std::lock_guard<std::mutex> lock(log_mutex);
    emit(invocation, "[dry-run] " + invocation.step_id + ": " + command.command_line());

    StepResult result;
    result.exit_code = 0;
    result.stdout_text = command.command_line();
    return result;
}
