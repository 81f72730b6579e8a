#include "EngineError.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Syntax:      return "syntax_error";
        case ErrorKind::Evaluation:  return "evaluation_error";
        case ErrorKind::Config:      return "config_error";
        case ErrorKind::ProcessExit: return "process_exit";
        case ErrorKind::Timeout:     return "timeout";
        case ErrorKind::Cancelled:   return "cancelled";
        case ErrorKind::Launch:      return "launch_error";
        case ErrorKind::Recovery:    return "recovery_error";
    }
    return "unknown";
}

std::string ErrorContext::describe() const {
    if (step_id.empty()) {
        return fmt::format("{}: {}", type(), message);
    }
    return fmt::format("step '{}' ({}): {}", step_id, type(), message);
}

ProcessExitError::ProcessExitError(const std::string& step_id, int exit_code)
    : EngineError(ErrorKind::ProcessExit,
                  fmt::format("Step {} failed with exit code {}", step_id, exit_code),
                  step_id),
      exit_code_(exit_code) {}

RecoveryError::RecoveryError(const ErrorContext& primary, const ErrorContext& recovery)
    : EngineError(ErrorKind::Recovery,
                  fmt::format("Primary pipeline failed at {}; recovery pipeline failed at {}",
                              primary.describe(), recovery.describe()),
                  recovery.step_id),
      primary_(primary),
      recovery_(recovery) {}

void throw_error(const ErrorContext& context) {
    switch (context.kind) {
        case ErrorKind::Syntax:
            throw ExpressionSyntaxError(context.message, context.step_id);
        case ErrorKind::Evaluation:
            throw EvaluationError(context.message, context.step_id);
        case ErrorKind::Config:
            throw ConfigError(context.message, context.step_id);
        case ErrorKind::ProcessExit:
            throw ProcessExitError(context.step_id, context.exit_code, context.message);
        case ErrorKind::Timeout:
            throw TimeoutError(context.message, context.step_id);
        case ErrorKind::Cancelled:
            throw CancelledError(context.message, context.step_id);
        case ErrorKind::Launch:
            throw ProcessLaunchError(context.message, context.step_id);
        case ErrorKind::Recovery:
            break;
    }
    throw EngineError(context.kind, context.message, context.step_id);
}
