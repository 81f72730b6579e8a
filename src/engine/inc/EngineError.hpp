#pragma once

#include <stdexcept>
#include <string>


enum class ErrorKind {
    Syntax,
    Evaluation,
    Config,
    ProcessExit,
    Timeout,
    Cancelled,
    Launch,
    Recovery
};

// Wire name of an error kind as exposed in `error.type` and `_meta.error.type`
const char* error_kind_name(ErrorKind kind);

// Structured description of one failure, independent of the exception that carried it
struct ErrorContext {
    std::string step_id;
    ErrorKind kind = ErrorKind::Evaluation;
    std::string message;
    int exit_code = 0;

    std::string type() const { return error_kind_name(kind); }
    std::string describe() const;
};

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message, const std::string& step_id = "")
        : std::runtime_error(message), kind_(kind), step_id_(step_id) {}

    ErrorKind kind() const { return kind_; }
    const std::string& step_id() const { return step_id_; }
    virtual int exit_code() const { return 0; }

    ErrorContext context() const {
        return ErrorContext{step_id_, kind_, what(), exit_code()};
    }

private:
    ErrorKind kind_;
    std::string step_id_;
};

class ExpressionSyntaxError : public EngineError {
public:
    explicit ExpressionSyntaxError(const std::string& message, const std::string& step_id = "")
        : EngineError(ErrorKind::Syntax, message, step_id) {}
};

class EvaluationError : public EngineError {
public:
    explicit EvaluationError(const std::string& message, const std::string& step_id = "")
        : EngineError(ErrorKind::Evaluation, message, step_id) {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message, const std::string& step_id = "")
        : EngineError(ErrorKind::Config, message, step_id) {}
};

class ProcessExitError : public EngineError {
public:
    ProcessExitError(const std::string& step_id, int exit_code);
    ProcessExitError(const std::string& step_id, int exit_code, const std::string& message)
        : EngineError(ErrorKind::ProcessExit, message, step_id), exit_code_(exit_code) {}

    int exit_code() const override { return exit_code_; }

private:
    int exit_code_;
};

class TimeoutError : public EngineError {
public:
    explicit TimeoutError(const std::string& message, const std::string& step_id = "")
        : EngineError(ErrorKind::Timeout, message, step_id) {}
};

class CancelledError : public EngineError {
public:
    explicit CancelledError(const std::string& step_id = "")
        : EngineError(ErrorKind::Cancelled, "Action was stopped by user", step_id) {}
    CancelledError(const std::string& message, const std::string& step_id)
        : EngineError(ErrorKind::Cancelled, message, step_id) {}
};

class ProcessLaunchError : public EngineError {
public:
    explicit ProcessLaunchError(const std::string& message, const std::string& step_id = "")
        : EngineError(ErrorKind::Launch, message, step_id) {}
};

// Raised when the on_error pipeline itself fails; keeps both failure contexts
class RecoveryError : public EngineError {
public:
    RecoveryError(const ErrorContext& primary, const ErrorContext& recovery);

    const ErrorContext& primary() const { return primary_; }
    const ErrorContext& recovery() const { return recovery_; }

private:
    ErrorContext primary_;
    ErrorContext recovery_;
};

// Re-raise a captured failure as the matching exception type
[[noreturn]] void throw_error(const ErrorContext& context);
