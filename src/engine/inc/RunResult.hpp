#pragma once

#include "EngineError.hpp"
#include "StepResult.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

enum class RunStatus {
    Success,
    Recovered
};

// Step results of one invocation in execution order, plus the run metadata
struct RunResult {
    std::vector<std::pair<std::string, StepResult>> steps;
    RunStatus status = RunStatus::Success;
    std::optional<ErrorContext> error;      // set when recovered

    bool contains(const std::string& step_id) const { return find(step_id) != nullptr; }
    const StepResult* find(const std::string& step_id) const;
    const StepResult& at(const std::string& step_id) const;

    static const char* status_name(RunStatus status);

    // {<step id>: {exit_code, stdout, stderr, duration_ms}, ..., "_meta": {status, error?}}
    nlohmann::json to_json() const;
    Value to_value() const;
};
