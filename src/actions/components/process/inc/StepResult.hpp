#pragma once

#include "Value.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json_fwd.hpp>

// Receives run events and captured output lines, one line per call
using RunLogger = std::function<void(const std::string&)>;

struct StepResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    int64_t duration_ms = 0;

    // Scope view exposed as step.<id>
    Value to_value() const;
    nlohmann::json to_json() const;
};
