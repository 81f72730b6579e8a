#include "StepResult.hpp"
#include <nlohmann/json.hpp>

Value StepResult::to_value() const {
    return Value(Value::Map{
        {"exit_code", exit_code},
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"duration_ms", duration_ms}
    });
}

nlohmann::json StepResult::to_json() const {
    return nlohmann::json{
        {"exit_code", exit_code},
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"duration_ms", duration_ms}
    };
}
