#include "RunResult.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

const StepResult* RunResult::find(const std::string& step_id) const {
    for (const auto& [id, result] : steps) {
        if (id == step_id) {
            return &result;
        }
    }
    return nullptr;
}

const StepResult& RunResult::at(const std::string& step_id) const {
    const StepResult* result = find(step_id);
    if (!result) {
        throw std::out_of_range("No result for step: " + step_id);
    }
    return *result;
}

const char* RunResult::status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Success:   return "success";
        case RunStatus::Recovered: return "recovered";
    }
    return "unknown";
}

nlohmann::json RunResult::to_json() const {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [id, result] : steps) {
        json[id] = result.to_json();
    }

    nlohmann::json meta = {{"status", status_name(status)}};
    if (error) {
        meta["error"] = {
            {"step_id", error->step_id},
            {"type", error->type()},
            {"message", error->message}
        };
    }
    json["_meta"] = meta;
    return json;
}

Value RunResult::to_value() const {
    return Value::from_json(to_json());
}
