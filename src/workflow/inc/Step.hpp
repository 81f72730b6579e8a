#pragma once

#include "RunConfig.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Step;

struct PipelineBody {
    std::vector<Step> steps;
};

struct ForeachBody {
    Value in;                       // template, must render to a list
    std::string as = "item";        // loop alias
    std::vector<Step> steps;
};

struct Step {
    std::string id;                 // Step id template; generated when empty
    std::optional<Value> when;      // Guard template, true when absent
    bool continue_on_error = false;
    std::variant<RunConfig, PipelineBody, ForeachBody> body;

    bool is_run() const { return std::holds_alternative<RunConfig>(body); }
    bool is_pipeline() const { return std::holds_alternative<PipelineBody>(body); }
    bool is_foreach() const { return std::holds_alternative<ForeachBody>(body); }

    const char* type_name() const {
        if (is_run()) return "run";
        if (is_pipeline()) return "pipeline";
        return "foreach";
    }
};

using Pipeline = std::vector<Step>;
