#pragma once

#include "Step.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Action {
    std::string key;                        // Action identifier
    std::string title;                      // Display title
    std::optional<Pipeline> pipeline;       // Steps of the action
    std::optional<RunConfig> run;           // Single-step shorthand
    Pipeline on_error;                      // Recovery pipeline, empty when absent
    std::map<std::string, Value> env;       // Action-level environment overrides

    bool has_recovery() const { return !on_error.empty(); }

    // The steps to execute; a run shorthand becomes one step named <key>_run
    Pipeline effective_pipeline() const {
        if (pipeline) {
            return *pipeline;
        }
        Pipeline steps;
        if (run) {
            Step step;
            step.id = key + "_run";
            step.body = *run;
            steps.push_back(std::move(step));
        }
        return steps;
    }
};
