#pragma once

#include "Action.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct AppConfig {
    std::map<std::string, Value> env;
    std::optional<Value> workdir;
    bool shell = false;
};

struct RuntimeConfig {
    Value executable;   // template
};

// Top-level workflow document
struct WorkflowConfig {
    int version = 1;
    std::vector<std::pair<std::string, Value>> vars;   // declaration order
    AppConfig app;
    std::map<std::string, RuntimeConfig> runtime;
    std::vector<Action> actions;                       // declaration order

    const Action* find_action(const std::string& key) const {
        for (const auto& action : actions) {
            if (action.key == key) {
                return &action;
            }
        }
        return nullptr;
    }
};
