#pragma once

#include "ConfigData.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

// Parses and validates workflow documents; every failure surfaces as ConfigError
class WorkflowLoader {
public:
    static WorkflowConfig load_file(const std::string& path);
    static WorkflowConfig load_string(const std::string& text);
    static WorkflowConfig from_node(const YAML::Node& root);
};
