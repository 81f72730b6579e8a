#include "WorkflowLoader.hpp"
#include "ConfigParser.hpp"
#include "LogUtils.hpp"
#include <filesystem>

WorkflowConfig WorkflowLoader::from_node(const YAML::Node& root) {
    try {
        auto config = root.as<WorkflowConfig>();
        LogUtils::debug("Loaded workflow with {} action(s), {} var(s)", config.actions.size(), config.vars.size());
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid workflow: ") + e.what());
    }
}

WorkflowConfig WorkflowLoader::load_string(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse YAML: ") + e.what());
    }
    return from_node(root);
}

WorkflowConfig WorkflowLoader::load_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Workflow file not found: " + path);
    }

    LogUtils::info("Loading workflow file: {}", path);
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file " + path + ": " + e.what());
    }
    return from_node(root);
}
