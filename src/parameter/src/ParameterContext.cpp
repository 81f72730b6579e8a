#include "ParameterContext.hpp"
#include "ConfigParser.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify workflow file path", true},
    {"--action", 'a', "Action to run", true},
    {"--set", 's', "Set a form value as key=value (repeatable)", true},
    {"--form-file", 'f', "Load form values from a JSON object file", true},
    {"--resolve", 'r', "Print resolved vars without running anything", false},
    {"--dry-run", 'n', "Print the commands instead of running them", false},
    {"--list", 'l', "List the actions of the workflow", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: flowrun [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  FLOWRUN_CONFIG_FILE   Workflow file used when -c is not given\n"
              << "  FLOWRUN_LOG_LEVEL     trace, debug, info, warn or error\n"
              << "\nExamples:\n"
              << "  flowrun -c workflow.yaml --list\n"
              << "  flowrun -c workflow.yaml -a build -s target=release -s jobs=4\n"
              << "  flowrun --config-file=workflow.yaml --action=build --dry-run\n\n";
}

void ParameterContext::show_version() {
    std::cout << "flowrun version: " << FLOWRUN_VERSION << std::endl;
    std::cout << "git: " << FLOWRUN_BUILD_GIT << std::endl;
    std::cout << "build: " << FLOWRUN_BUILD_TARGET_OSTYPE << "-" << FLOWRUN_BUILD_TARGET_CPUTYPE << " " << FLOWRUN_BUILD_DATE << std::endl;
}

void ParameterContext::store_option(const CommandOption& option, const std::string& value) {
    if (option.long_opt == "--set") {
        form_assignments.push_back(value);
        return;
    }
    cli_params[option.long_opt] = value;
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw UsageError("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw UsageError("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw UsageError("Option does not take a value: " + key);
            }

            store_option(*it, value);
        }
        // Handle short option format (-k value)
        else if (!arg.empty() && arg[0] == '-') {
            if (arg.length() != 2) {
                throw UsageError("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw UsageError("Unknown option: " + arg);
            }

            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw UsageError("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            store_option(*it, value);
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--config-file"))
        request.config_file = cli_params["--config-file"];

    if (cli_params.count("--action"))
        request.action = cli_params["--action"];

    if (cli_params.count("--form-file"))
        merge_form_file(cli_params["--form-file"]);

    // Single assignments win over the form file
    for (const auto& text : form_assignments) {
        auto [key, value] = parse_assignment(text);
        request.form[key] = std::move(value);
    }

    request.resolve_only = cli_params.count("--resolve") > 0;
    request.dry_run = cli_params.count("--dry-run") > 0;
    request.list_actions = cli_params.count("--list") > 0;

    if (cli_params.count("--verbose")) {
        request.log_level = LogUtils::Level::Debug;
    }
}

void ParameterContext::merge_environment_vars() {
    // Define environment variables to read
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"FLOWRUN_CONFIG_FILE", "config_file"},
        {"FLOWRUN_LOG_LEVEL", "log_level"}
    };

    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && env_value[0] != '\0') {
            env_params[key] = env_value;
            if (key == "config_file") {
                request.config_file = env_value;
            } else if (key == "log_level") {
                request.log_level = LogUtils::parse_level(env_value);
            }
        }
    }
}

void ParameterContext::merge_form_file(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw UsageError("Cannot open form file: " + file_path);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw UsageError("Invalid JSON in form file " + file_path + ": " + e.what());
    }

    if (!document.is_object()) {
        throw UsageError("Form file must contain a JSON object: " + file_path);
    }

    const Value parsed = Value::from_json(document);
    for (const auto& [key, value] : parsed.as_map()) {
        request.form[key] = value;
    }
}

std::pair<std::string, Value> ParameterContext::parse_assignment(const std::string& text) {
    size_t pos = text.find('=');
    if (pos == std::string::npos) {
        throw UsageError("Expected key=value for --set, got: " + text);
    }

    std::string key = StringUtils::trimmed(text.substr(0, pos));
    if (key.empty()) {
        throw UsageError("Empty key in --set " + text);
    }

    std::string raw = text.substr(pos + 1);
    if (raw.empty()) {
        return {key, Value("")};
    }

    try {
        YAML::Node node = YAML::Load(raw);
        if (node.IsScalar() || node.IsNull()) {
            return {key, node.as<Value>()};
        }
    } catch (const YAML::Exception&) {
        // Not YAML at all, keep the text
    }
    return {key, Value(raw)};
}

void ParameterContext::validate() const {
    if (request.config_file.empty()) {
        throw UsageError("No workflow file given, use --config-file or FLOWRUN_CONFIG_FILE");
    }
    if (!request.list_actions && request.action.empty()) {
        throw UsageError("No action given, use --action or --list");
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_environment_vars();
    merge_commandline();
    validate();
    return true;
}

const RunRequest& ParameterContext::get_request() const {
    return request;
}
