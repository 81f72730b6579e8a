#pragma once

#include "LogUtils.hpp"
#include "Value.hpp"

#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <string>


// Bad command line; the front end answers it with exit code 2
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// What the command line asks the front end to do
struct RunRequest {
    std::string config_file;
    std::string action;
    Value::Map form;
    bool resolve_only = false;
    bool dry_run = false;
    bool list_actions = false;
    LogUtils::Level log_level = LogUtils::Level::Info;
};

class ParameterContext {
public:
    ParameterContext();

    // Returns false when help or version was printed and nothing else should run
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_form_file(const std::string& file_path);

    // Checks that the merged request names everything its mode needs
    void validate() const;

    const RunRequest& get_request() const;

    // "key=value" into the form; the value is typed like a YAML scalar
    static std::pair<std::string, Value> parse_assignment(const std::string& text);

private:
    RunRequest request;

    // Command line and environment variable storage
    std::unordered_map<std::string, std::string> cli_params;
    std::unordered_map<std::string, std::string> env_params;
    std::vector<std::string> form_assignments;

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--action")
        char short_opt;          // Short option (e.g. 'a')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;

    void store_option(const CommandOption& option, const std::string& value);
};
