#pragma once

#include "ConfigData.hpp"
#include "EngineError.hpp"
#include "Value.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw ConfigError("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    inline void require_map(const YAML::Node& node, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigError(context + " must be a map");
        }
    }

    inline void require_sequence(const YAML::Node& node, const std::string& context) {
        if (!node.IsSequence()) {
            throw ConfigError(context + " must be a list");
        }
    }

    // Plain scalars follow YAML 1.1 resolution (null, bool, int, float), quoted or
    // explicitly tagged scalars stay strings
    inline ::Value scalar_value(const YAML::Node& node) {
        const std::string& text = node.Scalar();
        if (node.Tag() != "?") {
            return ::Value(text);
        }

        static const std::set<std::string> nulls = {"", "~", "null", "Null", "NULL"};
        static const std::set<std::string> trues = {"true", "True", "TRUE", "yes", "Yes", "YES", "on", "On", "ON"};
        static const std::set<std::string> falses = {"false", "False", "FALSE", "no", "No", "NO", "off", "Off", "OFF"};
        if (nulls.count(text)) return ::Value();
        if (trues.count(text)) return ::Value(true);
        if (falses.count(text)) return ::Value(false);

        const bool numeric_start = !text.empty() &&
            (std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-' || text[0] == '+' || text[0] == '.');
        if (numeric_start) {
            const char* begin = text.c_str();
            char* end = nullptr;

            errno = 0;
            long long integer = std::strtoll(begin, &end, 10);
            if (errno == 0 && end != begin && *end == '\0') {
                return ::Value(integer);
            }

            bool has_digit = false;
            for (char ch : text) {
                if (std::isdigit(static_cast<unsigned char>(ch))) {
                    has_digit = true;
                } else if (ch != '.' && ch != '-' && ch != '+' && ch != 'e' && ch != 'E') {
                    has_digit = false;
                    break;
                }
            }
            if (has_digit) {
                errno = 0;
                double number = std::strtod(begin, &end);
                if (errno == 0 && end != begin && *end == '\0') {
                    return ::Value(number);
                }
            }
        }
        return ::Value(text);
    }

    template<>
    struct convert<::Value> {
        static bool decode(const Node& node, ::Value& rhs) {
            switch (node.Type()) {
                case NodeType::Null:
                case NodeType::Undefined:
                    rhs = ::Value();
                    return true;
                case NodeType::Scalar:
                    rhs = scalar_value(node);
                    return true;
                case NodeType::Sequence: {
                    ::Value::List list;
                    for (const auto& item : node) {
                        list.push_back(item.as<::Value>());
                    }
                    rhs = ::Value(std::move(list));
                    return true;
                }
                case NodeType::Map: {
                    ::Value::Map map;
                    for (auto it = node.begin(); it != node.end(); ++it) {
                        map[it->first.as<std::string>()] = it->second.as<::Value>();
                    }
                    rhs = ::Value(std::move(map));
                    return true;
                }
            }
            return false;
        }
    };

    inline std::map<std::string, ::Value> decode_env(const YAML::Node& node, const std::string& context) {
        require_map(node, context);
        std::map<std::string, ::Value> env;
        for (auto it = node.begin(); it != node.end(); ++it) {
            env[it->first.as<std::string>()] = it->second.as<::Value>();
        }
        return env;
    }

    inline StreamMode decode_stream_mode(const YAML::Node& node, const std::string& context) {
        std::optional<StreamMode> mode;
        if (node.IsScalar()) {
            mode = StreamMode::parse(node.as<std::string>());
        }
        if (!mode) {
            throw ConfigError("Unsupported stream mode in " + context + ": expected inherit, capture or file:<path>");
        }
        return *mode;
    }

    template<>
    struct convert<ArgSpec> {
        static bool decode(const Node& node, ArgSpec& rhs) {
            if (node.IsScalar()) {
                rhs = ArgSpec::make_literal(scalar_value(node));
                return true;
            }
            if (!node.IsMap()) {
                throw ConfigError("Unsupported argv item: argv entries must be strings or maps");
            }

            if (!node["opt"]) {
                if (node.size() != 1) {
                    throw ConfigError("Unsupported argv item: a map without 'opt' must have exactly one key");
                }
                auto it = node.begin();
                rhs = ArgSpec::make_shorthand(it->first.as<std::string>(), it->second.as<::Value>());
                return true;
            }

            static const std::set<std::string> valid_keys = {
                "opt", "from", "mode", "style", "template", "joiner", "false_opt", "omit_if_empty", "when"
            };
            check_unknown_keys(node, valid_keys, "argv item");

            rhs = ArgSpec::make_extended(node["opt"].as<std::string>(),
                                         node["from"] ? node["from"].as<::Value>() : ::Value());
            if (node["mode"]) {
                const auto name = node["mode"].as<std::string>();
                if (name != "auto") {
                    rhs.mode = parse_arg_mode(name);
                    if (!rhs.mode) {
                        throw ConfigError("Unsupported argv mode for " + rhs.opt + ": " + name);
                    }
                }
            }
            if (node["style"]) {
                const auto name = node["style"].as<std::string>();
                auto style = parse_arg_style(name);
                if (!style) {
                    throw ConfigError("Unsupported argv style for " + rhs.opt + ": " + name);
                }
                rhs.style = *style;
            }
            if (node["template"]) rhs.item_template = node["template"].as<std::string>();
            if (node["joiner"]) rhs.joiner = node["joiner"].as<std::string>();
            if (node["false_opt"] && !node["false_opt"].IsNull()) rhs.false_opt = node["false_opt"].as<std::string>();
            if (node["omit_if_empty"]) rhs.omit_if_empty = node["omit_if_empty"].as<bool>();
            if (node["when"]) rhs.when = node["when"].as<::Value>();
            return true;
        }
    };

    template<>
    struct convert<RunConfig> {
        static bool decode(const Node& node, RunConfig& rhs) {
            require_map(node, "run");
            static const std::set<std::string> valid_keys = {
                "program", "argv", "env", "workdir", "shell", "stdout", "stderr", "capture", "timeout_ms"
            };
            check_unknown_keys(node, valid_keys, "run");

            if (!node["program"] || node["program"].IsNull()) {
                throw ConfigError("run.program is required");
            }
            rhs.program = node["program"].as<::Value>();

            if (node["argv"]) {
                require_sequence(node["argv"], "run.argv");
                rhs.argv = node["argv"].as<std::vector<ArgSpec>>();
            }
            if (node["env"]) rhs.env = decode_env(node["env"], "run.env");
            if (node["workdir"] && !node["workdir"].IsNull()) rhs.workdir = node["workdir"].as<::Value>();
            if (node["shell"]) rhs.shell = node["shell"].as<bool>();
            if (node["capture"]) rhs.capture = node["capture"].as<bool>();
            if (node["stdout"]) rhs.stdout_mode = decode_stream_mode(node["stdout"], "run.stdout");
            if (node["stderr"]) rhs.stderr_mode = decode_stream_mode(node["stderr"], "run.stderr");
            if (node["timeout_ms"] && !node["timeout_ms"].IsNull()) {
                rhs.timeout_ms = node["timeout_ms"].as<int64_t>();
                if (rhs.timeout_ms < 0) {
                    throw ConfigError("run.timeout_ms must not be negative");
                }
            }
            return true;
        }
    };

    template<>
    struct convert<Step> {
        static bool decode(const Node& node, Step& rhs) {
            require_map(node, "step");
            static const std::set<std::string> valid_keys = {
                "id", "when", "continue_on_error", "run", "pipeline", "foreach"
            };
            check_unknown_keys(node, valid_keys, "step");

            if (node["id"]) rhs.id = node["id"].as<std::string>();
            const std::string context = rhs.id.empty() ? std::string("step") : "step " + rhs.id;

            const int kinds = (node["run"] ? 1 : 0) + (node["pipeline"] ? 1 : 0) + (node["foreach"] ? 1 : 0);
            if (kinds != 1) {
                throw ConfigError(context + " must have exactly one of run, pipeline or foreach");
            }

            if (node["when"]) rhs.when = node["when"].as<::Value>();
            if (node["continue_on_error"]) rhs.continue_on_error = node["continue_on_error"].as<bool>();

            if (node["run"]) {
                rhs.body = node["run"].as<RunConfig>();
            } else if (node["pipeline"]) {
                require_sequence(node["pipeline"], context + ".pipeline");
                rhs.body = PipelineBody{node["pipeline"].as<std::vector<Step>>()};
            } else {
                const auto& foreach = node["foreach"];
                require_map(foreach, context + ".foreach");
                static const std::set<std::string> foreach_keys = {"in", "as", "steps"};
                check_unknown_keys(foreach, foreach_keys, context + ".foreach");
                if (!foreach["in"]) {
                    throw ConfigError(context + ".foreach.in is required");
                }

                ForeachBody body;
                body.in = foreach["in"].as<::Value>();
                if (foreach["as"]) body.as = foreach["as"].as<std::string>();
                if (foreach["steps"]) {
                    require_sequence(foreach["steps"], context + ".foreach.steps");
                    body.steps = foreach["steps"].as<std::vector<Step>>();
                }
                rhs.body = std::move(body);
            }
            return true;
        }
    };

    template<>
    struct convert<Action> {
        static bool decode(const Node& node, Action& rhs) {
            const std::string context = "action " + rhs.key;
            require_map(node, context);
            static const std::set<std::string> valid_keys = {
                "title", "description", "help", "form", "pipeline", "run", "on_error", "env"
            };
            check_unknown_keys(node, valid_keys, context);

            if (!node["title"] || node["title"].IsNull()) {
                throw ConfigError("Action " + rhs.key + " must include title");
            }
            rhs.title = node["title"].as<std::string>();

            if (!node["pipeline"] && !node["run"]) {
                throw ConfigError("Action " + rhs.key + " must include pipeline or run");
            }
            if (node["pipeline"]) {
                require_sequence(node["pipeline"], context + ".pipeline");
                rhs.pipeline = node["pipeline"].as<std::vector<Step>>();
            }
            if (node["run"]) {
                rhs.run = node["run"].as<RunConfig>();
            }
            if (node["on_error"]) {
                require_sequence(node["on_error"], context + ".on_error");
                rhs.on_error = node["on_error"].as<std::vector<Step>>();
            }
            if (node["env"]) {
                rhs.env = decode_env(node["env"], context + ".env");
            }
            return true;
        }
    };

    template<>
    struct convert<AppConfig> {
        static bool decode(const Node& node, AppConfig& rhs) {
            require_map(node, "app");
            static const std::set<std::string> valid_keys = {"name", "title", "env", "workdir", "shell"};
            check_unknown_keys(node, valid_keys, "app");

            if (node["env"]) rhs.env = decode_env(node["env"], "app.env");
            if (node["workdir"] && !node["workdir"].IsNull()) rhs.workdir = node["workdir"].as<::Value>();
            if (node["shell"]) rhs.shell = node["shell"].as<bool>();
            return true;
        }
    };

    template<>
    struct convert<WorkflowConfig> {
        static bool decode(const Node& node, WorkflowConfig& rhs) {
            if (!node.IsMap()) {
                throw ConfigError("YAML root must be a map");
            }
            static const std::set<std::string> valid_keys = {"version", "vars", "app", "runtime", "actions"};
            check_unknown_keys(node, valid_keys, "root");

            if (!node["version"] || node["version"].as<::Value>() != ::Value(1)) {
                throw ConfigError("Only version: 1 is supported");
            }
            rhs.version = 1;

            if (node["vars"] && !node["vars"].IsNull()) {
                require_map(node["vars"], "vars");
                for (auto it = node["vars"].begin(); it != node["vars"].end(); ++it) {
                    rhs.vars.emplace_back(it->first.as<std::string>(), it->second.as<::Value>());
                }
            }

            if (node["app"] && !node["app"].IsNull()) {
                rhs.app = node["app"].as<AppConfig>();
            }

            if (node["runtime"] && !node["runtime"].IsNull()) {
                require_map(node["runtime"], "runtime");
                for (auto it = node["runtime"].begin(); it != node["runtime"].end(); ++it) {
                    const std::string name = it->first.as<std::string>();
                    require_map(it->second, "runtime." + name);
                    check_unknown_keys(it->second, {"executable"}, "runtime." + name);
                    RuntimeConfig runtime;
                    if (it->second["executable"]) {
                        runtime.executable = it->second["executable"].as<::Value>();
                    }
                    rhs.runtime[name] = runtime;
                }
            }

            const auto& actions = node["actions"];
            if (!actions || !actions.IsMap() || actions.size() == 0) {
                throw ConfigError("actions must be a non-empty map");
            }
            for (auto it = actions.begin(); it != actions.end(); ++it) {
                Action action;
                action.key = it->first.as<std::string>();
                convert<Action>::decode(it->second, action);
                rhs.actions.push_back(std::move(action));
            }
            return true;
        }
    };

} // namespace YAML
