#pragma once

#include "Value.hpp"
#include <optional>
#include <string>
#include <vector>


enum class ArgMode {
    Flag,
    Value,
    Repeat,
    Join
};

enum class ArgStyle {
    Separate,
    Equals
};

// One entry of a run step's argv list
struct ArgSpec {
    enum class Kind {
        Literal,     // plain scalar, rendered and appended
        Shorthand,   // {"--opt": valueExpr}
        Extended     // {opt: ..., from: ..., mode: ...}
    };

    Kind kind = Kind::Literal;
    Value literal;

    std::string opt;
    Value from;
    std::optional<ArgMode> mode;     // derived from the value when absent
    ArgStyle style = ArgStyle::Separate;
    std::optional<std::string> item_template;
    std::string joiner = ",";
    std::optional<std::string> false_opt;
    bool omit_if_empty = true;
    std::optional<Value> when;

    static ArgSpec make_literal(Value text) {
        ArgSpec spec;
        spec.kind = Kind::Literal;
        spec.literal = std::move(text);
        return spec;
    }

    static ArgSpec make_shorthand(const std::string& opt, Value from) {
        ArgSpec spec;
        spec.kind = Kind::Shorthand;
        spec.opt = opt;
        spec.from = std::move(from);
        return spec;
    }

    static ArgSpec make_extended(const std::string& opt, Value from) {
        ArgSpec spec;
        spec.kind = Kind::Extended;
        spec.opt = opt;
        spec.from = std::move(from);
        return spec;
    }
};

using ArgvSpec = std::vector<ArgSpec>;

inline const char* arg_mode_name(ArgMode mode) {
    switch (mode) {
        case ArgMode::Flag:   return "flag";
        case ArgMode::Value:  return "value";
        case ArgMode::Repeat: return "repeat";
        case ArgMode::Join:   return "join";
    }
    return "unknown";
}

inline std::optional<ArgMode> parse_arg_mode(const std::string& name) {
    if (name == "flag") return ArgMode::Flag;
    if (name == "value") return ArgMode::Value;
    if (name == "repeat") return ArgMode::Repeat;
    if (name == "join") return ArgMode::Join;
    return std::nullopt;
}

inline std::optional<ArgStyle> parse_arg_style(const std::string& name) {
    if (name == "separate") return ArgStyle::Separate;
    if (name == "equals") return ArgStyle::Equals;
    return std::nullopt;
}
