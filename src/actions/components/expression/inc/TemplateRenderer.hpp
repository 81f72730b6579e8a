#pragma once

#include "Scope.hpp"
#include "Value.hpp"
#include <string>
#include <vector>


class TemplateRenderer {
public:
    // Strings consisting of exactly one placeholder yield the native value of the
    // expression; any other string has each placeholder stringified in place.
    // Non-string values pass through unchanged.
    static Value render(const Value& value, const Scope& scope);

    // Same as render, then stringified
    static std::string render_string(const Value& value, const Scope& scope);
    static std::string render_string(const std::string& text, const Scope& scope);
    static std::string render_string(const char* text, const Scope& scope);

    static bool has_placeholder(const std::string& text);

private:
    struct Segment {
        bool is_expression = false;
        std::string text;
        size_t begin = 0;
        size_t end = 0;
    };

    static std::vector<Segment> split(const std::string& text);
    static size_t find_closing(const std::string& text, size_t body_start);
};
