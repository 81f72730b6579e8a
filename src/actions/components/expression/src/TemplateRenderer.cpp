#include "TemplateRenderer.hpp"
#include "ExpressionEngine.hpp"
#include "EngineError.hpp"
#include "StringUtils.hpp"

bool TemplateRenderer::has_placeholder(const std::string& text) {
    return text.find("${") != std::string::npos;
}

size_t TemplateRenderer::find_closing(const std::string& text, size_t body_start) {
    int depth = 0;
    char quote = 0;

    for (size_t i = body_start; i < text.size(); ++i) {
        const char ch = text[i];
        if (quote) {
            if (ch == '\\') {
                ++i;
            } else if (ch == quote) {
                quote = 0;
            }
            continue;
        }

        if (ch == '\'' || ch == '"') {
            quote = ch;
        } else if (ch == '{') {
            ++depth;
        } else if (ch == '}') {
            if (depth == 0) {
                return i;
            }
            --depth;
        }
    }

    throw ExpressionSyntaxError("Unclosed template expression: " + text.substr(body_start - 2));
}

std::vector<TemplateRenderer::Segment> TemplateRenderer::split(const std::string& text) {
    std::vector<Segment> segments;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t open = text.find("${", pos);
        if (open == std::string::npos) {
            segments.push_back({false, text.substr(pos), pos, text.size()});
            break;
        }
        if (open > pos) {
            segments.push_back({false, text.substr(pos, open - pos), pos, open});
        }

        size_t close = find_closing(text, open + 2);
        segments.push_back({true, text.substr(open + 2, close - open - 2), open, close + 1});
        pos = close + 1;
    }
    return segments;
}

Value TemplateRenderer::render(const Value& value, const Scope& scope) {
    if (!value.is_string()) {
        return value;
    }

    const std::string& text = value.as_string();
    if (!has_placeholder(text)) {
        return value;
    }

    const auto segments = split(text);

    // A lone placeholder (surrounding whitespace aside) keeps its native type
    size_t expressions = 0;
    const Segment* lone = nullptr;
    bool only_blank_literals = true;
    for (const auto& segment : segments) {
        if (segment.is_expression) {
            ++expressions;
            lone = &segment;
        } else if (!StringUtils::trimmed(segment.text).empty()) {
            only_blank_literals = false;
        }
    }

    if (expressions == 1 && only_blank_literals) {
        Value result = ExpressionEngine::evaluate(lone->text, scope);
        if (result.is_null()) {
            return Value(std::string());
        }
        return result;
    }

    std::string rendered;
    rendered.reserve(text.size());
    for (const auto& segment : segments) {
        if (segment.is_expression) {
            rendered += ExpressionEngine::evaluate(segment.text, scope).to_string();
        } else {
            rendered += segment.text;
        }
    }
    return rendered;
}

std::string TemplateRenderer::render_string(const Value& value, const Scope& scope) {
    return render(value, scope).to_string();
}

std::string TemplateRenderer::render_string(const std::string& text, const Scope& scope) {
    return render(Value(text), scope).to_string();
}

std::string TemplateRenderer::render_string(const char* text, const Scope& scope) {
    return render_string(std::string(text), scope);
}
