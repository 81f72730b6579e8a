#include "ArgvBuilder.hpp"
#include "EngineError.hpp"
#include "StringUtils.hpp"
#include "TemplateRenderer.hpp"
#include <fmt/args.h>
#include <fmt/format.h>

namespace {

void push_native(fmt::dynamic_format_arg_store<fmt::format_context>& store, const Value& value) {
    switch (value.type()) {
        case Value::Type::Bool:    store.push_back(value.as_bool()); break;
        case Value::Type::Integer: store.push_back(value.as_int()); break;
        case Value::Type::Double:  store.push_back(value.as_number()); break;
        default:                   store.push_back(value.to_string()); break;
    }
}

void push_named(fmt::dynamic_format_arg_store<fmt::format_context>& store,
                const std::string& name, const Value& value) {
    switch (value.type()) {
        case Value::Type::Bool:    store.push_back(fmt::arg(name.c_str(), value.as_bool())); break;
        case Value::Type::Integer: store.push_back(fmt::arg(name.c_str(), value.as_int())); break;
        case Value::Type::Double:  store.push_back(fmt::arg(name.c_str(), value.as_number())); break;
        default:                   store.push_back(fmt::arg(name.c_str(), value.to_string())); break;
    }
}

} // namespace

std::vector<std::string> ArgvBuilder::build(const ArgvSpec& spec, const Scope& scope) {
    Args out;
    for (const auto& item : spec) {
        switch (item.kind) {
            case ArgSpec::Kind::Literal:
                out.push_back(TemplateRenderer::render_string(item.literal, scope));
                break;
            case ArgSpec::Kind::Shorthand:
                append_shorthand(out, item, scope);
                break;
            case ArgSpec::Kind::Extended:
                append_extended(out, item, scope);
                break;
        }
    }
    return out;
}

void ArgvBuilder::append_shorthand(Args& out, const ArgSpec& spec, const Scope& scope) {
    const Value value = TemplateRenderer::render(spec.from, scope);

    if (value.is_null() || value == Value(false) || value == Value("")) {
        return;
    }
    if (value == Value(true)) {
        out.push_back(spec.opt);
        return;
    }
    if (value.is_list()) {
        for (const auto& part : value.as_list()) {
            out.push_back(spec.opt);
            out.push_back(part.to_string());
        }
        return;
    }
    out.push_back(spec.opt);
    out.push_back(value.to_string());
}

void ArgvBuilder::append_extended(Args& out, const ArgSpec& spec, const Scope& scope) {
    if (spec.when && !TemplateRenderer::render(*spec.when, scope).truthy()) {
        return;
    }

    const Value value = TemplateRenderer::render(spec.from, scope);

    // "auto"/"true"/"false" strings act as a flag whatever mode is declared
    if (is_tri_state(value)) {
        append_flag(out, spec, value);
        return;
    }

    const ArgMode mode = spec.mode ? *spec.mode : derive_mode(value);
    if (mode == ArgMode::Flag) {
        append_flag(out, spec, value);
        return;
    }

    if (spec.omit_if_empty && value.empty()) {
        return;
    }

    switch (mode) {
        case ArgMode::Value:
            if (value.is_null()) {
                out.push_back(spec.opt);
                return;
            }
            append_option(out, spec.opt, format_item(value, spec.item_template), spec.style);
            return;

        case ArgMode::Repeat: {
            if (value.is_null()) {
                return;
            }
            const Value::List items = value.is_list() ? value.as_list() : Value::List{value};
            for (const auto& item : items) {
                append_option(out, spec.opt, format_item(item, spec.item_template), spec.style);
            }
            return;
        }

        case ArgMode::Join: {
            std::vector<std::string> parts;
            if (value.is_list()) {
                for (const auto& item : value.as_list()) {
                    parts.push_back(format_item(item, spec.item_template));
                }
            } else if (!value.is_null()) {
                parts.push_back(format_item(value, spec.item_template));
            }
            append_option(out, spec.opt, StringUtils::join(parts, spec.joiner), spec.style);
            return;
        }

        case ArgMode::Flag:
            break;
    }
}

void ArgvBuilder::append_flag(Args& out, const ArgSpec& spec, const Value& value) {
    bool on;
    if (value.is_string()) {
        const auto& text = value.as_string();
        if (text == "auto") {
            return;
        }
        on = text == "true" || (text != "false" && !text.empty());
    } else if (value.is_null()) {
        return;
    } else {
        on = value.truthy();
    }

    if (on) {
        out.push_back(spec.opt);
    } else if (spec.false_opt && !spec.false_opt->empty()) {
        out.push_back(*spec.false_opt);
    }
}

void ArgvBuilder::append_option(Args& out, const std::string& opt, const std::string& value, ArgStyle style) {
    if (style == ArgStyle::Equals) {
        out.push_back(opt + "=" + value);
    } else {
        out.push_back(opt);
        out.push_back(value);
    }
}

ArgMode ArgvBuilder::derive_mode(const Value& value) {
    if (value.is_bool()) return ArgMode::Flag;
    if (value.is_list()) return ArgMode::Repeat;
    return ArgMode::Value;
}

bool ArgvBuilder::is_tri_state(const Value& value) {
    if (!value.is_string()) {
        return false;
    }
    const auto& text = value.as_string();
    return text == "auto" || text == "true" || text == "false";
}

std::string ArgvBuilder::format_item(const Value& value, const std::optional<std::string>& item_template) {
    if (!item_template || item_template->empty()) {
        return value.to_string();
    }

    fmt::dynamic_format_arg_store<fmt::format_context> store;
    if (value.is_map()) {
        for (const auto& [key, item] : value.as_map()) {
            push_named(store, key, item);
        }
    } else {
        push_native(store, value);
        push_named(store, "value", value);
    }

    try {
        return fmt::vformat(*item_template, store);
    } catch (const fmt::format_error& e) {
        throw EvaluationError(fmt::format("Invalid argv template '{}': {}", *item_template, e.what()));
    }
}
