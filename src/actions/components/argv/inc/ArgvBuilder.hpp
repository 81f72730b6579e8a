#pragma once

#include "ArgSpec.hpp"
#include "Scope.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <vector>


// Serializes a declarative argv list into concrete arguments. Output order follows
// declaration order.
class ArgvBuilder {
public:
    static std::vector<std::string> build(const ArgvSpec& spec, const Scope& scope);

    // Applies an item template: scalars bind to {}, {0} and {value}, map items bind
    // each key by name. Without a template the value is stringified.
    static std::string format_item(const Value& value, const std::optional<std::string>& item_template);

private:
    using Args = std::vector<std::string>;

    static void append_shorthand(Args& out, const ArgSpec& spec, const Scope& scope);
    static void append_extended(Args& out, const ArgSpec& spec, const Scope& scope);

    static void append_flag(Args& out, const ArgSpec& spec, const Value& value);
    static void append_option(Args& out, const std::string& opt, const std::string& value, ArgStyle style);

    static ArgMode derive_mode(const Value& value);
    static bool is_tri_state(const Value& value);
};
