#include "ExpressionEngine.hpp"
#include "EngineError.hpp"
#include "StringUtils.hpp"
#include <filesystem>
#include <system_error>
#include <fmt/format.h>

namespace {

const char* compare_symbol(CompareOp op) {
    switch (op) {
        case CompareOp::Eq:    return "==";
        case CompareOp::NotEq: return "!=";
        case CompareOp::Lt:    return "<";
        case CompareOp::LtE:   return "<=";
        case CompareOp::Gt:    return ">";
        case CompareOp::GtE:   return ">=";
    }
    return "?";
}

} // namespace

// --------------------------
// Get thread-local context
// --------------------------
ExpressionEngine::ThreadLocalContext& ExpressionEngine::get_thread_context() {
    // Thread-local storage
    thread_local ThreadLocalContext context;
    return context;
}

// --------------------------
// Template management
// --------------------------
std::shared_ptr<const ExpressionEngine::ExpressionTemplate>
ExpressionEngine::get_template(const std::string& expression, ThreadLocalContext& context) {
    auto& cache = context.template_cache;
    auto it = cache.find(expression);
    if (it != cache.end()) {
        return it->second;
    }

    // Parse new expression; failures are not cached
    std::shared_ptr<const ExprNode> root = ExpressionParser::parse(expression);
    auto compiled = std::make_shared<const ExpressionTemplate>(ExpressionTemplate{
        expression,
        std::move(root)
    });

    cache.emplace(expression, compiled);
    return compiled;
}

// --------------------------
// ExpressionEngine implementation
// --------------------------
ExpressionEngine::ExpressionEngine(const std::string& expression)
    : template_(get_template(expression, get_thread_context())) {}

ExpressionEngine::Result ExpressionEngine::evaluate(const Scope& scope) const {
    try {
        return eval_node(*template_->root, scope);
    } catch (const EvaluationError& e) {
        throw EvaluationError(fmt::format("Expression evaluation failed: {}: {}", template_->expression, e.what()));
    }
}

ExpressionEngine::Result ExpressionEngine::evaluate(const std::string& expression, const Scope& scope) {
    ExpressionEngine engine(expression);
    return engine.evaluate(scope);
}

Value ExpressionEngine::eval_node(const ExprNode& node, const Scope& scope) {
    switch (node.kind) {
        case ExprKind::Literal:
            return node.literal;

        case ExprKind::Name: {
            const Value* bound = scope.find(node.name);
            if (!bound) {
                throw EvaluationError("Name '" + node.name + "' is not defined");
            }
            return *bound;
        }

        case ExprKind::Attr:
            return eval_node(*node.children[0], scope).get_attribute(node.name);

        case ExprKind::Index: {
            Value target = eval_node(*node.children[0], scope);
            return target.get_index(eval_node(*node.children[1], scope));
        }

        case ExprKind::BoolOp: {
            // Short-circuit; the last evaluated operand decides
            bool result = node.bool_op == BoolOpKind::And;
            for (const auto& child : node.children) {
                result = eval_node(*child, scope).truthy();
                if (node.bool_op == BoolOpKind::And && !result) break;
                if (node.bool_op == BoolOpKind::Or && result) break;
            }
            return result;
        }

        case ExprKind::Not:
            return !eval_node(*node.children[0], scope).truthy();

        case ExprKind::Compare: {
            Value left = eval_node(*node.children[0], scope);
            for (size_t i = 0; i < node.ops.size(); ++i) {
                Value right = eval_node(*node.children[i + 1], scope);
                if (!compare(node.ops[i], left, right)) {
                    return false;
                }
                left = std::move(right);
            }
            return true;
        }

        case ExprKind::Call:
            return eval_call(node, scope);

        case ExprKind::ListLit: {
            Value::List items;
            items.reserve(node.children.size());
            for (const auto& child : node.children) {
                items.push_back(eval_node(*child, scope));
            }
            return items;
        }

        case ExprKind::MapLit: {
            Value::Map items;
            for (size_t i = 0; i + 1 < node.children.size(); i += 2) {
                Value key = eval_node(*node.children[i], scope);
                if (!key.is_string()) {
                    throw EvaluationError("Map literal keys must be strings, not " + key.type_name());
                }
                items[key.as_string()] = eval_node(*node.children[i + 1], scope);
            }
            return items;
        }
    }
    throw EvaluationError("Unsupported expression node");
}

Value ExpressionEngine::eval_call(const ExprNode& node, const Scope& scope) {
    Value arg = eval_node(*node.children[0], scope);

    if (node.name == "len") {
        switch (arg.type()) {
            case Value::Type::String: return static_cast<int64_t>(StringUtils::utf8_length(arg.as_string()));
            case Value::Type::List:   return static_cast<int64_t>(arg.as_list().size());
            case Value::Type::Map:    return static_cast<int64_t>(arg.as_map().size());
            default:
                throw EvaluationError("object of type " + arg.type_name() + " has no len()");
        }
    }

    if (node.name == "empty") {
        return arg.empty();
    }

    if (node.name == "exists") {
        if (arg.is_null()) {
            return false;
        }
        const std::string path = arg.to_string();
        if (path.empty()) {
            return false;
        }
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    }

    throw EvaluationError("Function '" + node.name + "' is not allowed");
}

bool ExpressionEngine::compare(CompareOp op, const Value& lhs, const Value& rhs) {
    switch (op) {
        case CompareOp::Eq:    return lhs == rhs;
        case CompareOp::NotEq: return lhs != rhs;
        default:
            break;
    }

    int cmp;
    try {
        cmp = order(lhs, rhs);
    } catch (const EvaluationError&) {
        throw EvaluationError(fmt::format("'{}' not supported between {} and {}",
                                          compare_symbol(op), lhs.type_name(), rhs.type_name()));
    }

    switch (op) {
        case CompareOp::Lt:  return cmp < 0;
        case CompareOp::LtE: return cmp <= 0;
        case CompareOp::Gt:  return cmp > 0;
        case CompareOp::GtE: return cmp >= 0;
        default:             return false;
    }
}

int ExpressionEngine::order(const Value& lhs, const Value& rhs) {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.type() == Value::Type::Integer && rhs.type() == Value::Type::Integer) {
            int64_t a = lhs.as_int();
            int64_t b = rhs.as_int();
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        double a = lhs.as_number();
        double b = rhs.as_number();
        return a < b ? -1 : (a > b ? 1 : 0);
    }

    if (lhs.is_string() && rhs.is_string()) {
        int cmp = lhs.as_string().compare(rhs.as_string());
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }

    if (lhs.is_list() && rhs.is_list()) {
        const auto& a = lhs.as_list();
        const auto& b = rhs.as_list();
        for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
            if (a[i] != b[i]) {
                return order(a[i], b[i]);
            }
        }
        return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
    }

    throw EvaluationError("unorderable types " + lhs.type_name() + " and " + rhs.type_name());
}
