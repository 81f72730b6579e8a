#pragma once
#include "ExpressionParser.hpp"
#include "Scope.hpp"
#include "Value.hpp"
#include <memory>
#include <string>
#include <unordered_map>

class ExpressionEngine {
public:
    using Result = Value;

    explicit ExpressionEngine(const std::string& expression);
    ~ExpressionEngine() = default;

    Result evaluate(const Scope& scope) const;

    static Result evaluate(const std::string& expression, const Scope& scope);

    // Disable copy and move
    ExpressionEngine(const ExpressionEngine&) = delete;
    ExpressionEngine& operator=(const ExpressionEngine&) = delete;

private:
    // Expression template
    struct ExpressionTemplate {
        std::string expression;
        std::shared_ptr<const ExprNode> root;
    };

    // Thread-local context
    struct ThreadLocalContext {
        std::unordered_map<std::string, std::shared_ptr<const ExpressionTemplate>> template_cache;
    };

    std::shared_ptr<const ExpressionTemplate> template_;

    // Get thread-local context
    static ThreadLocalContext& get_thread_context();

    // Get or create expression template
    static std::shared_ptr<const ExpressionTemplate> get_template(
        const std::string& expression,
        ThreadLocalContext& context
    );

    static Value eval_node(const ExprNode& node, const Scope& scope);
    static Value eval_call(const ExprNode& node, const Scope& scope);
    static bool compare(CompareOp op, const Value& lhs, const Value& rhs);
    static int order(const Value& lhs, const Value& rhs);
};
