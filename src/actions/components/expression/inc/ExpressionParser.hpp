#pragma once

#include "Value.hpp"
#include <memory>
#include <string>
#include <vector>


// Closed set of node tags; the parser never produces anything else
enum class ExprKind {
    Literal,
    Name,
    Attr,
    Index,
    BoolOp,
    Not,
    Compare,
    Call,
    ListLit,
    MapLit
};

enum class BoolOpKind {
    And,
    Or
};

enum class CompareOp {
    Eq,
    NotEq,
    Lt,
    LtE,
    Gt,
    GtE
};

struct ExprNode {
    ExprKind kind = ExprKind::Literal;
    Value literal;                                  // Literal
    std::string name;                               // Name, Attr member, Call function
    BoolOpKind bool_op = BoolOpKind::And;           // BoolOp
    std::vector<CompareOp> ops;                     // Compare, one per comparator
    std::vector<std::unique_ptr<ExprNode>> children;  // MapLit stores key, value pairs
};

class ExpressionParser {
public:
    // Throws ExpressionSyntaxError for malformed text and EvaluationError for
    // well-formed constructs outside the whitelist
    static std::unique_ptr<ExprNode> parse(const std::string& expression);

    static bool is_allowed_call(const std::string& name);

private:
    enum class TokenType {
        Name,
        Number,
        String,
        Op,
        End
    };

    struct Token {
        TokenType type = TokenType::End;
        std::string text;
        Value value;
        size_t pos = 0;
    };

    explicit ExpressionParser(const std::string& expression);

    void tokenize();
    void read_number();
    void read_string();
    void read_operator();

    const Token& peek() const { return tokens_[index_]; }
    const Token& advance() { return tokens_[index_++]; }
    bool at_op(const char* op) const;
    bool at_keyword(const char* keyword) const;
    void expect_op(const char* op);

    std::unique_ptr<ExprNode> parse_or();
    std::unique_ptr<ExprNode> parse_and();
    std::unique_ptr<ExprNode> parse_not();
    std::unique_ptr<ExprNode> parse_comparison();
    std::unique_ptr<ExprNode> parse_postfix();
    std::unique_ptr<ExprNode> parse_primary();
    std::unique_ptr<ExprNode> parse_sequence(const char* closer, ExprKind kind);
    std::unique_ptr<ExprNode> parse_map();

    [[noreturn]] void syntax_error(const std::string& detail) const;
    [[noreturn]] void forbidden(const std::string& construct) const;
    void reject_forbidden_operator() const;

    std::string expression_;
    size_t cursor_ = 0;
    std::vector<Token> tokens_;
    size_t index_ = 0;
};
