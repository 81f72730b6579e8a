#include "ExpressionParser.hpp"
#include "EngineError.hpp"
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <set>
#include <fmt/format.h>

namespace {

const std::set<std::string> kAllowedCalls = {"len", "empty", "exists"};

const std::set<std::string> kForbiddenOperators = {
    "+", "-", "*", "/", "%", "**", "//", "&", "|", "^", "~", "<<", ">>", "@"
};

const std::set<std::string> kForbiddenKeywords = {
    "lambda", "if", "else", "for", "in", "is", "import", "yield", "await", "async",
    "def", "class", "del", "global", "nonlocal", "assert", "pass", "return", "raise",
    "while", "with", "try", "except", "finally", "from", "as", "break", "continue"
};

const char* const kTwoCharOps[] = {"==", "!=", "<=", ">=", "**", "//", "<<", ">>"};
const std::string kSingleCharOps = "()[]{},:.<>+-*/%&|^~@=!";

bool is_name_start(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
}

bool is_name_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

std::unique_ptr<ExprNode> make_node(ExprKind kind) {
    auto node = std::make_unique<ExprNode>();
    node->kind = kind;
    return node;
}

} // namespace

bool ExpressionParser::is_allowed_call(const std::string& name) {
    return kAllowedCalls.count(name) > 0;
}

std::unique_ptr<ExprNode> ExpressionParser::parse(const std::string& expression) {
    ExpressionParser parser(expression);
    parser.tokenize();
    if (parser.peek().type == TokenType::End) {
        parser.syntax_error("empty expression");
    }

    auto root = parser.parse_or();
    if (parser.peek().type != TokenType::End) {
        parser.reject_forbidden_operator();
        parser.syntax_error("unexpected '" + parser.peek().text + "'");
    }
    return root;
}

ExpressionParser::ExpressionParser(const std::string& expression) : expression_(expression) {}

// --------------------------
// Tokenizer
// --------------------------
void ExpressionParser::tokenize() {
    while (cursor_ < expression_.size()) {
        char ch = expression_[cursor_];
        if (std::isspace(static_cast<unsigned char>(ch))) {
            ++cursor_;
        } else if (std::isdigit(static_cast<unsigned char>(ch)) ||
                   (ch == '.' && cursor_ + 1 < expression_.size() &&
                    std::isdigit(static_cast<unsigned char>(expression_[cursor_ + 1])))) {
            read_number();
        } else if (ch == '\'' || ch == '"') {
            read_string();
        } else if (is_name_start(ch)) {
            size_t start = cursor_;
            while (cursor_ < expression_.size() && is_name_char(expression_[cursor_])) {
                ++cursor_;
            }
            Token token;
            token.type = TokenType::Name;
            token.text = expression_.substr(start, cursor_ - start);
            token.pos = start;
            tokens_.push_back(std::move(token));
        } else {
            read_operator();
        }
    }

    Token end;
    end.type = TokenType::End;
    end.text = "end of expression";
    end.pos = expression_.size();
    tokens_.push_back(std::move(end));
}

void ExpressionParser::read_number() {
    size_t start = cursor_;
    bool is_float = false;
    while (cursor_ < expression_.size() && std::isdigit(static_cast<unsigned char>(expression_[cursor_]))) {
        ++cursor_;
    }
    if (cursor_ < expression_.size() && expression_[cursor_] == '.') {
        is_float = true;
        ++cursor_;
        while (cursor_ < expression_.size() && std::isdigit(static_cast<unsigned char>(expression_[cursor_]))) {
            ++cursor_;
        }
    }
    if (cursor_ < expression_.size() && (expression_[cursor_] == 'e' || expression_[cursor_] == 'E')) {
        size_t exp = cursor_ + 1;
        if (exp < expression_.size() && (expression_[exp] == '+' || expression_[exp] == '-')) {
            ++exp;
        }
        if (exp < expression_.size() && std::isdigit(static_cast<unsigned char>(expression_[exp]))) {
            is_float = true;
            cursor_ = exp;
            while (cursor_ < expression_.size() && std::isdigit(static_cast<unsigned char>(expression_[cursor_]))) {
                ++cursor_;
            }
        }
    }
    if (cursor_ < expression_.size() && is_name_char(expression_[cursor_])) {
        cursor_ = start;
        syntax_error("invalid number literal");
    }

    Token token;
    token.type = TokenType::Number;
    token.text = expression_.substr(start, cursor_ - start);
    token.pos = start;

    errno = 0;
    if (is_float) {
        token.value = Value(std::strtod(token.text.c_str(), nullptr));
    } else {
        long long parsed = std::strtoll(token.text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            cursor_ = start;
            syntax_error("integer literal out of range");
        }
        token.value = Value(parsed);
    }
    tokens_.push_back(std::move(token));
}

void ExpressionParser::read_string() {
    const char quote = expression_[cursor_];
    size_t start = cursor_++;
    std::string text;

    while (true) {
        if (cursor_ >= expression_.size()) {
            cursor_ = start;
            syntax_error("unterminated string literal");
        }
        char ch = expression_[cursor_++];
        if (ch == quote) {
            break;
        }
        if (ch != '\\') {
            text += ch;
            continue;
        }
        if (cursor_ >= expression_.size()) {
            continue;
        }
        char esc = expression_[cursor_++];
        switch (esc) {
            case 'n':  text += '\n'; break;
            case 't':  text += '\t'; break;
            case 'r':  text += '\r'; break;
            case '0':  text += '\0'; break;
            case '\\': text += '\\'; break;
            case '\'': text += '\''; break;
            case '"':  text += '"'; break;
            default:
                text += '\\';
                text += esc;
                break;
        }
    }

    Token token;
    token.type = TokenType::String;
    token.text = expression_.substr(start, cursor_ - start);
    token.value = Value(std::move(text));
    token.pos = start;
    tokens_.push_back(std::move(token));
}

void ExpressionParser::read_operator() {
    Token token;
    token.type = TokenType::Op;
    token.pos = cursor_;

    for (const char* op : kTwoCharOps) {
        if (expression_.compare(cursor_, 2, op) == 0) {
            token.text = op;
            cursor_ += 2;
            tokens_.push_back(std::move(token));
            return;
        }
    }

    char ch = expression_[cursor_];
    if (kSingleCharOps.find(ch) == std::string::npos) {
        syntax_error(fmt::format("unexpected character '{}'", ch));
    }
    token.text = std::string(1, ch);
    ++cursor_;
    tokens_.push_back(std::move(token));
}

// --------------------------
// Parser
// --------------------------
bool ExpressionParser::at_op(const char* op) const {
    return peek().type == TokenType::Op && peek().text == op;
}

bool ExpressionParser::at_keyword(const char* keyword) const {
    return peek().type == TokenType::Name && peek().text == keyword;
}

void ExpressionParser::expect_op(const char* op) {
    if (!at_op(op)) {
        reject_forbidden_operator();
        syntax_error(fmt::format("expected '{}' but found '{}'", op, peek().text));
    }
    advance();
}

std::unique_ptr<ExprNode> ExpressionParser::parse_or() {
    auto first = parse_and();
    if (!at_keyword("or")) {
        return first;
    }

    auto node = make_node(ExprKind::BoolOp);
    node->bool_op = BoolOpKind::Or;
    node->children.push_back(std::move(first));
    while (at_keyword("or")) {
        advance();
        node->children.push_back(parse_and());
    }
    return node;
}

std::unique_ptr<ExprNode> ExpressionParser::parse_and() {
    auto first = parse_not();
    if (!at_keyword("and")) {
        return first;
    }

    auto node = make_node(ExprKind::BoolOp);
    node->bool_op = BoolOpKind::And;
    node->children.push_back(std::move(first));
    while (at_keyword("and")) {
        advance();
        node->children.push_back(parse_not());
    }
    return node;
}

std::unique_ptr<ExprNode> ExpressionParser::parse_not() {
    if (at_keyword("not")) {
        advance();
        auto node = make_node(ExprKind::Not);
        node->children.push_back(parse_not());
        return node;
    }
    return parse_comparison();
}

std::unique_ptr<ExprNode> ExpressionParser::parse_comparison() {
    auto left = parse_postfix();
    std::unique_ptr<ExprNode> node;

    while (true) {
        CompareOp op;
        if (at_op("==")) op = CompareOp::Eq;
        else if (at_op("!=")) op = CompareOp::NotEq;
        else if (at_op("<")) op = CompareOp::Lt;
        else if (at_op("<=")) op = CompareOp::LtE;
        else if (at_op(">")) op = CompareOp::Gt;
        else if (at_op(">=")) op = CompareOp::GtE;
        else break;

        advance();
        if (!node) {
            node = make_node(ExprKind::Compare);
            node->children.push_back(std::move(left));
        }
        node->ops.push_back(op);
        node->children.push_back(parse_postfix());
    }

    reject_forbidden_operator();
    return node ? std::move(node) : std::move(left);
}

std::unique_ptr<ExprNode> ExpressionParser::parse_postfix() {
    auto node = parse_primary();
    bool bare_name = node->kind == ExprKind::Name;

    while (true) {
        if (at_op(".")) {
            advance();
            if (peek().type != TokenType::Name) {
                syntax_error("expected attribute name after '.'");
            }
            auto attr = make_node(ExprKind::Attr);
            attr->name = advance().text;
            attr->children.push_back(std::move(node));
            node = std::move(attr);
        } else if (at_op("[")) {
            advance();
            auto index = make_node(ExprKind::Index);
            index->children.push_back(std::move(node));
            index->children.push_back(parse_or());
            if (at_op(":")) {
                forbidden("slice");
            }
            expect_op("]");
            node = std::move(index);
        } else if (at_op("(")) {
            if (!bare_name) {
                forbidden("method call");
            }
            if (!is_allowed_call(node->name)) {
                forbidden(fmt::format("call to '{}' (only len, empty, exists are allowed)", node->name));
            }
            advance();
            auto call = make_node(ExprKind::Call);
            call->name = node->name;
            while (!at_op(")")) {
                call->children.push_back(parse_or());
                if (at_op("=")) {
                    forbidden("keyword argument");
                }
                if (!at_op(",")) {
                    break;
                }
                advance();
            }
            expect_op(")");
            if (call->children.size() != 1) {
                forbidden(fmt::format("{}() takes exactly one argument ({} given)", call->name, call->children.size()));
            }
            node = std::move(call);
        } else {
            break;
        }
        bare_name = false;
    }
    return node;
}

std::unique_ptr<ExprNode> ExpressionParser::parse_primary() {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::End:
            syntax_error("unexpected end of expression");

        case TokenType::Number: {
            auto node = make_node(ExprKind::Literal);
            node->literal = advance().value;
            return node;
        }

        case TokenType::String: {
            std::string text = advance().value.as_string();
            while (peek().type == TokenType::String) {
                text += advance().value.as_string();
            }
            auto node = make_node(ExprKind::Literal);
            node->literal = Value(std::move(text));
            return node;
        }

        case TokenType::Name: {
            const std::string& name = token.text;
            auto node = make_node(ExprKind::Literal);
            if (name == "True" || name == "true") {
                node->literal = Value(true);
            } else if (name == "False" || name == "false") {
                node->literal = Value(false);
            } else if (name == "None" || name == "null") {
                node->literal = Value();
            } else if (kForbiddenKeywords.count(name) > 0) {
                forbidden("'" + name + "'");
            } else if (name == "and" || name == "or" || name == "not") {
                syntax_error("unexpected '" + name + "'");
            } else {
                node->kind = ExprKind::Name;
                node->name = name;
            }
            advance();
            return node;
        }

        case TokenType::Op:
            break;
    }

    if (at_op("(")) {
        advance();
        if (at_op(")")) {
            advance();
            return make_node(ExprKind::ListLit);
        }
        auto first = parse_or();
        if (!at_op(",")) {
            expect_op(")");
            return first;
        }
        auto tuple = make_node(ExprKind::ListLit);
        tuple->children.push_back(std::move(first));
        while (at_op(",")) {
            advance();
            if (at_op(")")) {
                break;
            }
            tuple->children.push_back(parse_or());
        }
        expect_op(")");
        return tuple;
    }

    if (at_op("[")) {
        advance();
        return parse_sequence("]", ExprKind::ListLit);
    }

    if (at_op("{")) {
        advance();
        return parse_map();
    }

    if (at_op("-") && tokens_[index_ + 1].type == TokenType::Number) {
        advance();
        const Value& number = advance().value;
        auto node = make_node(ExprKind::Literal);
        if (number.type() == Value::Type::Integer) {
            node->literal = Value(-number.as_int());
        } else {
            node->literal = Value(-number.as_number());
        }
        return node;
    }

    if (at_op("-") || at_op("+") || at_op("~")) {
        forbidden("unary operator '" + peek().text + "'");
    }

    reject_forbidden_operator();
    syntax_error("unexpected '" + peek().text + "'");
}

std::unique_ptr<ExprNode> ExpressionParser::parse_sequence(const char* closer, ExprKind kind) {
    auto node = make_node(kind);
    while (!at_op(closer)) {
        node->children.push_back(parse_or());
        if (at_keyword("for")) {
            forbidden("comprehension");
        }
        if (!at_op(",")) {
            break;
        }
        advance();
    }
    expect_op(closer);
    return node;
}

std::unique_ptr<ExprNode> ExpressionParser::parse_map() {
    auto node = make_node(ExprKind::MapLit);
    while (!at_op("}")) {
        if (at_op("**")) {
            forbidden("dict unpacking");
        }
        node->children.push_back(parse_or());
        if (at_op(",") || at_op("}")) {
            forbidden("set literal");
        }
        if (at_keyword("for")) {
            forbidden("comprehension");
        }
        expect_op(":");
        node->children.push_back(parse_or());
        if (at_keyword("for")) {
            forbidden("comprehension");
        }
        if (!at_op(",")) {
            break;
        }
        advance();
    }
    expect_op("}");
    return node;
}

void ExpressionParser::reject_forbidden_operator() const {
    const Token& token = peek();
    if (token.type == TokenType::Op) {
        if (kForbiddenOperators.count(token.text) > 0) {
            forbidden("operator '" + token.text + "'");
        }
        if (token.text == "=") {
            forbidden("assignment");
        }
    } else if (token.type == TokenType::Name) {
        if (token.text == "if") {
            forbidden("conditional expression");
        }
        if (token.text == "in" || token.text == "is" || token.text == "not") {
            forbidden("'" + token.text + "' operator");
        }
        if (kForbiddenKeywords.count(token.text) > 0) {
            forbidden("'" + token.text + "'");
        }
    }
}

void ExpressionParser::syntax_error(const std::string& detail) const {
    size_t pos = index_ < tokens_.size() ? tokens_[index_].pos : cursor_;
    throw ExpressionSyntaxError(fmt::format("Invalid expression syntax: {} ({} at position {})",
                                            expression_, detail, pos));
}

void ExpressionParser::forbidden(const std::string& construct) const {
    throw EvaluationError(fmt::format("Forbidden expression construct in '{}': {}", expression_, construct));
}
