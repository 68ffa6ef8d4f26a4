#pragma once
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// Variables visible to an alert condition, e.g. {"zscore", 2.4}
using AlertContext = std::unordered_map<std::string, double>;

// Condition text that does not match the grammar
class ExprParseError : public std::runtime_error {
public:
    ExprParseError(const std::string& msg, std::size_t pos)
    : std::runtime_error(msg + " at offset " + std::to_string(pos)), pos_(pos) {}

    std::size_t position() const noexcept { return pos_; }

private:
    std::size_t pos_;
};

// Unknown variable, division by zero or an undefined power during evaluation
class ExprEvalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExprNode {
    virtual ~ExprNode() = default;
    virtual double eval(const AlertContext& ctx) const = 0;
};

// A parsed condition. Grammar, loosest binding first:
//
//   or      := and (("or" | "||") and)*
//   and     := not (("and" | "&&") not)*
//   not     := ("not" | "!") not | cmp
//   cmp     := sum (("<" | "<=" | ">" | ">=" | "==" | "!=") sum)*
//   sum     := product (("+" | "-") product)*
//   product := unary (("*" | "/" | "//" | "%") unary)*
//   unary   := ("-" | "+") unary | power
//   power   := primary ["**" unary]
//   primary := number | identifier | "true" | "false" | "(" or ")"
//
// Booleans are 1.0 / 0.0; any non-zero value is true. Comparisons chain:
// "-2 < zscore < 2" means "-2 < zscore and zscore < 2" with zscore read once.
// "-x ** 2" is "-(x ** 2)". Nesting is limited to 256 levels and a condition
// to 1024 nodes. Nothing outside the grammar is evaluated.
class Expr {
public:
    // Throws ExprParseError
    static Expr parse(std::string_view text);

    // Throws ExprEvalError
    double eval(const AlertContext& ctx) const { return root_->eval(ctx); }
    bool test(const AlertContext& ctx) const { return eval(ctx) != 0.0; }

    const std::string& text() const { return text_; }
    // Identifiers referenced by the condition, in first-use order
    const std::vector<std::string>& variables() const { return vars_; }

private:
    Expr(std::string text, std::shared_ptr<const ExprNode> root, std::vector<std::string> vars)
    : text_(std::move(text)), root_(std::move(root)), vars_(std::move(vars)) {}

    std::string text_;
    std::shared_ptr<const ExprNode> root_;
    std::vector<std::string> vars_;
};
