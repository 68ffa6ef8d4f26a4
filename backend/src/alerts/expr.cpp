#include "expr.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

enum class Tok {
    Number, Ident, True, False,
    Plus, Minus, Star, Slash, Percent, Pow, FloorDiv,
    LParen, RParen,
    Lt, Le, Gt, Ge, Eq, Ne,
    And, Or, Not,
    End
};

struct Token {
    Tok kind;
    std::size_t pos;
    std::string text; // identifier name
    double number{0};
};

bool ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool ident_char(char c)  { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }
bool digit(char c)       { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::vector<Token> lex(std::string_view s) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

        const std::size_t start = i;
        if (digit(c) || (c == '.' && i + 1 < s.size() && digit(s[i + 1]))) {
            while (i < s.size() && digit(s[i])) ++i;
            if (i < s.size() && s[i] == '.') {
                ++i;
                while (i < s.size() && digit(s[i])) ++i;
            }
            if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
                if (j < s.size() && digit(s[j])) {
                    i = j;
                    while (i < s.size() && digit(s[i])) ++i;
                }
            }
            if (i < s.size() && ident_char(s[i])) {
                throw ExprParseError("malformed number", start);
            }
            const std::string lit(s.substr(start, i - start));
            out.push_back({Tok::Number, start, {}, std::strtod(lit.c_str(), nullptr)});
            continue;
        }

        if (ident_start(c)) {
            while (i < s.size() && ident_char(s[i])) ++i;
            std::string word(s.substr(start, i - start));
            if (word == "and")                        out.push_back({Tok::And, start});
            else if (word == "or")                    out.push_back({Tok::Or, start});
            else if (word == "not")                   out.push_back({Tok::Not, start});
            else if (word == "true" || word == "True")   out.push_back({Tok::True, start});
            else if (word == "false" || word == "False") out.push_back({Tok::False, start});
            else out.push_back({Tok::Ident, start, std::move(word)});
            continue;
        }

        auto two = [&](char next) { return i + 1 < s.size() && s[i + 1] == next; };
        switch (c) {
            case '+': out.push_back({Tok::Plus, start});    ++i; break;
            case '-': out.push_back({Tok::Minus, start});   ++i; break;
            case '*':
                if (two('*')) { out.push_back({Tok::Pow, start}); i += 2; }
                else          { out.push_back({Tok::Star, start}); ++i; }
                break;
            case '/':
                if (two('/')) { out.push_back({Tok::FloorDiv, start}); i += 2; }
                else          { out.push_back({Tok::Slash, start}); ++i; }
                break;
            case '%': out.push_back({Tok::Percent, start}); ++i; break;
            case '(': out.push_back({Tok::LParen, start});  ++i; break;
            case ')': out.push_back({Tok::RParen, start});  ++i; break;
            case '<':
                if (two('=')) { out.push_back({Tok::Le, start}); i += 2; }
                else          { out.push_back({Tok::Lt, start}); ++i; }
                break;
            case '>':
                if (two('=')) { out.push_back({Tok::Ge, start}); i += 2; }
                else          { out.push_back({Tok::Gt, start}); ++i; }
                break;
            case '=':
                if (!two('=')) throw ExprParseError("'=' is not an operator, use '=='", start);
                out.push_back({Tok::Eq, start}); i += 2;
                break;
            case '!':
                if (two('=')) { out.push_back({Tok::Ne, start}); i += 2; }
                else          { out.push_back({Tok::Not, start}); ++i; }
                break;
            case '&':
                if (!two('&')) throw ExprParseError("expected '&&'", start);
                out.push_back({Tok::And, start}); i += 2;
                break;
            case '|':
                if (!two('|')) throw ExprParseError("expected '||'", start);
                out.push_back({Tok::Or, start}); i += 2;
                break;
            default:
                throw ExprParseError(std::string("unexpected character '") + c + "'", start);
        }
    }
    out.push_back({Tok::End, s.size()});
    return out;
}

// ---- AST ----

using NodePtr = std::unique_ptr<ExprNode>;

struct Number final : ExprNode {
    double v;
    explicit Number(double v) : v(v) {}
    double eval(const AlertContext&) const override { return v; }
};

struct Variable final : ExprNode {
    std::string name;
    explicit Variable(std::string n) : name(std::move(n)) {}
    double eval(const AlertContext& ctx) const override {
        auto it = ctx.find(name);
        if (it == ctx.end()) throw ExprEvalError("unknown variable '" + name + "'");
        return it->second;
    }
};

struct Negate final : ExprNode {
    NodePtr operand;
    explicit Negate(NodePtr o) : operand(std::move(o)) {}
    double eval(const AlertContext& ctx) const override { return -operand->eval(ctx); }
};

struct LogicalNot final : ExprNode {
    NodePtr operand;
    explicit LogicalNot(NodePtr o) : operand(std::move(o)) {}
    double eval(const AlertContext& ctx) const override { return operand->eval(ctx) != 0.0 ? 0.0 : 1.0; }
};

double compare(Tok op, double a, double b) {
    switch (op) {
        case Tok::Lt: return a <  b;
        case Tok::Le: return a <= b;
        case Tok::Gt: return a >  b;
        case Tok::Ge: return a >= b;
        case Tok::Eq: return a == b;
        case Tok::Ne: return a != b;
        default: break;
    }
    throw ExprEvalError("bad comparison");
}

double power(double a, double b) {
    if (a == 0.0 && b < 0.0) throw ExprEvalError("zero to a negative power");
    const double r = std::pow(a, b);
    if (std::isnan(r) && !std::isnan(a) && !std::isnan(b)) throw ExprEvalError("negative base with fractional exponent");
    if (std::isinf(r) && std::isfinite(a) && std::isfinite(b)) throw ExprEvalError("power overflow");
    return r;
}

struct Binary final : ExprNode {
    Tok op;
    NodePtr lhs, rhs;
    Binary(Tok op, NodePtr l, NodePtr r) : op(op), lhs(std::move(l)), rhs(std::move(r)) {}

    double eval(const AlertContext& ctx) const override {
        // short-circuit
        if (op == Tok::And) return (lhs->eval(ctx) != 0.0 && rhs->eval(ctx) != 0.0) ? 1.0 : 0.0;
        if (op == Tok::Or)  return (lhs->eval(ctx) != 0.0 || rhs->eval(ctx) != 0.0) ? 1.0 : 0.0;

        const double a = lhs->eval(ctx);
        const double b = rhs->eval(ctx);
        switch (op) {
            case Tok::Plus:  return a + b;
            case Tok::Minus: return a - b;
            case Tok::Star:  return a * b;
            case Tok::Slash:
                if (b == 0.0) throw ExprEvalError("division by zero");
                return a / b;
            case Tok::Percent: {
                if (b == 0.0) throw ExprEvalError("modulo by zero");
                // result takes the sign of the divisor
                double r = std::fmod(a, b);
                if (r != 0.0 && ((r < 0.0) != (b < 0.0))) r += b;
                return r;
            }
            case Tok::FloorDiv:
                if (b == 0.0) throw ExprEvalError("division by zero");
                return std::floor(a / b);
            case Tok::Pow: return power(a, b);
            default: break;
        }
        throw ExprEvalError("bad operator");
    }
};

// a < b <= c: each operand evaluated at most once, stops at the first false link
struct Compare final : ExprNode {
    std::vector<NodePtr> operands;
    std::vector<Tok> ops;

    double eval(const AlertContext& ctx) const override {
        double lhs = operands.front()->eval(ctx);
        for (std::size_t i = 0; i < ops.size(); ++i) {
            const double rhs = operands[i + 1]->eval(ctx);
            if (compare(ops[i], lhs, rhs) == 0.0) return 0.0;
            lhs = rhs;
        }
        return 1.0;
    }
};

bool is_comparison(Tok t) {
    return t == Tok::Lt || t == Tok::Le || t == Tok::Gt || t == Tok::Ge || t == Tok::Eq || t == Tok::Ne;
}

// ---- parser ----

constexpr std::size_t kMaxDepth = 256;
constexpr std::size_t kMaxNodes = 1024;

class Parser {
public:
    explicit Parser(std::vector<Token> toks) : toks_(std::move(toks)) {}

    NodePtr parse_all() {
        if (peek().kind == Tok::End) throw ExprParseError("empty condition", 0);
        NodePtr n = parse_or();
        if (peek().kind != Tok::End) throw ExprParseError("unexpected token", peek().pos);
        return n;
    }

    std::vector<std::string> vars;

private:
    // Bounds recursion in the parser, and through the tree in eval and teardown
    class Nest {
    public:
        Nest(std::size_t& depth, std::size_t pos) : depth_(depth) {
            if (++depth_ > kMaxDepth) {
                --depth_;
                throw ExprParseError("nesting too deep", pos);
            }
        }
        ~Nest() { --depth_; }

    private:
        std::size_t& depth_;
    };

    template <class Node, class... Args>
    NodePtr make(Args&&... args) {
        if (++nodes_ > kMaxNodes) throw ExprParseError("condition too long", peek().pos);
        return std::make_unique<Node>(std::forward<Args>(args)...);
    }

    const Token& peek() const { return toks_[i_]; }
    const Token& next() { return toks_[i_++]; }
    bool accept(Tok k) {
        if (peek().kind != k) return false;
        ++i_;
        return true;
    }

    NodePtr parse_or() {
        NodePtr lhs = parse_and();
        while (accept(Tok::Or)) lhs = make<Binary>(Tok::Or, std::move(lhs), parse_and());
        return lhs;
    }

    NodePtr parse_and() {
        NodePtr lhs = parse_not();
        while (accept(Tok::And)) lhs = make<Binary>(Tok::And, std::move(lhs), parse_not());
        return lhs;
    }

    NodePtr parse_not() {
        const std::size_t pos = peek().pos;
        if (accept(Tok::Not)) {
            Nest nest(depth_, pos);
            return make<LogicalNot>(parse_not());
        }
        return parse_cmp();
    }

    NodePtr parse_cmp() {
        NodePtr first = parse_sum();
        if (!is_comparison(peek().kind)) return first;

        auto cmp = std::make_unique<Compare>();
        cmp->operands.push_back(std::move(first));
        while (is_comparison(peek().kind)) {
            cmp->ops.push_back(next().kind);
            cmp->operands.push_back(parse_sum());
        }
        if (++nodes_ > kMaxNodes) throw ExprParseError("condition too long", peek().pos);
        return cmp;
    }

    NodePtr parse_sum() {
        NodePtr lhs = parse_product();
        while (peek().kind == Tok::Plus || peek().kind == Tok::Minus) {
            const Tok op = next().kind;
            lhs = make<Binary>(op, std::move(lhs), parse_product());
        }
        return lhs;
    }

    NodePtr parse_product() {
        NodePtr lhs = parse_unary();
        while (peek().kind == Tok::Star || peek().kind == Tok::Slash ||
               peek().kind == Tok::FloorDiv || peek().kind == Tok::Percent) {
            const Tok op = next().kind;
            lhs = make<Binary>(op, std::move(lhs), parse_unary());
        }
        return lhs;
    }

    NodePtr parse_unary() {
        const std::size_t pos = peek().pos;
        if (peek().kind == Tok::Minus || peek().kind == Tok::Plus) {
            const bool neg = next().kind == Tok::Minus;
            Nest nest(depth_, pos);
            NodePtr operand = parse_unary();
            return neg ? make<Negate>(std::move(operand)) : std::move(operand);
        }
        return parse_power();
    }

    // "**" binds tighter than a unary sign on its left and groups to the right
    NodePtr parse_power() {
        NodePtr base = parse_primary();
        const std::size_t pos = peek().pos;
        if (!accept(Tok::Pow)) return base;
        Nest nest(depth_, pos);
        return make<Binary>(Tok::Pow, std::move(base), parse_unary());
    }

    NodePtr parse_primary() {
        const Token& t = next();
        switch (t.kind) {
            case Tok::Number: return make<Number>(t.number);
            case Tok::True:   return make<Number>(1.0);
            case Tok::False:  return make<Number>(0.0);
            case Tok::Ident:
                if (std::find(vars.begin(), vars.end(), t.text) == vars.end()) vars.push_back(t.text);
                return make<Variable>(t.text);
            case Tok::LParen: {
                Nest nest(depth_, t.pos);
                NodePtr inner = parse_or();
                if (!accept(Tok::RParen)) throw ExprParseError("expected ')'", peek().pos);
                return inner;
            }
            case Tok::End:
                throw ExprParseError("unexpected end of condition", t.pos);
            default:
                throw ExprParseError("expected a value", t.pos);
        }
    }

    std::vector<Token> toks_;
    std::size_t i_{0};
    std::size_t depth_{0};
    std::size_t nodes_{0};
};

} // namespace

Expr Expr::parse(std::string_view text) {
    Parser p(lex(text));
    NodePtr root = p.parse_all();
    return Expr(std::string(text), std::shared_ptr<const ExprNode>(std::move(root)), std::move(p.vars));
}
