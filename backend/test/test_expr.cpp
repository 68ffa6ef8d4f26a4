#include "alerts/expr.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

static bool parse_fails(const std::string &text)
{
    try
    {
        (void)Expr::parse(text);
    }
    catch (const ExprParseError &)
    {
        return true;
    }
    return false;
}

static bool eval_fails(const std::string &text, const AlertContext &ctx)
{
    try
    {
        (void)Expr::parse(text).eval(ctx);
    }
    catch (const ExprEvalError &)
    {
        return true;
    }
    return false;
}

int main()
{
    const AlertContext ctx = {{"zscore", 2.5}, {"price", 50000.0}, {"volatility", 0.4}, {"btcusdt_price", 50000.0}};

    // Comparisons and arithmetic
    assert(Expr::parse("zscore > 2").test(ctx));
    assert(!Expr::parse("zscore < 2").test(ctx));
    assert(Expr::parse("price >= 50000").test(ctx));
    assert(Expr::parse("price == btcusdt_price").test(ctx));
    assert(Expr::parse("price != 1").test(ctx));
    assert(Expr::parse("price <= 50000.0").test(ctx));
    assert(Expr::parse("-zscore < -2").test(ctx));
    assert(Expr::parse("+zscore > 2").test(ctx));
    assert(Expr::parse("1 + 2 * 3 == 7").test(ctx));
    assert(Expr::parse("(1 + 2) * 3 == 9").test(ctx));
    assert(Expr::parse("10 - 4 - 3 == 3").test(ctx));
    assert(Expr::parse("8 / 4 / 2 == 1").test(ctx));
    assert(Expr::parse("7 % 3 == 1").test(ctx));
    assert(Expr::parse("-7 % 3 == 2").test(ctx)); // sign of the divisor
    assert(Expr::parse("1.5e3 == 1500").test(ctx));
    assert(Expr::parse(".5 == 0.5").test(ctx));
    assert(Expr::parse("price / 1000 > 49.9").test(ctx));
    assert(Expr::parse("zscore").eval(ctx) == 2.5);
    assert(Expr::parse("7 // 2 == 3").test(ctx));
    assert(Expr::parse("-7 // 2 == -4").test(ctx));

    // Powers: right-associative, tighter than a unary sign on the left
    assert(Expr::parse("zscore ** 2 > 4").test(ctx));
    assert(Expr::parse("2 ** 3 ** 2 == 512").test(ctx));
    assert(Expr::parse("-2 ** 2 == -4").test(ctx));
    assert(Expr::parse("(-2) ** 2 == 4").test(ctx));
    assert(Expr::parse("2 ** -1 == 0.5").test(ctx));
    assert(Expr::parse("2 * 3 ** 2 == 18").test(ctx));

    // Chained comparisons
    assert(!Expr::parse("-2 < zscore < 2").test(ctx));
    assert(Expr::parse("2 < zscore < 3").test(ctx));
    assert(Expr::parse("1 < 2 <= 2 < 3").test(ctx));
    assert(!Expr::parse("1 < 2 > 3").test(ctx));
    assert(Expr::parse("not 2 < zscore < 2.4").test(ctx));
    // a false first link skips the rest
    assert(!Expr::parse("zscore < 0 < missing").test(ctx));

    // Boolean operators and literals
    assert(Expr::parse("zscore > 2 and price > 40000").test(ctx));
    assert(Expr::parse("zscore > 3 or price > 40000").test(ctx));
    assert(!Expr::parse("not zscore > 2").test(ctx));
    assert(Expr::parse("zscore > 2 && !(volatility > 1)").test(ctx));
    assert(Expr::parse("zscore > 9 || volatility < 1").test(ctx));
    assert(Expr::parse("true").test(ctx));
    assert(!Expr::parse("false or False").test(ctx));
    assert(Expr::parse("zscore > 2 and (price < 1 or volatility < 1)").test(ctx));

    // Short-circuit skips unknown names on the dead branch
    assert(!Expr::parse("zscore > 9 and missing > 0").test(ctx));
    assert(Expr::parse("zscore > 2 or missing > 0").test(ctx));

    // Variables in first-use order
    {
        auto e = Expr::parse("zscore > 2 and price > zscore * 10 or volatility > 1");
        assert(e.text() == "zscore > 2 and price > zscore * 10 or volatility > 1");
        assert(e.variables().size() == 3);
        assert(e.variables()[0] == "zscore" && e.variables()[1] == "price" && e.variables()[2] == "volatility");
    }

    // Evaluation errors
    assert(eval_fails("unknown > 1", ctx));
    assert(eval_fails("price / 0 > 1", ctx));
    assert(eval_fails("price % 0 > 1", ctx));
    assert(eval_fails("price // 0 > 1", ctx));
    assert(eval_fails("0 ** -1 > 1", ctx));
    assert(eval_fails("(-8) ** 0.5 > 1", ctx));
    assert(eval_fails("10 ** 400 > 1", ctx));
    assert(eval_fails("2 < zscore < missing", ctx));

    // Rejected at parse time
    assert(parse_fails(""));
    assert(parse_fails("   "));
    assert(parse_fails("zscore >"));
    assert(parse_fails("zscore = 2"));
    assert(parse_fails("(zscore > 2"));
    assert(parse_fails("zscore > 2)"));
    assert(parse_fails("zscore > 2 &  price > 1"));
    assert(parse_fails("__import__('os')"));
    assert(parse_fails("price.real > 1"));
    assert(parse_fails("abs(zscore) > 2"));
    assert(parse_fails("zscore *** 2 > 1"));
    assert(parse_fails("zscore < < 2"));
    assert(parse_fails("2abc > 1"));
    assert(parse_fails("zscore > 2 ; price > 1"));

    try
    {
        (void)Expr::parse("zscore > $");
        assert(false);
    }
    catch (const ExprParseError &e)
    {
        assert(e.position() == 9);
    }

    // Nesting and size limits
    {
        const std::string deep = std::string(200000, '(') + "1" + std::string(200000, ')');
        assert(parse_fails(deep));
        assert(parse_fails(std::string(100000, '-') + "1 > 0"));
        assert(parse_fails(std::string(100000, '!') + "1"));

        std::string tower = "2";
        for (int i = 0; i < 1000; ++i)
            tower += " ** 1";
        assert(parse_fails(tower));

        std::string chain = "zscore > 9";
        for (int i = 0; i < 100000; ++i)
            chain += " or zscore > 9";
        assert(parse_fails(chain));

        // within the limits
        const std::string ok = std::string(200, '(') + "zscore" + std::string(200, ')') + " > 2";
        assert(Expr::parse(ok).test(ctx));
        std::string shorter = "zscore > 9";
        for (int i = 0; i < 100; ++i)
            shorter += " or zscore > 9";
        assert(!Expr::parse(shorter).test(ctx));

        try
        {
            (void)Expr::parse(deep);
            assert(false);
        }
        catch (const ExprParseError &e)
        {
            assert(std::string(e.what()).find("nesting too deep") != std::string::npos);
        }
    }

    std::cout << "OK\n";
    return 0;
}
