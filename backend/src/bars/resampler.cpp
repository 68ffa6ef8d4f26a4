#include "resampler.hpp"

#include <algorithm>
#include <iostream>

const char *to_cstr(GapFill g)
{
    return g == GapFill::CarryForward ? "carry_forward" : "sparse";
}

std::optional<Timeframe> parse_timeframe(std::string_view s)
{
    for (auto tf : {Timeframe::S1, Timeframe::M1, Timeframe::M5,
                    Timeframe::M15, Timeframe::H1, Timeframe::D1})
    {
        if (s == to_cstr(tf))
            return tf;
    }
    return std::nullopt;
}

std::vector<OhlcBar> resample(std::vector<Tick> ticks, Timeframe tf, GapFill fill)
{
    std::vector<OhlcBar> out;
    if (ticks.empty())
        return out;

    const std::string symbol = ticks.front().symbol;
    for (const auto &t : ticks)
    {
        if (t.symbol != symbol)
        {
            std::cerr << "[resampler] mixed symbols in input ('" << symbol << "', '"
                      << t.symbol << "'); labelling bars '" << symbol << "'\n";
            break;
        }
    }

    std::stable_sort(ticks.begin(), ticks.end(),
                     [](const Tick &a, const Tick &b) { return a.ts_ms < b.ts_ms; });

    const std::int64_t width = timeframe_ms(tf);
    OhlcBar cur;
    bool have = false;

    for (const auto &t : ticks)
    {
        const std::int64_t b = bucket_start(t.ts_ms, width);
        if (have && b == cur.bucket_start_ms)
        {
            cur.high = std::max(cur.high, t.price);
            cur.low = std::min(cur.low, t.price);
            cur.close = t.price;
            cur.volume += t.size;
            ++cur.trade_count;
            continue;
        }

        if (have)
        {
            out.push_back(cur);
            // Unsigned: the span of two arbitrary instants can exceed int64
            const std::uint64_t span = static_cast<std::uint64_t>(b) - static_cast<std::uint64_t>(cur.bucket_start_ms);
            const std::uint64_t missing = span / static_cast<std::uint64_t>(width) - 1;
            if (fill == GapFill::CarryForward && missing > static_cast<std::uint64_t>(kMaxCarriedBars))
            {
                std::cerr << "[resampler] " << symbol << " " << to_cstr(tf) << ": gap of " << missing
                          << " buckets after " << cur.bucket_start_ms << " left unfilled\n";
            }
            else if (fill == GapFill::CarryForward)
            {
                const double px = cur.close;
                for (std::int64_t g = cur.bucket_start_ms + width; g < b; g += width)
                {
                    OhlcBar flat;
                    flat.symbol = symbol;
                    flat.timeframe = tf;
                    flat.bucket_start_ms = g;
                    flat.open = flat.high = flat.low = flat.close = px;
                    out.push_back(std::move(flat));
                }
            }
        }

        cur = OhlcBar{};
        cur.symbol = symbol;
        cur.timeframe = tf;
        cur.bucket_start_ms = b;
        cur.open = cur.high = cur.low = cur.close = t.price;
        cur.volume = t.size;
        cur.trade_count = 1;
        have = true;
    }
    if (have)
        out.push_back(std::move(cur));
    return out;
}
