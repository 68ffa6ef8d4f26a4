/*
OHLC bar and bar timeframes
*/

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class Timeframe : uint8_t
{
    S1,
    M1,
    M5,
    M15,
    H1,
    D1
};

inline const char *to_cstr(Timeframe tf)
{
    switch (tf)
    {
    case Timeframe::S1: return "1s";
    case Timeframe::M1: return "1min";
    case Timeframe::M5: return "5min";
    case Timeframe::M15: return "15min";
    case Timeframe::H1: return "1h";
    case Timeframe::D1: return "1d";
    }
    return "?";
}

constexpr std::int64_t timeframe_ms(Timeframe tf)
{
    switch (tf)
    {
    case Timeframe::S1: return 1000;
    case Timeframe::M1: return 60 * 1000;
    case Timeframe::M5: return 5 * 60 * 1000;
    case Timeframe::M15: return 15 * 60 * 1000;
    case Timeframe::H1: return 60 * 60 * 1000;
    case Timeframe::D1: return 24 * 60 * 60 * 1000;
    }
    return 0;
}

// Accepts the labels produced by to_cstr
std::optional<Timeframe> parse_timeframe(std::string_view s);

// floor(ts / width) * width, rounding toward negative infinity
constexpr std::int64_t bucket_start(std::int64_t ts_ms, std::int64_t width_ms)
{
    std::int64_t q = ts_ms / width_ms;
    if ((ts_ms % width_ms != 0) && (ts_ms < 0))
        --q;
    return q * width_ms;
}

constexpr std::int64_t bucket_start(std::int64_t ts_ms, Timeframe tf)
{
    return bucket_start(ts_ms, timeframe_ms(tf));
}

// One bar per (symbol, timeframe, bucket_start_ms)
struct OhlcBar
{
    std::string symbol;
    Timeframe timeframe{Timeframe::M1};
    std::int64_t bucket_start_ms{0};
    double open{0}, high{0}, low{0}, close{0};
    double volume{0};         // sum of tick sizes
    std::int64_t trade_count{0}; // 0 for a gap-filled bar

    bool operator==(const OhlcBar &) const = default;
};
