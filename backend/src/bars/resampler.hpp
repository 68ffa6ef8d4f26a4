#pragma once
#include <cstdint>
#include <vector>

#include "bars/ohlc_bar.hpp"
#include "md/tick.hpp"

// What to emit for empty buckets between two populated ones
enum class GapFill
{
    CarryForward, // flat bar at the previous close, volume 0
    Sparse        // nothing
};

const char *to_cstr(GapFill g);

// Longest gap CarryForward fills, in buckets. A longer gap (an outlier
// timestamp, a feed dark for days) is left sparse and logged.
constexpr std::int64_t kMaxCarriedBars = 86400;

// Aggregate one symbol's ticks into bars of `tf`.
// Ticks are stably sorted by timestamp, so equal timestamps keep arrival
// order for open/close. Deterministic: identical input gives identical bars.
// Mixed-symbol input is not supported; the first tick's symbol labels the bars.
std::vector<OhlcBar> resample(std::vector<Tick> ticks, Timeframe tf, GapFill fill = GapFill::CarryForward);

