#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <unordered_map>
#include <vector>

#include "bars/ohlc_bar.hpp"

// One point of a time-ordered series. NaN marks a missing value.
struct Sample {
    std::int64_t ts_ms{0};
    double value{0};
};

using Series = std::vector<Sample>;

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool is_missing(double v) noexcept { return std::isnan(v); }

inline Series close_series(const std::vector<OhlcBar>& bars) {
    Series s;
    s.reserve(bars.size());
    for (const auto& b : bars) s.push_back({b.bucket_start_ms, b.close});
    return s;
}

inline Series volume_series(const std::vector<OhlcBar>& bars) {
    Series s;
    s.reserve(bars.size());
    for (const auto& b : bars) s.push_back({b.bucket_start_ms, b.volume});
    return s;
}

struct JoinedRow {
    std::int64_t ts_ms;
    double a;
    double b;
};

// Rows whose timestamp is present in both series with both values present,
// in the order of `a`.
inline std::vector<JoinedRow> inner_join(const Series& a, const Series& b) {
    std::unordered_map<std::int64_t, double> rhs;
    rhs.reserve(b.size());
    for (const auto& s : b) rhs[s.ts_ms] = s.value;

    std::vector<JoinedRow> out;
    out.reserve(std::min(a.size(), b.size()));
    for (const auto& s : a) {
        auto it = rhs.find(s.ts_ms);
        if (it == rhs.end()) continue;
        if (is_missing(s.value) || is_missing(it->second)) continue;
        out.push_back({s.ts_ms, s.value, it->second});
    }
    return out;
}
