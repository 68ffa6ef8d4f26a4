#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "analytics/adf.hpp"
#include "analytics/analytics.hpp"
#include "bars/ohlc_bar.hpp"

// Derived view of one symbol/timeframe over the last `window` bars
struct AnalyticsSnapshot {
    std::string symbol;
    Timeframe timeframe{Timeframe::M1};
    std::size_t window{0};
    std::size_t bars{0};

    PriceStats price_stats;
    Series zscore;
    AdfResult adf;
    Series volatility;

    std::optional<double> last_price;
    std::optional<double> last_zscore;
    std::optional<double> last_volatility;
};

struct PairSnapshot {
    std::string a;
    std::string b;
    HedgeRatio hedge;           // a on b
    Series spread;              // a - hedge_ratio * b over all joined bars
    Series spread_zscore;
    AdfResult spread_adf;
    Series correlation;

    std::optional<double> last_spread_zscore;
    std::optional<double> last_correlation;
};

// Bars must share one symbol and timeframe and be ordered by bucket.
// Statistics, ADF and the hedge ratio use the trailing `window` closes;
// rolling series use the same window over the whole history.
AnalyticsSnapshot compute_snapshot(const std::vector<OhlcBar>& bars, std::size_t window = 60);

PairSnapshot compute_pair_snapshot(const std::vector<OhlcBar>& a,
                                   const std::vector<OhlcBar>& b,
                                   std::size_t window = 60);
