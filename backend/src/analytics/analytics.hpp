#pragma once
#include <cstddef>
#include <vector>

#include "analytics/series.hpp"

// Stateless indicators over time-ordered series.
//
// Conventions shared by every function here:
//  - standard deviation is the sample deviation (n - 1);
//  - rolling outputs only contain indices i >= window - 1 whose window holds no
//    missing value; the output sample carries the timestamp of index i;
//  - too little data or a degenerate input yields an empty series or the
//    documented zero sentinel, never an exception.

struct PriceStats {
    std::size_t count{0}; // 0 => no data, all fields zero
    double mean{0};
    double std{0};
    double min{0};
    double max{0};
    double median{0};
    double q25{0};
    double q75{0};
    double range{0};
    double cv{0};         // std / mean, 0 when mean is 0
};

struct HedgeRatio {
    double hedge_ratio{0};
    double intercept{0};
    double r_squared{0};
    std::size_t nobs{0};  // joined points used; 0 for the sentinel
};

struct BollingerBands {
    Series upper;
    Series middle;
    Series lower;
};

struct VolumeProfile {
    std::vector<double> price_levels; // bin centres, ascending
    std::vector<double> volumes;      // volume per bin
    double poc{0};                    // centre of the max-volume bin
};

// Missing samples are skipped. One sample gives std 0.
PriceStats compute_price_stats(const Series& s);

Series rolling_mean(const Series& s, std::size_t window);
Series rolling_std(const Series& s, std::size_t window);

// Empty when s.size() < window. Indices with a zero rolling std are absent.
Series compute_zscore(const Series& s, std::size_t window = 60);

// Pearson correlation per window of `window` inner-joined points.
Series compute_rolling_correlation(const Series& a, const Series& b, std::size_t window = 60);

// OLS of `dependent` on `independent` with intercept over inner-joined points.
// Fewer than 2 points or zero variance on either side gives the zero sentinel.
HedgeRatio compute_hedge_ratio(const Series& dependent, const Series& independent);

// a - beta * b over inner-joined points
Series compute_spread(const Series& a, const Series& b, double beta = 1.0);

// Simple returns, first point dropped. A return touching a missing or zero
// price is missing.
Series compute_returns(const Series& prices);

// Rolling std of returns * sqrt(252); empty when returns.size() < window.
// The factor assumes daily-equivalent sampling.
Series compute_volatility(const Series& returns, std::size_t window = 60);

inline Series compute_moving_average(const Series& s, std::size_t window) {
    return rolling_mean(s, window);
}

BollingerBands compute_bollinger_bands(const Series& s, std::size_t window = 20, double num_std = 2.0);

// Prices and volumes are inner-joined on timestamp.
VolumeProfile compute_volume_profile(const Series& prices, const Series& volumes, std::size_t bins = 20);
