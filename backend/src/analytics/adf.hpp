#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "analytics/series.hpp"

// Augmented Dickey-Fuller result. The default-constructed value is the
// "cannot reject a unit root" sentinel returned for short or degenerate input.
struct AdfResult {
    double statistic{0};
    double p_value{1.0};
    std::map<std::string, double> critical_values; // "1%", "5%", "10%"; empty for the sentinel
    bool is_stationary{false};                     // p_value < 0.05
    std::size_t used_lag{0};
    std::size_t nobs{0};                           // observations in the final regression
};

constexpr std::size_t kAdfMinObservations = 10;

// ADF regression with a constant. Missing samples are dropped first.
// The lag order is chosen by AIC over 0..maxlag; by default
// maxlag = ceil(12 * (n / 100)^(1/4)), capped at n / 2 - 2.
AdfResult compute_adf_test(const Series& s, std::optional<std::size_t> maxlag = std::nullopt);

// MacKinnon (1994) approximate p-value for a constant-only ADF statistic.
double mackinnon_pvalue(double statistic);
