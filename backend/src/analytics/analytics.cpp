#include "analytics.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace {

// A deviation this small relative to the mean is rounding noise of a flat window.
constexpr double kFlatRel = 1e-12;

double mean_of(const double* v, std::size_t n) {
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) sum += v[i];
    return sum / static_cast<double>(n);
}

// Two-pass sample deviation; requires n >= 2.
double sample_std(const double* v, std::size_t n, double mean) {
    double ss = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double d = v[i] - mean;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(n - 1));
}

bool is_flat(double std, double mean) {
    return std == 0.0 || std <= kFlatRel * std::fabs(mean);
}

bool window_complete(const double* v, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        if (is_missing(v[i])) return false;
    }
    return true;
}

std::vector<double> values_of(const Series& s) {
    std::vector<double> v;
    v.reserve(s.size());
    for (const auto& p : s) v.push_back(p.value);
    return v;
}

// Apply fn to every complete window; fn may decline a window with nullopt.
template <class Fn>
Series rolling_apply(const Series& s, std::size_t window, Fn&& fn) {
    Series out;
    if (window == 0 || s.size() < window) return out;
    const std::vector<double> v = values_of(s);
    out.reserve(s.size() - window + 1);
    for (std::size_t i = window - 1; i < v.size(); ++i) {
        const double* w = v.data() + (i + 1 - window);
        if (!window_complete(w, window)) continue;
        std::optional<double> r = fn(w, window, v[i]);
        if (r) out.push_back({s[i].ts_ms, *r});
    }
    return out;
}

// Linear interpolation between closest ranks on sorted data.
double quantile_sorted(const std::vector<double>& v, double q) {
    const double pos = q * static_cast<double>(v.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    const auto hi = static_cast<std::size_t>(std::ceil(pos));
    return v[lo] + (v[hi] - v[lo]) * (pos - static_cast<double>(lo));
}

} // namespace

PriceStats compute_price_stats(const Series& s) {
    std::vector<double> v;
    v.reserve(s.size());
    for (const auto& p : s) {
        if (!is_missing(p.value)) v.push_back(p.value);
    }

    PriceStats st;
    if (v.empty()) return st;

    st.count = v.size();
    st.mean = mean_of(v.data(), v.size());
    st.std = v.size() > 1 ? sample_std(v.data(), v.size(), st.mean) : 0.0;

    std::sort(v.begin(), v.end());
    st.min = v.front();
    st.max = v.back();
    st.median = quantile_sorted(v, 0.50);
    st.q25 = quantile_sorted(v, 0.25);
    st.q75 = quantile_sorted(v, 0.75);
    st.range = st.max - st.min;
    st.cv = st.mean != 0.0 ? st.std / st.mean : 0.0;
    return st;
}

Series rolling_mean(const Series& s, std::size_t window) {
    return rolling_apply(s, window, [](const double* w, std::size_t n, double) -> std::optional<double> {
        return mean_of(w, n);
    });
}

Series rolling_std(const Series& s, std::size_t window) {
    if (window < 2) return {};
    return rolling_apply(s, window, [](const double* w, std::size_t n, double) -> std::optional<double> {
        return sample_std(w, n, mean_of(w, n));
    });
}

Series compute_zscore(const Series& s, std::size_t window) {
    if (window < 2 || s.size() < window) return {};
    return rolling_apply(s, window, [](const double* w, std::size_t n, double x) -> std::optional<double> {
        const double m = mean_of(w, n);
        const double sd = sample_std(w, n, m);
        if (is_flat(sd, m)) return std::nullopt;
        return (x - m) / sd;
    });
}

Series compute_rolling_correlation(const Series& a, const Series& b, std::size_t window) {
    Series out;
    const auto rows = inner_join(a, b);
    if (window < 2 || rows.size() < window) return out;

    for (std::size_t i = window - 1; i < rows.size(); ++i) {
        const std::size_t first = i + 1 - window;
        double ma = 0.0, mb = 0.0;
        for (std::size_t j = first; j <= i; ++j) { ma += rows[j].a; mb += rows[j].b; }
        ma /= static_cast<double>(window);
        mb /= static_cast<double>(window);

        double sab = 0.0, saa = 0.0, sbb = 0.0;
        for (std::size_t j = first; j <= i; ++j) {
            const double da = rows[j].a - ma;
            const double db = rows[j].b - mb;
            sab += da * db;
            saa += da * da;
            sbb += db * db;
        }
        const double sda = std::sqrt(saa / static_cast<double>(window - 1));
        const double sdb = std::sqrt(sbb / static_cast<double>(window - 1));
        if (is_flat(sda, ma) || is_flat(sdb, mb)) continue;

        const double r = sab / std::sqrt(saa * sbb);
        out.push_back({rows[i].ts_ms, std::clamp(r, -1.0, 1.0)});
    }
    return out;
}

HedgeRatio compute_hedge_ratio(const Series& dependent, const Series& independent) {
    const auto rows = inner_join(dependent, independent);
    if (rows.size() < 2) return {};

    const double n = static_cast<double>(rows.size());
    double ma = 0.0, mb = 0.0;
    for (const auto& r : rows) { ma += r.a; mb += r.b; }
    ma /= n;
    mb /= n;

    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    for (const auto& r : rows) {
        const double db = r.b - mb;
        const double da = r.a - ma;
        sxx += db * db;
        sxy += db * da;
        syy += da * da;
    }
    const double sd_a = std::sqrt(syy / (n - 1.0));
    const double sd_b = std::sqrt(sxx / (n - 1.0));
    if (is_flat(sd_a, ma) || is_flat(sd_b, mb)) return {};

    HedgeRatio h;
    h.hedge_ratio = sxy / sxx;
    h.intercept = ma - h.hedge_ratio * mb;

    double ss_res = 0.0;
    for (const auto& r : rows) {
        const double e = r.a - (h.intercept + h.hedge_ratio * r.b);
        ss_res += e * e;
    }
    h.r_squared = 1.0 - ss_res / syy;
    h.nobs = rows.size();

    if (!std::isfinite(h.hedge_ratio) || !std::isfinite(h.intercept) || !std::isfinite(h.r_squared)) {
        return {};
    }
    return h;
}

Series compute_spread(const Series& a, const Series& b, double beta) {
    Series out;
    for (const auto& r : inner_join(a, b)) {
        out.push_back({r.ts_ms, r.a - beta * r.b});
    }
    return out;
}

Series compute_returns(const Series& prices) {
    Series out;
    if (prices.size() < 2) return out;
    out.reserve(prices.size() - 1);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const double prev = prices[i - 1].value;
        const double cur = prices[i].value;
        if (is_missing(prev) || is_missing(cur) || prev == 0.0) {
            out.push_back({prices[i].ts_ms, kMissing});
        } else {
            out.push_back({prices[i].ts_ms, (cur - prev) / prev});
        }
    }
    return out;
}

Series compute_volatility(const Series& returns, std::size_t window) {
    if (window < 2 || returns.size() < window) return {};
    static const double kAnnualize = std::sqrt(252.0);
    Series out = rolling_std(returns, window);
    for (auto& p : out) p.value *= kAnnualize;
    return out;
}

BollingerBands compute_bollinger_bands(const Series& s, std::size_t window, double num_std) {
    BollingerBands bb;
    if (window < 2 || s.size() < window) return bb;
    const std::vector<double> v = values_of(s);
    for (std::size_t i = window - 1; i < v.size(); ++i) {
        const double* w = v.data() + (i + 1 - window);
        if (!window_complete(w, window)) continue;
        const double m = mean_of(w, window);
        const double sd = sample_std(w, window, m);
        bb.middle.push_back({s[i].ts_ms, m});
        bb.upper.push_back({s[i].ts_ms, m + num_std * sd});
        bb.lower.push_back({s[i].ts_ms, m - num_std * sd});
    }
    return bb;
}

VolumeProfile compute_volume_profile(const Series& prices, const Series& volumes, std::size_t bins) {
    VolumeProfile vp;
    const auto rows = inner_join(prices, volumes);
    if (rows.empty() || bins == 0) return vp;

    double lo = rows.front().a, hi = rows.front().a;
    for (const auto& r : rows) {
        lo = std::min(lo, r.a);
        hi = std::max(hi, r.a);
    }

    // A single price level collapses to one bin
    if (hi == lo) {
        double total = 0.0;
        for (const auto& r : rows) total += r.b;
        vp.price_levels.push_back(lo);
        vp.volumes.push_back(total);
        vp.poc = lo;
        return vp;
    }

    const double width = (hi - lo) / static_cast<double>(bins);
    vp.price_levels.resize(bins);
    vp.volumes.assign(bins, 0.0);
    for (std::size_t i = 0; i < bins; ++i) {
        vp.price_levels[i] = lo + (static_cast<double>(i) + 0.5) * width;
    }
    for (const auto& r : rows) {
        auto idx = static_cast<std::size_t>((r.a - lo) / width);
        if (idx >= bins) idx = bins - 1; // the max price closes the last bin
        vp.volumes[idx] += r.b;
    }

    const auto best = std::max_element(vp.volumes.begin(), vp.volumes.end());
    vp.poc = vp.price_levels[static_cast<std::size_t>(best - vp.volumes.begin())];
    return vp;
}
