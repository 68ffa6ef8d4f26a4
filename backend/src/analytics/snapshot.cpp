#include "snapshot.hpp"

namespace {

std::optional<double> last_of(const Series& s) {
    if (s.empty() || is_missing(s.back().value)) return std::nullopt;
    return s.back().value;
}

Series tail(const Series& s, std::size_t n) {
    if (n == 0 || s.size() <= n) return s;
    return Series(s.end() - static_cast<std::ptrdiff_t>(n), s.end());
}

} // namespace

AnalyticsSnapshot compute_snapshot(const std::vector<OhlcBar>& bars, std::size_t window) {
    AnalyticsSnapshot snap;
    snap.window = window;
    snap.bars = bars.size();
    if (bars.empty()) return snap;

    snap.symbol = bars.front().symbol;
    snap.timeframe = bars.front().timeframe;

    const Series closes = close_series(bars);
    const Series recent = tail(closes, window);

    snap.price_stats = compute_price_stats(recent);
    snap.zscore = compute_zscore(closes, window);
    snap.adf = compute_adf_test(recent);
    snap.volatility = compute_volatility(compute_returns(closes), window);

    snap.last_price = last_of(closes);
    snap.last_zscore = last_of(snap.zscore);
    snap.last_volatility = last_of(snap.volatility);
    return snap;
}

PairSnapshot compute_pair_snapshot(const std::vector<OhlcBar>& a,
                                   const std::vector<OhlcBar>& b,
                                   std::size_t window) {
    PairSnapshot snap;
    if (!a.empty()) snap.a = a.front().symbol;
    if (!b.empty()) snap.b = b.front().symbol;

    const Series ca = close_series(a);
    const Series cb = close_series(b);

    snap.hedge = compute_hedge_ratio(tail(ca, window), tail(cb, window));
    // The zero sentinel would make the spread equal to `a`
    const double beta = snap.hedge.nobs ? snap.hedge.hedge_ratio : 1.0;
    snap.spread = compute_spread(ca, cb, beta);
    snap.spread_zscore = compute_zscore(snap.spread, window);
    snap.spread_adf = compute_adf_test(tail(snap.spread, window));
    snap.correlation = compute_rolling_correlation(ca, cb, window);

    snap.last_spread_zscore = last_of(snap.spread_zscore);
    snap.last_correlation = last_of(snap.correlation);
    return snap;
}
