#pragma once
#include <cmath>
#include <optional>

#include <nlohmann/json.hpp>

#include "alerts/alert_engine.hpp"
#include "analytics/snapshot.hpp"
#include "bars/ohlc_bar.hpp"
#include "md/tick.hpp"
#include "pipeline/collector.hpp"

// nlohmann::json views of the pipeline's records. NaN and absent optionals
// become null. Found by ADL, so `nlohmann::json j = bar;` works.

namespace json_views {

template <class T>
nlohmann::json opt(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

inline nlohmann::json num(double v) {
    return std::isfinite(v) ? nlohmann::json(v) : nlohmann::json(nullptr);
}

inline nlohmann::json last_points(const Series& s, std::size_t n = 1) {
    nlohmann::json arr = nlohmann::json::array();
    const std::size_t first = s.size() > n ? s.size() - n : 0;
    for (std::size_t i = first; i < s.size(); ++i) {
        arr.push_back({{"ts_ms", s[i].ts_ms}, {"value", num(s[i].value)}});
    }
    return arr;
}

} // namespace json_views

inline void to_json(nlohmann::json& j, const Tick& t) {
    j = {
        {"symbol", t.symbol},
        {"ts_ms", t.ts_ms},
        {"price", t.price},
        {"size", t.size},
        {"trade_id", json_views::opt(t.trade_id)},
        {"event_time_ms", json_views::opt(t.event_time_ms)},
        {"is_buyer_maker", json_views::opt(t.is_buyer_maker)},
    };
}

inline void to_json(nlohmann::json& j, const OhlcBar& b) {
    j = {
        {"symbol", b.symbol},
        {"timeframe", to_cstr(b.timeframe)},
        {"bucket_start_ms", b.bucket_start_ms},
        {"open", b.open},
        {"high", b.high},
        {"low", b.low},
        {"close", b.close},
        {"volume", b.volume},
        {"trade_count", b.trade_count},
    };
}

inline void to_json(nlohmann::json& j, const PriceStats& s) {
    j = {
        {"count", s.count},
        {"mean", s.mean},
        {"std", s.std},
        {"min", s.min},
        {"max", s.max},
        {"median", s.median},
        {"q25", s.q25},
        {"q75", s.q75},
        {"range", s.range},
        {"cv", s.cv},
    };
}

inline void to_json(nlohmann::json& j, const AdfResult& r) {
    j = {
        {"statistic", r.statistic},
        {"p_value", r.p_value},
        {"critical_values", r.critical_values},
        {"is_stationary", r.is_stationary},
        {"used_lag", r.used_lag},
        {"nobs", r.nobs},
    };
}

inline void to_json(nlohmann::json& j, const HedgeRatio& h) {
    j = {
        {"hedge_ratio", h.hedge_ratio},
        {"intercept", h.intercept},
        {"r_squared", h.r_squared},
        {"nobs", h.nobs},
    };
}

// Series are summarized by their latest point
inline void to_json(nlohmann::json& j, const AnalyticsSnapshot& s) {
    j = {
        {"symbol", s.symbol},
        {"timeframe", to_cstr(s.timeframe)},
        {"window", s.window},
        {"bars", s.bars},
        {"price_stats", s.price_stats},
        {"adf", s.adf},
        {"last_price", json_views::opt(s.last_price)},
        {"last_zscore", json_views::opt(s.last_zscore)},
        {"last_volatility", json_views::opt(s.last_volatility)},
    };
}

inline void to_json(nlohmann::json& j, const PairSnapshot& p) {
    j = {
        {"a", p.a},
        {"b", p.b},
        {"hedge", p.hedge},
        {"spread", json_views::last_points(p.spread)},
        {"spread_adf", p.spread_adf},
        {"last_spread_zscore", json_views::opt(p.last_spread_zscore)},
        {"last_correlation", json_views::opt(p.last_correlation)},
    };
}

inline void to_json(nlohmann::json& j, const AlertRule& r) {
    j = {
        {"id", r.id},
        {"condition", r.condition},
        {"triggered", r.triggered},
        {"triggered_at_ms", json_views::opt(r.triggered_at_ms)},
        {"trigger_count", r.trigger_count},
    };
}

inline void to_json(nlohmann::json& j, const AlertEvent& e) {
    nlohmann::json ctx = nlohmann::json::object();
    for (const auto& [k, v] : e.context) ctx[k] = json_views::num(v);
    j = {
        {"rule_id", e.rule_id},
        {"condition", e.condition},
        {"triggered_at_ms", e.triggered_at_ms},
        {"trigger_count", e.trigger_count},
        {"context", std::move(ctx)},
    };
}

inline void to_json(nlohmann::json& j, const CollectorStats& s) {
    j = {
        {"received", s.received},
        {"malformed", s.malformed},
        {"dropped", s.dropped},
        {"pending", s.pending},
        {"connections", s.connections},
    };
}
