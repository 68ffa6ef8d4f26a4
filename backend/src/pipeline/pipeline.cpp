#include "pipeline.hpp"

#include <algorithm>
#include <iterator>
#include <iostream>
#include <unordered_map>

Pipeline::Pipeline(ITickStore& store, Options opts, std::unique_ptr<Collector> collector)
    : store_(store),
      opts_(std::move(opts)),
      collector_(collector ? std::move(collector) : std::make_unique<Collector>(opts_.collector)) {
    if (opts_.timeframes.empty()) {
        std::cerr << "[pipeline] no timeframes configured, using 1min" << std::endl;
        opts_.timeframes.push_back(Timeframe::M1);
    }
}

Pipeline::~Pipeline() { stop(); }

CollectorError Pipeline::start(const std::vector<std::string>& symbols) {
    const CollectorError err = collector_->start(symbols);
    if (err == CollectorError::None) {
        symbols_ = collector_->symbols();
    }
    return err;
}

void Pipeline::stop() { collector_->stop(); }

CycleReport Pipeline::run_cycle() {
    CycleReport report;

    std::vector<Tick> ticks = collector_->drain(true);
    report.ticks = ticks.size();

    // Ticks a failed insert left behind go first
    if (!unsaved_.empty()) {
        ticks.insert(ticks.begin(), std::make_move_iterator(unsaved_.begin()),
                     std::make_move_iterator(unsaved_.end()));
        unsaved_.clear();
    }

    if (!ticks.empty()) {
        try {
            store_.insert_ticks(ticks);
        } catch (const StorageError& e) {
            std::cerr << "[pipeline] " << e.what() << "; keeping " << ticks.size()
                      << " ticks for the next cycle" << std::endl;
            const std::size_t cap = opts_.collector.buffer_capacity;
            if (cap && ticks.size() > cap) {
                ticks.erase(ticks.begin(), ticks.end() - static_cast<std::ptrdiff_t>(cap));
            }
            unsaved_ = std::move(ticks);
            ticks.clear();
        }
    }

    std::unordered_map<std::string, std::int64_t> oldest;
    for (const auto& t : ticks) {
        auto [it, inserted] = oldest.emplace(t.symbol, t.ts_ms);
        if (!inserted) it->second = std::min(it->second, t.ts_ms);
    }

    for (const auto& [symbol, ts] : oldest) {
        if (std::find(symbols_.begin(), symbols_.end(), symbol) == symbols_.end()) {
            symbols_.push_back(symbol);
        }
        report.bars += resample_symbol(symbol, ts);
    }

    // First symbol's values are also exposed unqualified
    std::vector<std::vector<OhlcBar>> pair_bars;
    for (std::size_t i = 0; i < symbols_.size(); ++i) {
        std::vector<OhlcBar> bars;
        auto snap = snapshot_for(symbols_[i], i < 2 ? &bars : nullptr);
        if (!snap) continue;
        if (i == 0) fill_context(report.context, *snap, "");
        fill_context(report.context, *snap, symbols_[i] + "_");
        report.snapshots.push_back(std::move(*snap));
        if (i < 2) pair_bars.push_back(std::move(bars));
    }

    if (pair_bars.size() == 2 && !pair_bars[0].empty() && !pair_bars[1].empty()) {
        try {
            PairSnapshot p = compute_pair_snapshot(pair_bars[0], pair_bars[1], opts_.window);
            if (p.hedge.nobs) {
                report.context["hedge_ratio"] = p.hedge.hedge_ratio;
                report.context["hedge_r_squared"] = p.hedge.r_squared;
            }
            if (p.last_spread_zscore) report.context["spread_zscore"] = *p.last_spread_zscore;
            if (p.last_correlation) report.context["correlation"] = *p.last_correlation;
            if (p.spread_adf.nobs) report.context["spread_adf_pvalue"] = p.spread_adf.p_value;
            report.pair = std::move(p);
        } catch (const std::exception& e) {
            std::cerr << "[pipeline] pair analytics: " << e.what() << std::endl;
        }
    }

    if (!report.context.empty()) {
        report.alerts_fired = alerts_.evaluate(report.context);
    }
    return report;
}

// Re-aggregate every timeframe of `symbol` from the stored ticks, starting at
// the older of the newest stored bucket and the bucket of `oldest_new_ms`.
// Starting at a populated bucket keeps carried gaps continuous across cycles.
std::size_t Pipeline::resample_symbol(const std::string& symbol, std::int64_t oldest_new_ms) {
    std::size_t upserted = 0;
    for (Timeframe tf : opts_.timeframes) {
        const SeriesKey key{symbol, tf};

        TimeRange range;
        range.from_ms = bucket_start(oldest_new_ms, timeframe_ms(tf));
        auto it = last_bucket_.find(key);
        if (it != last_bucket_.end()) range.from_ms = std::min(range.from_ms, it->second);

        try {
            std::vector<OhlcBar> bars = resample(store_.query_ticks(symbol, range), tf, opts_.gap_fill);
            if (bars.empty()) continue;

            store_.insert_ohlc(bars);
            upserted += bars.size();

            const std::int64_t newest = bars.back().bucket_start_ms;
            if (it == last_bucket_.end()) last_bucket_.emplace(key, newest);
            else it->second = std::max(it->second, newest);
        } catch (const StorageError& e) {
            std::cerr << "[pipeline] " << symbol << " " << to_cstr(tf) << ": " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[pipeline] " << symbol << " " << to_cstr(tf) << ": resample failed: " << e.what() << std::endl;
        }
    }
    return upserted;
}

std::optional<AnalyticsSnapshot> Pipeline::snapshot_for(const std::string& symbol,
                                                        std::vector<OhlcBar>* bars_out) {
    const Timeframe tf = analytics_timeframe();
    auto it = last_bucket_.find({symbol, tf});
    if (it == last_bucket_.end()) return std::nullopt;

    TimeRange range;
    const auto span = static_cast<std::int64_t>(std::max<std::size_t>(opts_.history_bars, 1) - 1);
    range.from_ms = it->second - span * timeframe_ms(tf);

    std::vector<OhlcBar> bars;
    try {
        bars = store_.query_ohlc(symbol, tf, range);
    } catch (const StorageError& e) {
        std::cerr << "[pipeline] " << symbol << " bars: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (bars.empty()) return std::nullopt;

    try {
        AnalyticsSnapshot snap = compute_snapshot(bars, opts_.window);
        if (bars_out) *bars_out = std::move(bars);
        return snap;
    } catch (const std::exception& e) {
        std::cerr << "[pipeline] " << symbol << " analytics: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void Pipeline::fill_context(AlertContext& ctx, const AnalyticsSnapshot& s, const std::string& prefix) {
    if (s.last_price) ctx[prefix + "price"] = *s.last_price;
    if (s.last_zscore) ctx[prefix + "zscore"] = *s.last_zscore;
    if (s.last_volatility) ctx[prefix + "volatility"] = *s.last_volatility;
    if (s.price_stats.count) {
        ctx[prefix + "mean"] = s.price_stats.mean;
        ctx[prefix + "std"] = s.price_stats.std;
        ctx[prefix + "min"] = s.price_stats.min;
        ctx[prefix + "max"] = s.price_stats.max;
    }
    if (s.adf.nobs) {
        ctx[prefix + "adf_statistic"] = s.adf.statistic;
        ctx[prefix + "adf_pvalue"] = s.adf.p_value;
    }
}
