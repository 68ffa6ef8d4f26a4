#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "alerts/alert_engine.hpp"
#include "analytics/snapshot.hpp"
#include "bars/resampler.hpp"
#include "pipeline/collector.hpp"
#include "tick_store.hpp"

// What one run_cycle() did
struct CycleReport {
    std::size_t ticks{0};          // drained from the collector
    std::size_t bars{0};           // bars upserted across all timeframes
    std::vector<AnalyticsSnapshot> snapshots;
    std::optional<PairSnapshot> pair;
    AlertContext context;
    std::size_t alerts_fired{0};
};

// Ties the stages together: collector -> store -> resampler -> analytics -> alerts.
// One instance per process; all state lives here instead of in globals.
// run_cycle() is meant to be called from a single thread.
class Pipeline {
public:
    struct Options {
        std::vector<Timeframe> timeframes{Timeframe::S1, Timeframe::M1};
        std::size_t window{60};
        GapFill gap_fill{GapFill::CarryForward};
        std::size_t history_bars{500}; // bars loaded per symbol for analytics
        Collector::Options collector{};
    };

    // A null collector means a default Binance collector built from opts.collector.
    Pipeline(ITickStore& store, Options opts, std::unique_ptr<Collector> collector = nullptr);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    CollectorError start(const std::vector<std::string>& symbols);
    void stop();

    CycleReport run_cycle();

    // Timeframe the analytics and alerts run on (the first configured one)
    Timeframe analytics_timeframe() const { return opts_.timeframes.front(); }

    Collector& collector() { return *collector_; }
    AlertEngine& alerts() { return alerts_; }
    ITickStore& store() { return store_; }

private:
    using SeriesKey = std::pair<std::string, Timeframe>;

    std::size_t resample_symbol(const std::string& symbol, std::int64_t oldest_new_ms);
    std::optional<AnalyticsSnapshot> snapshot_for(const std::string& symbol,
                                                  std::vector<OhlcBar>* bars_out);
    static void fill_context(AlertContext& ctx, const AnalyticsSnapshot& s, const std::string& prefix);

    ITickStore& store_;
    Options opts_;
    std::unique_ptr<Collector> collector_;
    AlertEngine alerts_;

    std::vector<std::string> symbols_;               // subscription order
    std::map<SeriesKey, std::int64_t> last_bucket_;  // newest stored bucket per series
    std::vector<Tick> unsaved_;                      // ticks whose insert failed
};
