#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "alerts/expr.hpp"
#include "pipeline/pipeline.hpp"
#include "postgres/tick_store_postgres.hpp"
#include "server/config.hpp"
#include "tick_store.hpp"
#include "util/json_views.hpp"

namespace net = boost::asio;

namespace {

std::unique_ptr<ITickStore> open_store(const PipelineConfig& cfg, std::size_t history_bars) {
    if (!cfg.db_url.empty()) {
        try {
            auto store = make_postgres_store(cfg.db_url);
            std::cout << "[setup] database connected" << std::endl;
            return store;
        } catch (const std::exception& e) {
            std::cerr << "[setup] Warning: failed to initialize database: " << e.what() << std::endl;
        }
    }
    MemoryRetention keep;
    keep.max_ticks_per_symbol = cfg.memory_ticks;
    // analytics reads history_bars back, so never keep fewer
    keep.max_bars_per_series = cfg.memory_bars ? std::max(cfg.memory_bars, history_bars) : 0;
    std::cout << "[setup] using in-memory store (ticks/symbol " << keep.max_ticks_per_symbol
              << ", bars/series " << keep.max_bars_per_series << ", 0 = unbounded)" << std::endl;
    return std::unique_ptr<ITickStore>(make_memory_store(keep));
}

void load_alerts(AlertEngine& engine, const std::string& file) {
    if (file.empty()) return;
    try {
        for (const auto& cond : load_alert_conditions(file)) {
            try {
                engine.add_rule(cond, [](const AlertRule& r, const AlertContext& ctx) {
                    nlohmann::json j = r;
                    nlohmann::json c = nlohmann::json::object();
                    for (const auto& [k, v] : ctx) c[k] = json_views::num(v);
                    j["context"] = std::move(c);
                    std::cout << "[alerts] " << j.dump() << std::endl;
                });
            } catch (const ExprParseError& e) {
                std::cerr << "[setup] rejected alert '" << cond << "': " << e.what() << std::endl;
            }
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "[setup] " << e.what() << std::endl;
    }
}

} // namespace

int main() {
    load_env_file();
    const PipelineConfig cfg = load_pipeline_config();

    Pipeline::Options opts;
    opts.timeframes = cfg.timeframes;
    opts.window = cfg.window;
    opts.gap_fill = cfg.gap_fill;
    opts.collector.buffer_capacity = cfg.buffer_capacity;
    opts.collector.backpressure = cfg.backpressure;

    std::unique_ptr<ITickStore> store = open_store(cfg, opts.history_bars);

    auto collector = std::make_unique<Collector>(
        Collector::binance_connections(cfg.feed_host),
        [] { return std::unique_ptr<ITradeNormalizer>(make_binance_normalizer()); },
        opts.collector);
    Pipeline pipeline(*store, opts, std::move(collector));
    load_alerts(pipeline.alerts(), cfg.alerts_file);

    std::cout << "[setup] symbols:";
    for (const auto& s : cfg.symbols) std::cout << " " << s;
    std::cout << " | timeframes:";
    for (auto tf : cfg.timeframes) std::cout << " " << to_cstr(tf);
    std::cout << " | window " << cfg.window
              << " | cycle " << cfg.cycle.count() << "ms"
              << " | buffer " << cfg.buffer_capacity << " (" << to_cstr(cfg.backpressure) << ")"
              << " | gap fill " << to_cstr(cfg.gap_fill) << std::endl;

    const CollectorError err = pipeline.start(cfg.symbols);
    if (err != CollectorError::None) {
        std::cerr << "[setup] collector failed to start: " << to_cstr(err) << std::endl;
        return 1;
    }

    net::io_context ioc{1};
    net::steady_timer timer{ioc};
    net::signal_set signals{ioc, SIGINT, SIGTERM};

    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        std::cout << "[setup] signal " << sig << ", shutting down" << std::endl;
        timer.cancel();
    });

    std::function<void()> schedule;
    schedule = [&] {
        timer.expires_after(cfg.cycle);
        timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return; // cancelled
            const CycleReport report = pipeline.run_cycle();
            if (report.ticks || report.alerts_fired) {
                nlohmann::json j;
                j["ticks"] = report.ticks;
                j["bars"] = report.bars;
                j["snapshots"] = report.snapshots;
                j["pair"] = report.pair ? nlohmann::json(*report.pair) : nlohmann::json(nullptr);
                j["alerts_fired"] = report.alerts_fired;
                j["collector"] = pipeline.collector().stats();
                std::cout << "[pipeline] " << j.dump() << std::endl;
            }
            schedule();
        });
    };
    schedule();

    ioc.run();

    pipeline.stop();
    // Flush what arrived after the last cycle
    const CycleReport last = pipeline.run_cycle();
    std::cout << "[setup] final cycle stored " << last.ticks << " ticks" << std::endl;
    return 0;
}
