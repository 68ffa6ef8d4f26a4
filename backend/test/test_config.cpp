#include "server/config.hpp"
#include "util/json_views.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

static std::string write_temp(const std::string &name, const std::string &body)
{
    const std::string path = "/tmp/tickflow_test_" + name;
    std::ofstream(path) << body;
    return path;
}

int main()
{
    for (const char *k : {"TICKFLOW_SYMBOLS", "TICKFLOW_TIMEFRAMES", "TICKFLOW_WINDOW", "TICKFLOW_CYCLE_MS",
                          "TICKFLOW_BUFFER_CAPACITY", "TICKFLOW_BACKPRESSURE", "TICKFLOW_GAP_FILL",
                          "TICKFLOW_ALERTS_FILE", "TICKFLOW_FEED_HOST", "TICKFLOW_DB_URL",
                          "TICKFLOW_MEMORY_TICKS", "TICKFLOW_MEMORY_BARS"})
        unsetenv(k);

    // Defaults
    {
        const PipelineConfig cfg = load_pipeline_config();
        assert(cfg.symbols.size() == 2 && cfg.symbols[0] == "btcusdt" && cfg.symbols[1] == "ethusdt");
        assert(cfg.timeframes.size() == 2);
        assert(cfg.timeframes[0] == Timeframe::S1 && cfg.timeframes[1] == Timeframe::M1);
        assert(cfg.window == 60);
        assert(cfg.cycle.count() == 1000);
        assert(cfg.buffer_capacity == 100000);
        assert(cfg.backpressure == Backpressure::DropOldest);
        assert(cfg.gap_fill == GapFill::CarryForward);
        assert(cfg.feed_host == "fstream.binance.com");
        assert(cfg.db_url.empty() && cfg.alerts_file.empty());
        assert(cfg.memory_ticks == 1000000 && cfg.memory_bars == 100000);
    }

    // .env file fills unset variables only
    {
        setenv("TICKFLOW_WINDOW", "30", 1);
        const std::string env = write_temp("env",
                                           "# comment\n"
                                           "TICKFLOW_SYMBOLS = \"SOLUSDT, btcusdt ,\"\n"
                                           "TICKFLOW_WINDOW=90\n"
                                           "TICKFLOW_TIMEFRAMES='5min,bogus,1h'\n"
                                           "TICKFLOW_BACKPRESSURE=block\n"
                                           "TICKFLOW_GAP_FILL=sparse\n"
                                           "TICKFLOW_CYCLE_MS=abc\n"
                                           "TICKFLOW_BUFFER_CAPACITY=0\n"
                                           "TICKFLOW_MEMORY_TICKS=5000\n"
                                           "TICKFLOW_MEMORY_BARS=-1\n"
                                           "not a pair\n");
        load_env_file(env);

        const PipelineConfig cfg = load_pipeline_config();
        assert(cfg.symbols.size() == 2 && cfg.symbols[0] == "solusdt" && cfg.symbols[1] == "btcusdt");
        assert(cfg.window == 30);
        assert(cfg.timeframes.size() == 2);
        assert(cfg.timeframes[0] == Timeframe::M5 && cfg.timeframes[1] == Timeframe::H1);
        assert(cfg.backpressure == Backpressure::Block);
        assert(cfg.gap_fill == GapFill::Sparse);
        assert(cfg.cycle.count() == 1000); // bad value falls back
        assert(cfg.buffer_capacity == 0);
        assert(cfg.memory_ticks == 5000);
        assert(cfg.memory_bars == 100000);
        std::remove(env.c_str());
    }

    assert(split_list(" a, ,b,") == (std::vector<std::string>{"a", "b"}));

    // Alerts file
    {
        const std::string path = write_temp("alerts.json",
                                            R"({"alerts": ["zscore > 2", {"condition": "price < 100"}, 42]})");
        auto conds = load_alert_conditions(path);
        assert(conds.size() == 2);
        assert(conds[0] == "zscore > 2" && conds[1] == "price < 100");
        std::remove(path.c_str());

        const std::string bad = write_temp("bad.json", "{\"alerts\": [");
        bool threw = false;
        try
        {
            load_alert_conditions(bad);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        std::remove(bad.c_str());

        threw = false;
        try
        {
            load_alert_conditions("/nonexistent/alerts.json");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    // JSON views
    {
        Tick t;
        t.symbol = "btcusdt";
        t.ts_ms = 5;
        t.price = 1.5;
        t.size = 2;
        t.trade_id = 9;
        nlohmann::json j = t;
        assert(j["symbol"] == "btcusdt");
        assert(j["trade_id"] == 9);
        assert(j["event_time_ms"].is_null());

        OhlcBar b;
        b.symbol = "btcusdt";
        b.timeframe = Timeframe::M5;
        nlohmann::json jb = b;
        assert(jb["timeframe"] == "5min");

        AlertEvent e;
        e.rule_id = 3;
        e.context = {{"zscore", 2.0}, {"bad", std::nan("")}};
        nlohmann::json je = e;
        assert(je["context"]["zscore"] == 2.0);
        assert(je["context"]["bad"].is_null());

        AdfResult sentinel;
        nlohmann::json ja = sentinel;
        assert(ja["p_value"] == 1.0 && ja["critical_values"].empty());
    }

    std::cout << "OK\n";
    return 0;
}
