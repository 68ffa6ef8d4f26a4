#include "pipeline/collector.hpp"
#include "fake_ws.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

// Each symbol gets its script; "badusdt" fails to connect.
static Collector::ConnectionFactory scripted(std::map<std::string, std::vector<std::string>> scripts)
{
    return [scripts = std::move(scripts)](const std::string &symbol, IMarketWs::OnMsg cb)
               -> std::unique_ptr<IMarketWs> {
        auto it = scripts.find(symbol);
        std::vector<std::string> frames = it == scripts.end() ? std::vector<std::string>{} : it->second;
        return std::make_unique<FakeWs>(std::move(frames), std::move(cb), symbol == "badusdt");
    };
}

static std::unique_ptr<ITradeNormalizer> binance()
{
    return std::unique_ptr<ITradeNormalizer>(make_binance_normalizer());
}

int main()
{
    std::map<std::string, std::vector<std::string>> scripts;
    scripts["btcusdt"] = {trade_frame("BTCUSDT", 1000, 100.0, 1.0),
                          "garbage",
                          trade_frame("BTCUSDT", 2000, 101.0, 2.0)};
    scripts["ethusdt"] = {trade_frame("ETHUSDT", 1500, 10.0, 3.0)};

    // Lifecycle and error codes
    {
        Collector c(scripted(scripts), binance, Collector::Options{});
        assert(!c.is_running());
        assert(c.start({}) == CollectorError::NoSymbols);
        assert(c.start({"  "}) == CollectorError::NoSymbols);
        assert(c.subscribe("btcusdt") == CollectorError::NotRunning);

        std::atomic<int> seen{0};
        std::atomic<int> throwing_calls{0};
        c.add_consumer([&](const Tick &) { ++throwing_calls; throw std::runtime_error("consumer bug"); });
        const auto id = c.add_consumer([&](const Tick &t) {
            assert(!t.symbol.empty());
            ++seen;
        });

        // duplicates collapse after lower-casing
        assert(c.start({"BTCUSDT", "btcusdt", "ethusdt", "badusdt"}) == CollectorError::None);
        assert(c.is_running());
        assert(c.start({"btcusdt"}) == CollectorError::AlreadyRunning);

        assert(wait_for([&] { return c.pending_count() == 3; }));
        assert(wait_for([&] { return seen == 3; }));
        assert(throwing_calls == 3); // a throwing consumer does not stop delivery

        auto syms = c.symbols();
        assert(syms.size() == 3);
        assert(syms[0] == "btcusdt" && syms[1] == "ethusdt" && syms[2] == "badusdt");

        const auto st = c.stats();
        assert(st.received == 3);
        assert(st.malformed == 1);
        assert(st.pending == 3);
        assert(st.connections == 3);

        auto ticks = c.drain(true);
        assert(ticks.size() == 3);
        assert(c.pending_count() == 0);
        assert(c.drain(true).empty());

        std::size_t btc = 0;
        for (const auto &t : ticks)
            if (t.symbol == "btcusdt")
                ++btc;
        assert(btc == 2);

        // Per-symbol order is delivery order
        std::int64_t last_btc = 0;
        for (const auto &t : ticks)
        {
            if (t.symbol != "btcusdt")
                continue;
            assert(t.ts_ms > last_btc);
            last_btc = t.ts_ms;
        }

        // Late subscription
        assert(c.subscribe("BTCUSDT") == CollectorError::None); // already present
        assert(c.symbols().size() == 3);
        assert(c.subscribe("solusdt") == CollectorError::None);
        assert(c.symbols().size() == 4);

        assert(c.remove_consumer(id));
        assert(!c.remove_consumer(id));

        c.stop();
        assert(!c.is_running());
        c.stop(); // idempotent
        assert(c.subscribe("solusdt") == CollectorError::NotRunning);
    }

    // Restart after stop, with a bounded buffer
    {
        Collector::Options opts;
        opts.buffer_capacity = 1;
        opts.backpressure = Backpressure::DropOldest;
        Collector c(scripted(scripts), binance, opts);
        assert(c.start({"btcusdt"}) == CollectorError::None);
        assert(wait_for([&] { return c.stats().received == 2; }));
        auto kept = c.drain(true);
        assert(kept.size() == 1);
        assert(kept[0].ts_ms == 2000);
        assert(c.stats().dropped == 1);
        c.stop();

        assert(c.start({"ethusdt"}) == CollectorError::None);
        assert(wait_for([&] { return c.pending_count() == 1; }));
        assert(c.drain(true)[0].symbol == "ethusdt");
    }

    // Stop is safe without a start and from the destructor
    {
        Collector c(scripted(scripts), binance, Collector::Options{});
        c.stop();
        assert(c.start({"btcusdt"}) == CollectorError::None);
    }

    std::cout << "OK\n";
    return 0;
}
