#include "tick_store.hpp"
#include "bars/resampler.hpp"

#include <cassert>
#include <iostream>
#include <memory>

static Tick tk(const std::string &sym, std::int64_t ts, double price, std::int64_t id)
{
    Tick t;
    t.symbol = sym;
    t.ts_ms = ts;
    t.price = price;
    t.size = 1.0;
    t.trade_id = id;
    return t;
}

int main()
{
    std::unique_ptr<ITickStore> store(make_memory_store());

    assert(store->list_symbols().empty());
    assert(store->query_ticks("btcusdt").empty());
    assert(store->tick_count("btcusdt") == 0);

    // Out-of-order inserts come back ascending; ties keep insertion order
    store->insert_ticks({tk("btcusdt", 3000, 3, 1), tk("btcusdt", 1000, 1, 2), tk("ethusdt", 1500, 10, 3)});
    store->insert_tick(tk("btcusdt", 2000, 2, 4));
    store->insert_tick(tk("btcusdt", 2000, 2.5, 5));
    assert(store->tick_count("btcusdt") == 4);
    assert(store->tick_count("ethusdt") == 1);

    auto all = store->query_ticks("btcusdt");
    assert(all.size() == 4);
    assert(all[0].ts_ms == 1000);
    assert(all[1].trade_id == 4 && all[2].trade_id == 5);
    assert(all[3].ts_ms == 3000);

    // Inclusive range
    TimeRange r;
    r.from_ms = 2000;
    r.to_ms = 3000;
    assert(store->query_ticks("btcusdt", r).size() == 3);
    r.to_ms = 2999;
    assert(store->query_ticks("btcusdt", r).size() == 2);
    assert(r.contains(2000) && !r.contains(3000));

    // A limit keeps the most recent ticks, still ascending
    auto recent = store->query_ticks("btcusdt", {}, 2);
    assert(recent.size() == 2);
    assert(recent[0].trade_id == 5 && recent[1].ts_ms == 3000);
    assert(store->query_ticks("btcusdt", {}, 100).size() == 4);

    // Bars upsert on (symbol, timeframe, bucket)
    auto bars = resample(store->query_ticks("btcusdt"), Timeframe::S1);
    assert(bars.size() == 3);
    store->insert_ohlc(bars);
    store->insert_ohlc(bars);
    assert(store->query_ohlc("btcusdt", Timeframe::S1).size() == 3);
    assert(store->query_ohlc("btcusdt", Timeframe::M1).empty());

    OhlcBar changed = bars[1];
    changed.close = 99.0;
    store->insert_ohlc({changed});
    auto after = store->query_ohlc("btcusdt", Timeframe::S1);
    assert(after.size() == 3);
    assert(after[1].close == 99.0);
    assert(after[0].bucket_start_ms < after[1].bucket_start_ms);

    TimeRange br;
    br.from_ms = 2000;
    auto tail = store->query_ohlc("btcusdt", Timeframe::S1, br);
    assert(tail.size() == 2 && tail[0].bucket_start_ms == 2000);

    OhlcBar only_bar;
    only_bar.symbol = "solusdt";
    only_bar.timeframe = Timeframe::M1;
    store->insert_ohlc({only_bar});

    auto syms = store->list_symbols();
    assert(syms.size() == 3);
    assert(syms.count("btcusdt") && syms.count("ethusdt") && syms.count("solusdt"));

    // Retention: the oldest ticks and bars are evicted first
    {
        MemoryRetention keep;
        keep.max_ticks_per_symbol = 3;
        keep.max_bars_per_series = 2;
        std::unique_ptr<ITickStore> small(make_memory_store(keep));

        for (std::int64_t i = 0; i < 10; ++i)
            small->insert_tick(tk("btcusdt", i * 1000, 1.0 + i, i));
        small->insert_ticks({tk("ethusdt", 5000, 1, 100), tk("ethusdt", 1000, 1, 101),
                             tk("ethusdt", 9000, 1, 102), tk("ethusdt", 7000, 1, 103)});
        assert(small->tick_count("btcusdt") == 3);
        assert(small->tick_count("ethusdt") == 3);
        auto kept = small->query_ticks("btcusdt");
        assert(kept.front().ts_ms == 7000 && kept.back().ts_ms == 9000);
        assert(small->query_ticks("ethusdt").front().ts_ms == 5000);

        // A late tick older than everything retained does not displace newer ones
        small->insert_tick(tk("btcusdt", 0, 1.0, 50));
        assert(small->query_ticks("btcusdt").front().ts_ms == 7000);

        auto bars = resample(small->query_ticks("btcusdt"), Timeframe::S1);
        assert(bars.size() == 3);
        small->insert_ohlc(bars);
        auto kept_bars = small->query_ohlc("btcusdt", Timeframe::S1);
        assert(kept_bars.size() == 2);
        assert(kept_bars[0].bucket_start_ms == 8000 && kept_bars[1].bucket_start_ms == 9000);

        // Unbounded
        MemoryRetention all;
        all.max_ticks_per_symbol = 0;
        all.max_bars_per_series = 0;
        std::unique_ptr<ITickStore> big(make_memory_store(all));
        for (std::int64_t i = 0; i < 5000; ++i)
            big->insert_tick(tk("btcusdt", i, 1.0, i));
        assert(big->tick_count("btcusdt") == 5000);
    }

    std::cout << "OK\n";
    return 0;
}
