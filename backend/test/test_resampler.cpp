#include "bars/resampler.hpp"

#include <cassert>
#include <iostream>

static Tick tk(std::int64_t ts_ms, double price, double size, const char *sym = "btcusdt")
{
    Tick t;
    t.symbol = sym;
    t.ts_ms = ts_ms;
    t.price = price;
    t.size = size;
    return t;
}

int main()
{
    assert(resample({}, Timeframe::M1).empty());

    // Bucket boundaries, OHLC, exact volume sum
    {
        std::vector<Tick> ticks = {
            tk(0, 100.0, 0.25),
            tk(59999, 103.0, 0.5),
            tk(30000, 98.0, 0.125),
            tk(60000, 104.0, 1.0), // first ms of the next bucket
        };
        auto bars = resample(ticks, Timeframe::M1);
        assert(bars.size() == 2);
        assert(bars[0].bucket_start_ms == 0);
        assert(bars[0].open == 100.0);
        assert(bars[0].high == 103.0);
        assert(bars[0].low == 98.0);
        assert(bars[0].close == 103.0); // latest timestamp, not arrival
        assert(bars[0].volume == 0.875);
        assert(bars[0].trade_count == 3);
        assert(bars[0].symbol == "btcusdt");
        assert(bars[0].timeframe == Timeframe::M1);
        assert(bars[1].bucket_start_ms == 60000);
        assert(bars[1].open == 104.0 && bars[1].trade_count == 1);

        double total = 0;
        for (const auto &b : bars)
            total += b.volume;
        assert(total == 1.875);

        // Idempotent
        assert(resample(ticks, Timeframe::M1) == bars);
    }

    // Equal timestamps keep arrival order for open/close
    {
        auto bars = resample({tk(5, 1.0, 1), tk(5, 2.0, 1), tk(5, 3.0, 1)}, Timeframe::S1);
        assert(bars.size() == 1);
        assert(bars[0].open == 1.0 && bars[0].close == 3.0);
    }

    // Ticks at 0 s and 180 s: two populated bars plus two carried
    {
        std::vector<Tick> ticks = {tk(0, 10.0, 1.0), tk(180000, 12.0, 2.0)};
        auto bars = resample(ticks, Timeframe::M1);
        assert(bars.size() == 4);
        assert(bars[0].bucket_start_ms == 0 && bars[0].trade_count == 1);
        for (int i = 1; i <= 2; ++i)
        {
            assert(bars[i].bucket_start_ms == i * 60000);
            assert(bars[i].open == 10.0 && bars[i].high == 10.0);
            assert(bars[i].low == 10.0 && bars[i].close == 10.0);
            assert(bars[i].volume == 0.0 && bars[i].trade_count == 0);
        }
        assert(bars[3].bucket_start_ms == 180000 && bars[3].close == 12.0);

        auto sparse = resample(ticks, Timeframe::M1, GapFill::Sparse);
        assert(sparse.size() == 2);
        assert(sparse[1].bucket_start_ms == 180000);
    }

    // An outlier timestamp does not carry billions of bars
    {
        auto bars = resample({tk(0, 10.0, 1.0), tk(1700000000000, 11.0, 1.0)}, Timeframe::S1);
        assert(bars.size() == 2);
        assert(bars[0].bucket_start_ms == 0 && bars[1].bucket_start_ms == 1700000000000);

        // The longest fillable gap is still carried
        const std::int64_t edge = (kMaxCarriedBars + 1) * 1000;
        auto full = resample({tk(0, 10.0, 1.0), tk(edge, 11.0, 1.0)}, Timeframe::S1);
        assert(full.size() == static_cast<std::size_t>(kMaxCarriedBars) + 2);
        assert(full[1].trade_count == 0 && full[1].close == 10.0);
        assert(full.back().bucket_start_ms == edge);

        auto past = resample({tk(0, 10.0, 1.0), tk(edge + 1000, 11.0, 1.0)}, Timeframe::S1);
        assert(past.size() == 2);

        // Extreme instants on both sides
        auto wide = resample({tk(-4000000000000000000, 1.0, 1.0), tk(4000000000000000000, 2.0, 1.0)}, Timeframe::S1);
        assert(wide.size() == 2);
    }

    // Negative instants floor toward negative infinity
    {
        assert(bucket_start(-1, 1000) == -1000);
        assert(bucket_start(-1000, 1000) == -1000);
        assert(bucket_start(-1001, 1000) == -2000);
        assert(bucket_start(999, 1000) == 0);
        assert(bucket_start(-1, Timeframe::M1) == -60000);
        auto bars = resample({tk(-1, 5.0, 1), tk(1, 6.0, 1)}, Timeframe::S1);
        assert(bars.size() == 2);
        assert(bars[0].bucket_start_ms == -1000 && bars[1].bucket_start_ms == 0);
    }

    // Timeframe labels
    {
        for (auto tf : {Timeframe::S1, Timeframe::M1, Timeframe::M5, Timeframe::M15, Timeframe::H1, Timeframe::D1})
        {
            auto back = parse_timeframe(to_cstr(tf));
            assert(back && *back == tf);
        }
        assert(!parse_timeframe("2min"));
        assert(timeframe_ms(Timeframe::M15) == 900000);
        assert(timeframe_ms(Timeframe::D1) == 86400000);
    }

    // Mixed symbols: first tick labels the bars
    {
        auto bars = resample({tk(0, 1.0, 1, "aaa"), tk(1, 2.0, 1, "bbb")}, Timeframe::S1);
        assert(bars.size() == 1 && bars[0].symbol == "aaa");
    }

    std::cout << "OK\n";
    return 0;
}
