#include "pipeline/tick_buffer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

static Tick make_tick(std::int64_t ts)
{
    Tick t;
    t.symbol = "btcusdt";
    t.ts_ms = ts;
    t.price = 100.0 + static_cast<double>(ts);
    t.size = 1.0;
    return t;
}

int main()
{
    // drain(true) empties atomically; drained ticks never reappear
    {
        TickBuffer buf;
        for (int i = 0; i < 5; ++i) assert(buf.push(make_tick(i)));
        assert(buf.size() == 5);

        auto peek = buf.drain(false);
        assert(peek.size() == 5);
        assert(buf.size() == 5);

        auto got = buf.drain(true);
        assert(got.size() == 5);
        assert(got.front().ts_ms == 0 && got.back().ts_ms == 4);
        assert(buf.size() == 0);
        assert(buf.drain(true).empty());
    }

    // DropOldest keeps the newest `capacity` ticks
    {
        TickBuffer buf(3, Backpressure::DropOldest);
        for (int i = 0; i < 5; ++i) assert(buf.push(make_tick(i)));
        auto got = buf.drain(true);
        assert(got.size() == 3);
        assert(got[0].ts_ms == 2 && got[2].ts_ms == 4);
        assert(buf.dropped() == 2);
    }

    // DropNewest rejects once full
    {
        TickBuffer buf(2, Backpressure::DropNewest);
        assert(buf.push(make_tick(0)));
        assert(buf.push(make_tick(1)));
        assert(!buf.push(make_tick(2)));
        auto got = buf.drain(true);
        assert(got.size() == 2 && got[1].ts_ms == 1);
        assert(buf.dropped() == 1);
    }

    // Block waits for a drain
    {
        TickBuffer buf(1, Backpressure::Block);
        assert(buf.push(make_tick(0)));
        std::atomic<bool> pushed{false};
        std::thread producer([&] {
            assert(buf.push(make_tick(1)));
            pushed = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(!pushed);
        auto first = buf.drain(true);
        producer.join();
        assert(pushed);
        assert(first.size() == 1 && first[0].ts_ms == 0);
        auto second = buf.drain(true);
        assert(second.size() == 1 && second[0].ts_ms == 1);
    }

    // close() releases a blocked producer and rejects further pushes
    {
        TickBuffer buf(1, Backpressure::Block);
        assert(buf.push(make_tick(0)));
        std::atomic<int> result{-1};
        std::thread producer([&] { result = buf.push(make_tick(1)) ? 1 : 0; });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        buf.close();
        producer.join();
        assert(result == 0);
        assert(!buf.push(make_tick(2)));
        buf.reopen();
        buf.drain(true);
        assert(buf.push(make_tick(3)));
    }

    // Concurrent producers against a draining reader lose nothing
    {
        TickBuffer buf;
        constexpr int kProducers = 4;
        constexpr int kPerProducer = 5000;
        std::vector<std::thread> producers;
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([&, p] {
                for (int i = 0; i < kPerProducer; ++i) buf.push(make_tick(p * kPerProducer + i));
            });
        }
        std::size_t total = 0;
        std::atomic<bool> done{false};
        std::thread reader([&] {
            while (!done) total += buf.drain(true).size();
        });
        for (auto& t : producers) t.join();
        done = true;
        reader.join();
        total += buf.drain(true).size();
        assert(total == static_cast<std::size_t>(kProducers * kPerProducer));
    }

    std::cout << "OK\n";
    return 0;
}
