#include "tick_store.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <mutex>

class MemoryTickStore final : public ITickStore
{
    using BarKey = std::pair<std::string, Timeframe>;

    const MemoryRetention keep_;
    mutable std::mutex mtx_;
    std::map<std::string, std::deque<Tick>> ticks_;             // sorted by ts_ms, arrival order on ties
    std::map<BarKey, std::map<std::int64_t, OhlcBar>> bars_;    // keyed by bucket

    void insert_unlocked(const Tick &t)
    {
        auto &v = ticks_[t.symbol];
        if (v.empty() || v.back().ts_ms <= t.ts_ms)
        {
            v.push_back(t);
            return;
        }
        auto pos = std::upper_bound(v.begin(), v.end(), t.ts_ms,
                                    [](std::int64_t ts, const Tick &x) { return ts < x.ts_ms; });
        v.insert(pos, t);
    }

    void trim_ticks(std::deque<Tick> &v)
    {
        if (keep_.max_ticks_per_symbol == 0)
            return;
        while (v.size() > keep_.max_ticks_per_symbol)
            v.pop_front();
    }

    void trim_bars(std::map<std::int64_t, OhlcBar> &m)
    {
        if (keep_.max_bars_per_series == 0)
            return;
        while (m.size() > keep_.max_bars_per_series)
            m.erase(m.begin());
    }

public:
    explicit MemoryTickStore(MemoryRetention keep) : keep_(keep) {}

    void insert_tick(const Tick &t) override
    {
        std::scoped_lock lk(mtx_);
        insert_unlocked(t);
        trim_ticks(ticks_[t.symbol]);
    }

    void insert_ticks(const std::vector<Tick> &ticks) override
    {
        std::scoped_lock lk(mtx_);
        for (const auto &t : ticks)
            insert_unlocked(t);
        for (auto &[sym, v] : ticks_)
            trim_ticks(v);
    }

    void insert_ohlc(const std::vector<OhlcBar> &bars) override
    {
        std::scoped_lock lk(mtx_);
        for (const auto &b : bars)
            bars_[{b.symbol, b.timeframe}][b.bucket_start_ms] = b;
        for (auto &[key, m] : bars_)
            trim_bars(m);
    }

    std::vector<Tick> query_ticks(const std::string &symbol, TimeRange range,
                                  std::optional<std::size_t> limit) const override
    {
        std::scoped_lock lk(mtx_);
        auto it = ticks_.find(symbol);
        if (it == ticks_.end())
            return {};
        const auto &v = it->second;

        auto first = std::lower_bound(v.begin(), v.end(), range.from_ms,
                                      [](const Tick &x, std::int64_t ts) { return x.ts_ms < ts; });
        auto last = std::upper_bound(first, v.end(), range.to_ms,
                                     [](std::int64_t ts, const Tick &x) { return ts < x.ts_ms; });
        if (limit && static_cast<std::size_t>(last - first) > *limit)
            first = last - static_cast<std::ptrdiff_t>(*limit);
        return std::vector<Tick>(first, last);
    }

    std::vector<OhlcBar> query_ohlc(const std::string &symbol, Timeframe tf, TimeRange range) const override
    {
        std::scoped_lock lk(mtx_);
        std::vector<OhlcBar> out;
        auto it = bars_.find({symbol, tf});
        if (it == bars_.end())
            return out;
        for (auto b = it->second.lower_bound(range.from_ms);
             b != it->second.end() && b->first <= range.to_ms; ++b)
            out.push_back(b->second);
        return out;
    }

    std::set<std::string> list_symbols() const override
    {
        std::scoped_lock lk(mtx_);
        std::set<std::string> out;
        for (const auto &[sym, v] : ticks_)
            if (!v.empty())
                out.insert(sym);
        for (const auto &[key, m] : bars_)
            if (!m.empty())
                out.insert(key.first);
        return out;
    }

    std::size_t tick_count(const std::string &symbol) const override
    {
        std::scoped_lock lk(mtx_);
        auto it = ticks_.find(symbol);
        return it == ticks_.end() ? 0 : it->second.size();
    }
};

ITickStore *make_memory_store(MemoryRetention keep) { return new MemoryTickStore(keep); }
