#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "bars/ohlc_bar.hpp"
#include "md/tick.hpp"

// Inclusive [from_ms, to_ms]; the default covers everything
struct TimeRange {
    std::int64_t from_ms{std::numeric_limits<std::int64_t>::min()};
    std::int64_t to_ms{std::numeric_limits<std::int64_t>::max()};

    bool contains(std::int64_t ts) const noexcept { return ts >= from_ms && ts <= to_ms; }
};

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persistence for ticks and bars. Every method throws StorageError on failure.
class ITickStore
{
public:
    virtual ~ITickStore() = default;

    virtual void insert_tick(const Tick &t) = 0;
    virtual void insert_ticks(const std::vector<Tick> &ticks) = 0;

    // Upsert on (symbol, timeframe, bucket_start_ms)
    virtual void insert_ohlc(const std::vector<OhlcBar> &bars) = 0;

    // Ascending by timestamp. With a limit, the most recent `limit` ticks in range.
    virtual std::vector<Tick> query_ticks(const std::string &symbol,
                                          TimeRange range = {},
                                          std::optional<std::size_t> limit = std::nullopt) const = 0;

    // Ascending by bucket_start_ms
    virtual std::vector<OhlcBar> query_ohlc(const std::string &symbol, Timeframe tf,
                                            TimeRange range = {}) const = 0;

    virtual std::set<std::string> list_symbols() const = 0;
    virtual std::size_t tick_count(const std::string &symbol) const = 0;
};

// Retention of the in-memory store; the oldest data goes first. 0 = unbounded.
struct MemoryRetention {
    std::size_t max_ticks_per_symbol{1000000};
    std::size_t max_bars_per_series{100000}; // per (symbol, timeframe)
};

ITickStore *make_memory_store(MemoryRetention keep = {});
