#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "md/tick.hpp"
#include "md/trade_normalizer.hpp"
#include "pipeline/tick_buffer.hpp"
#include "ws/ws.hpp"

enum class CollectorError {
    None,
    AlreadyRunning,
    NotRunning,
    NoSymbols
};

inline const char* to_cstr(CollectorError e) {
    switch (e) {
        case CollectorError::None:           return "none";
        case CollectorError::AlreadyRunning: return "already_running";
        case CollectorError::NotRunning:     return "not_running";
        case CollectorError::NoSymbols:      return "no_symbols";
    }
    return "?";
}

struct CollectorStats {
    std::uint64_t received{0};   // normalized ticks
    std::uint64_t malformed{0};  // frames the normalizer rejected
    std::uint64_t dropped{0};    // ticks lost to the buffer overflow policy
    std::size_t pending{0};      // ticks currently buffered
    std::size_t connections{0};
};

// Collector owns one connection (and one I/O thread) per subscribed symbol.
// Every connection normalizes its own frames, appends ticks to the shared
// TickBuffer and then calls the registered consumers on its own thread.
// A connection that fails only affects its own symbol.
class Collector {
public:
    using OnTick = std::function<void(const Tick&)>;
    using ConnectionFactory =
        std::function<std::unique_ptr<IMarketWs>(const std::string& symbol, IMarketWs::OnMsg)>;
    using NormalizerFactory = std::function<std::unique_ptr<ITradeNormalizer>()>;

    struct Options {
        std::size_t buffer_capacity{100000}; // 0 => unbounded
        Backpressure backpressure{Backpressure::DropOldest};
        unsigned short port{443};
    };

    // Binance trade streams on `host`
    static ConnectionFactory binance_connections(std::string host = "fstream.binance.com",
                                                 ReconnectPolicy policy = {});

    Collector(ConnectionFactory connect, NormalizerFactory normalizer, Options opts);
    explicit Collector(Options opts);
    Collector() : Collector(Options{}) {}
    ~Collector();

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    // Opens one connection per distinct lower-cased symbol and returns
    // without waiting for them to connect.
    CollectorError start(const std::vector<std::string>& symbols);

    // Adds one symbol to a running collector (no-op if already subscribed).
    CollectorError subscribe(const std::string& symbol);

    // Idempotent. Must not be called from a consumer callback.
    void stop();

    std::vector<Tick> drain(bool clear = true) { return buffer_.drain(clear); }
    std::size_t pending_count() const { return buffer_.size(); }

    std::uint64_t add_consumer(OnTick cb);
    bool remove_consumer(std::uint64_t id);

    bool is_running() const;
    std::vector<std::string> symbols() const;
    CollectorStats stats() const;

private:
    struct Connection {
        std::string symbol;
        std::unique_ptr<ITradeNormalizer> normalizer;
        std::unique_ptr<IMarketWs> ws;
        std::thread thread;
    };
    using ConsumerList = std::vector<std::pair<std::uint64_t, OnTick>>;

    // caller holds life_m_
    void open_connection_unlocked(const std::string& symbol);
    void on_frame(Connection& c, const std::string& raw);
    void notify(const Tick& t);

    static std::int64_t now_ms();

    ConnectionFactory connect_;
    NormalizerFactory make_normalizer_;
    Options opts_;

    TickBuffer buffer_;

    mutable std::mutex life_m_; // protects running_ + conns_
    bool running_{false};
    std::vector<std::unique_ptr<Connection>> conns_;
    std::atomic<bool> accepting_{false};

    mutable std::mutex cons_m_; // protects consumers_ pointer
    std::shared_ptr<const ConsumerList> consumers_{std::make_shared<const ConsumerList>()};
    std::uint64_t next_consumer_id_{1};

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> malformed_{0};
};
