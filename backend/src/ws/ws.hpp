#pragma once
#include <chrono>
#include <functional>
#include <string>

// Interface for a market-data WebSocket connector.
// start() runs the connection on the calling thread until stop() or until the
// reconnect policy gives up.
// stop() requests a graceful close; safe from any thread, safe to repeat.
// OnMsg(json): called for each text frame from the exchange
struct IMarketWs
{
    using OnMsg = std::function<void(const std::string &)>;
    virtual ~IMarketWs() = default;
    virtual void start(unsigned short port = 443) = 0;
    virtual void stop() noexcept = 0;
};

// Per-connection retry policy. max_attempts == 0 retries forever.
// connect_timeout bounds each of TCP connect and the TLS handshake.
struct ReconnectPolicy
{
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30000};
    unsigned max_attempts{0};
    std::chrono::milliseconds connect_timeout{10000};
};

// NOTE: Each exchange connection implementation has pointer to Implementation (PIMPL) to hide Boost headers from dependents

class BinanceWs : public IMarketWs
{
public:
    // symbol like "btcusdt"; host defaults to the futures trade stream
    BinanceWs(std::string symbol, OnMsg cb,
              std::string host = "fstream.binance.com",
              ReconnectPolicy policy = {});
    ~BinanceWs();
    // Non-copyable, non-movable (the I/O thread holds a pointer to Impl)
    BinanceWs(const BinanceWs &) = delete;
    BinanceWs &operator=(const BinanceWs &) = delete;

    void start(unsigned short port = 443) override; // blocks until stopped
    void stop() noexcept override;                  // graceful shutdown

private:
    struct Impl;
    Impl *impl_;
};
