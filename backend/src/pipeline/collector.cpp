#include "collector.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "md/symbol_codec.hpp"

Collector::ConnectionFactory Collector::binance_connections(std::string host, ReconnectPolicy policy)
{
    return [host = std::move(host), policy](const std::string& symbol, IMarketWs::OnMsg cb)
        -> std::unique_ptr<IMarketWs> {
        return std::make_unique<BinanceWs>(symbol, std::move(cb), host, policy);
    };
}

Collector::Collector(ConnectionFactory connect, NormalizerFactory normalizer, Options opts)
    : connect_(std::move(connect)),
      make_normalizer_(std::move(normalizer)),
      opts_(opts),
      buffer_(opts.buffer_capacity, opts.backpressure) {}

Collector::Collector(Options opts)
    : Collector(binance_connections(),
                [] { return std::unique_ptr<ITradeNormalizer>(make_binance_normalizer()); },
                opts) {}

Collector::~Collector() { stop(); }

CollectorError Collector::start(const std::vector<std::string>& symbols) {
    std::vector<std::string> wanted;
    for (const auto& s : symbols) {
        std::string c = SymbolCodec::to_canonical(s);
        if (c.empty()) continue;
        if (std::find(wanted.begin(), wanted.end(), c) == wanted.end()) {
            wanted.push_back(std::move(c));
        }
    }

    std::lock_guard<std::mutex> lk(life_m_);
    if (running_) {
        std::cerr << "[collector] start ignored: already running" << std::endl;
        return CollectorError::AlreadyRunning;
    }
    if (wanted.empty()) {
        std::cerr << "[collector] start ignored: no symbols" << std::endl;
        return CollectorError::NoSymbols;
    }

    buffer_.reopen();
    accepting_.store(true, std::memory_order_release);
    running_ = true;

    for (const auto& s : wanted) {
        open_connection_unlocked(s);
    }
    std::cout << "[collector] started " << conns_.size() << "/" << wanted.size()
              << " symbol connections" << std::endl;
    return CollectorError::None;
}

CollectorError Collector::subscribe(const std::string& symbol) {
    const std::string c = SymbolCodec::to_canonical(symbol);
    if (c.empty()) return CollectorError::NoSymbols;

    std::lock_guard<std::mutex> lk(life_m_);
    if (!running_) return CollectorError::NotRunning;
    for (const auto& conn : conns_) {
        if (conn->symbol == c) return CollectorError::None;
    }
    open_connection_unlocked(c);
    return CollectorError::None;
}

void Collector::open_connection_unlocked(const std::string& symbol) {
    try {
        auto conn = std::make_unique<Connection>();
        conn->symbol = symbol;
        conn->normalizer = make_normalizer_ ? make_normalizer_() : nullptr;
        if (!conn->normalizer) {
            std::cerr << "[collector] no normalizer for '" << symbol << "'; skipping." << std::endl;
            return;
        }

        Connection* raw = conn.get();
        conn->ws = connect_ ? connect_(symbol, [this, raw](const std::string& frame) {
            on_frame(*raw, frame);
        }) : nullptr;
        if (!conn->ws) {
            std::cerr << "[collector] failed to create connection for '" << symbol
                      << "'; skipping." << std::endl;
            return;
        }

        conn->thread = std::thread([raw, port = opts_.port] {
            try {
                raw->ws->start(port);
            } catch (const std::exception& e) {
                std::cerr << "[collector] connection '" << raw->symbol
                          << "' terminated: " << e.what() << std::endl;
                return;
            }
            std::cout << "[collector] connection '" << raw->symbol << "' ended" << std::endl;
        });
        conns_.push_back(std::move(conn));
    } catch (const std::exception& e) {
        std::cerr << "[collector] failed to open '" << symbol << "': " << e.what() << std::endl;
    }
}

void Collector::stop() {
    std::vector<std::unique_ptr<Connection>> to_stop;
    {
        std::lock_guard<std::mutex> lk(life_m_);
        if (!running_) return;
        running_ = false;
        accepting_.store(false, std::memory_order_release);
        to_stop.swap(conns_);
    }

    // Release producers blocked on a full buffer before joining them
    buffer_.close();

    for (auto& c : to_stop) {
        if (c->ws) c->ws->stop();
    }
    for (auto& c : to_stop) {
        if (c->thread.joinable()) c->thread.join();
    }
    std::cout << "[collector] stopped " << to_stop.size() << " connections" << std::endl;
}

void Collector::on_frame(Connection& c, const std::string& raw) {
    if (!accepting_.load(std::memory_order_acquire)) return;

    Tick t;
    if (!c.normalizer->parse_trade(raw, c.symbol, now_ms(), t)) {
        const auto n = malformed_.fetch_add(1, std::memory_order_relaxed) + 1;
        std::cerr << "[collector] '" << c.symbol << "' dropped malformed message (#"
                  << n << ")" << std::endl;
        return;
    }
    received_.fetch_add(1, std::memory_order_relaxed);

    (void)buffer_.push(t); // overflow is counted by the buffer
    notify(t);
}

void Collector::notify(const Tick& t) {
    std::shared_ptr<const ConsumerList> list;
    {
        std::lock_guard<std::mutex> lk(cons_m_);
        list = consumers_;
    }
    for (const auto& [id, cb] : *list) {
        try {
            cb(t);
        } catch (const std::exception& e) {
            std::cerr << "[collector] consumer " << id << " failed on '" << t.symbol
                      << "': " << e.what() << std::endl;
        }
    }
}

std::uint64_t Collector::add_consumer(OnTick cb) {
    std::lock_guard<std::mutex> lk(cons_m_);
    auto next = std::make_shared<ConsumerList>(*consumers_);
    const std::uint64_t id = next_consumer_id_++;
    next->emplace_back(id, std::move(cb));
    consumers_ = std::move(next);
    return id;
}

bool Collector::remove_consumer(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(cons_m_);
    auto next = std::make_shared<ConsumerList>(*consumers_);
    auto it = std::remove_if(next->begin(), next->end(),
                             [id](const auto& entry) { return entry.first == id; });
    if (it == next->end()) return false;
    next->erase(it, next->end());
    consumers_ = std::move(next);
    return true;
}

bool Collector::is_running() const {
    std::lock_guard<std::mutex> lk(life_m_);
    return running_;
}

std::vector<std::string> Collector::symbols() const {
    std::lock_guard<std::mutex> lk(life_m_);
    std::vector<std::string> out;
    out.reserve(conns_.size());
    for (const auto& c : conns_) out.push_back(c->symbol);
    return out;
}

CollectorStats Collector::stats() const {
    CollectorStats s;
    s.received = received_.load(std::memory_order_relaxed);
    s.malformed = malformed_.load(std::memory_order_relaxed);
    s.dropped = buffer_.dropped();
    s.pending = buffer_.size();
    {
        std::lock_guard<std::mutex> lk(life_m_);
        s.connections = conns_.size();
    }
    return s;
}

std::int64_t Collector::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
