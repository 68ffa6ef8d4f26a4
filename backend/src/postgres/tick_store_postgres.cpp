#include "postgres/tick_store_postgres.hpp"

#include <pqxx/pqxx>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

#ifndef TICKFLOW_SCHEMA_DIR
#define TICKFLOW_SCHEMA_DIR "backend/src/postgres/schema"
#endif

namespace {

std::string with_timeout(std::string conn) {
    if (conn.find("connect_timeout") != std::string::npos) return conn;
    conn += (conn.find('?') != std::string::npos) ? "&connect_timeout=10" : "?connect_timeout=10";
    return conn;
}

std::string read_sql_file(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw StorageError("Failed to open SQL file: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Columns in SELECT order: symbol, ts_ms, price, size, trade_id, event_time_ms, is_buyer_maker
Tick tick_from_row(const pqxx::row &row) {
    Tick t;
    t.symbol = row[0].as<std::string>();
    t.ts_ms = row[1].as<std::int64_t>();
    t.price = row[2].as<double>();
    t.size = row[3].as<double>();
    if (!row[4].is_null()) t.trade_id = row[4].as<std::int64_t>();
    if (!row[5].is_null()) t.event_time_ms = row[5].as<std::int64_t>();
    if (!row[6].is_null()) t.is_buyer_maker = row[6].as<bool>();
    return t;
}

constexpr const char *kInsertTick = R"(
    INSERT INTO ticks (symbol, ts_ms, price, size, trade_id, event_time_ms, is_buyer_maker)
    VALUES ($1, $2, $3, $4, $5, $6, $7)
)";

constexpr const char *kUpsertBar = R"(
    INSERT INTO ohlc (symbol, timeframe, bucket_start_ms, open, high, low, close, volume, trade_count)
    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
    ON CONFLICT (symbol, timeframe, bucket_start_ms) DO UPDATE SET
        open = EXCLUDED.open,
        high = EXCLUDED.high,
        low = EXCLUDED.low,
        close = EXCLUDED.close,
        volume = EXCLUDED.volume,
        trade_count = EXCLUDED.trade_count
)";

class PostgresTickStore final : public ITickStore {
public:
    PostgresTickStore(const std::string &connection_string, const std::string &schema_file)
        : conn_str_(with_timeout(connection_string)) {
        const std::string path = schema_file.empty() ? std::string(TICKFLOW_SCHEMA_DIR) + "/build_tables.sql"
                                                     : schema_file;
        const std::string sql = read_sql_file(path);
        try {
            conn_ = std::make_unique<pqxx::connection>(conn_str_);
        } catch (const std::exception &e) {
            throw StorageError("Failed to connect: " + std::string(e.what()));
        }
        ensure_schema(sql);
        std::cout << "[storage] schema ready (" << path << ")" << std::endl;
    }

    void insert_tick(const Tick &t) override {
        insert_ticks({t});
    }

    void insert_ticks(const std::vector<Tick> &ticks) override {
        if (ticks.empty()) return;
        std::scoped_lock lk(mtx_);
        try {
            pqxx::work txn(conn());
            for (const auto &t : ticks) {
                txn.exec(kInsertTick,
                         pqxx::params(t.symbol, t.ts_ms, t.price, t.size,
                                      t.trade_id, t.event_time_ms, t.is_buyer_maker));
            }
            txn.commit();
        } catch (const std::exception &e) {
            throw StorageError("Failed to insert ticks: " + std::string(e.what()));
        }
    }

    void insert_ohlc(const std::vector<OhlcBar> &bars) override {
        if (bars.empty()) return;
        std::scoped_lock lk(mtx_);
        try {
            pqxx::work txn(conn());
            for (const auto &b : bars) {
                txn.exec(kUpsertBar,
                         pqxx::params(b.symbol, std::string(to_cstr(b.timeframe)), b.bucket_start_ms,
                                      b.open, b.high, b.low, b.close, b.volume, b.trade_count));
            }
            txn.commit();
        } catch (const std::exception &e) {
            throw StorageError("Failed to upsert bars: " + std::string(e.what()));
        }
    }

    std::vector<Tick> query_ticks(const std::string &symbol, TimeRange range,
                                  std::optional<std::size_t> limit) const override {
        std::scoped_lock lk(mtx_);
        try {
            pqxx::read_transaction txn(conn());
            pqxx::result result;
            if (limit) {
                // newest first, flipped below
                result = txn.exec(R"(
                    SELECT symbol, ts_ms, price, size, trade_id, event_time_ms, is_buyer_maker
                    FROM ticks
                    WHERE symbol = $1 AND ts_ms BETWEEN $2 AND $3
                    ORDER BY ts_ms DESC, id DESC
                    LIMIT $4
                )", pqxx::params(symbol, range.from_ms, range.to_ms, static_cast<std::int64_t>(*limit)));
            } else {
                result = txn.exec(R"(
                    SELECT symbol, ts_ms, price, size, trade_id, event_time_ms, is_buyer_maker
                    FROM ticks
                    WHERE symbol = $1 AND ts_ms BETWEEN $2 AND $3
                    ORDER BY ts_ms ASC, id ASC
                )", pqxx::params(symbol, range.from_ms, range.to_ms));
            }

            std::vector<Tick> ticks;
            ticks.reserve(result.size());
            for (const auto &row : result) ticks.push_back(tick_from_row(row));
            if (limit) std::reverse(ticks.begin(), ticks.end());
            return ticks;
        } catch (const std::exception &e) {
            throw StorageError("Failed to query ticks: " + std::string(e.what()));
        }
    }

    std::vector<OhlcBar> query_ohlc(const std::string &symbol, Timeframe tf, TimeRange range) const override {
        std::scoped_lock lk(mtx_);
        try {
            pqxx::read_transaction txn(conn());
            pqxx::result result = txn.exec(R"(
                SELECT bucket_start_ms, open, high, low, close, volume, trade_count
                FROM ohlc
                WHERE symbol = $1 AND timeframe = $2 AND bucket_start_ms BETWEEN $3 AND $4
                ORDER BY bucket_start_ms ASC
            )", pqxx::params(symbol, std::string(to_cstr(tf)), range.from_ms, range.to_ms));

            std::vector<OhlcBar> bars;
            bars.reserve(result.size());
            for (const auto &row : result) {
                OhlcBar b;
                b.symbol = symbol;
                b.timeframe = tf;
                b.bucket_start_ms = row[0].as<std::int64_t>();
                b.open = row[1].as<double>();
                b.high = row[2].as<double>();
                b.low = row[3].as<double>();
                b.close = row[4].as<double>();
                b.volume = row[5].as<double>();
                b.trade_count = row[6].as<std::int64_t>();
                bars.push_back(std::move(b));
            }
            return bars;
        } catch (const std::exception &e) {
            throw StorageError("Failed to query bars: " + std::string(e.what()));
        }
    }

    std::set<std::string> list_symbols() const override {
        std::scoped_lock lk(mtx_);
        try {
            pqxx::read_transaction txn(conn());
            pqxx::result result = txn.exec(
                "SELECT DISTINCT symbol FROM ticks UNION SELECT DISTINCT symbol FROM ohlc");
            std::set<std::string> out;
            for (const auto &row : result) out.insert(row[0].as<std::string>());
            return out;
        } catch (const std::exception &e) {
            throw StorageError("Failed to list symbols: " + std::string(e.what()));
        }
    }

    std::size_t tick_count(const std::string &symbol) const override {
        std::scoped_lock lk(mtx_);
        try {
            pqxx::read_transaction txn(conn());
            pqxx::result result = txn.exec("SELECT COUNT(*) FROM ticks WHERE symbol = $1",
                                           pqxx::params(symbol));
            return result[0][0].as<std::size_t>();
        } catch (const std::exception &e) {
            throw StorageError("Failed to count ticks: " + std::string(e.what()));
        }
    }

private:
    std::string conn_str_;
    mutable std::mutex mtx_;
    mutable std::unique_ptr<pqxx::connection> conn_;

    // caller holds mtx_; reopens a dropped connection
    pqxx::connection &conn() const {
        if (!conn_ || !conn_->is_open()) {
            std::cerr << "[storage] reconnecting" << std::endl;
            conn_ = std::make_unique<pqxx::connection>(conn_str_);
        }
        return *conn_;
    }

    // Any failure here, a dropped connection included, surfaces as StorageError
    void ensure_schema(const std::string &sql) {
        try {
            // DDL runs outside a transaction block
            pqxx::nontransaction ntxn(*conn_);
            std::istringstream stream(sql);
            std::string statement;
            std::string line;
            while (std::getline(stream, line)) {
                std::string trimmed = line;
                trimmed.erase(0, trimmed.find_first_not_of(" \t"));
                if (trimmed.empty() || trimmed.rfind("--", 0) == 0) continue;

                statement += line + "\n";
                if (line.find(';') == std::string::npos) continue;

                ntxn.exec(statement);
                statement.clear();
            }
        } catch (const std::exception &e) {
            throw StorageError("Failed to execute schema SQL: " + std::string(e.what()));
        }
    }
};

} // namespace

std::unique_ptr<ITickStore> make_postgres_store(const std::string &connection_string,
                                                const std::string &schema_file) {
    return std::make_unique<PostgresTickStore>(connection_string, schema_file);
}
