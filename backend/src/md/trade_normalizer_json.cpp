#include "trade_normalizer.hpp"
#include "symbol_codec.hpp"

#include <simdjson.h>
#include <charconv>
#include <cmath>
#include <string>
#include <utility>

namespace
{
    // Whole-string finite decimal; rejects "", "12abc", " 1", "nan", "inf", "0x1p3"
    bool parse_double(std::string_view sv, double &out)
    {
        if (sv.empty())
            return false;
        double v = 0;
        auto [p, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v, std::chars_format::general);
        if (ec != std::errc() || p != sv.data() + sv.size() || !std::isfinite(v))
            return false;
        out = v;
        return true;
    }

    bool parse_int64(std::string_view sv, std::int64_t &out)
    {
        if (sv.empty())
            return false;
        auto [p, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
        return ec == std::errc() && p == sv.data() + sv.size();
    }

    // Read a field that may be a JSON number or a numeric string.
    bool read_number(simdjson::ondemand::object &obj, const std::string &key, double &out)
    {
        simdjson::ondemand::value v;
        if (obj[key].get(v))
            return false;
        simdjson::ondemand::json_type t;
        if (v.type().get(t))
            return false;
        if (t == simdjson::ondemand::json_type::number)
            return !v.get_double().get(out);
        if (t == simdjson::ondemand::json_type::string)
        {
            std::string_view sv;
            if (v.get_string().get(sv))
                return false;
            return parse_double(sv, out);
        }
        return false;
    }

    std::optional<std::int64_t> read_int(simdjson::ondemand::object &obj, const std::string &key)
    {
        if (key.empty())
            return std::nullopt;
        simdjson::ondemand::value v;
        if (obj[key].get(v))
            return std::nullopt;
        simdjson::ondemand::json_type t;
        if (v.type().get(t))
            return std::nullopt;
        std::int64_t out = 0;
        if (t == simdjson::ondemand::json_type::number)
        {
            if (v.get_int64().get(out))
                return std::nullopt;
            return out;
        }
        if (t == simdjson::ondemand::json_type::string)
        {
            std::string_view sv;
            if (v.get_string().get(sv) || !parse_int64(sv, out))
                return std::nullopt;
            return out;
        }
        return std::nullopt;
    }
}

class JsonTradeNormalizer final : public ITradeNormalizer
{
public:
    explicit JsonTradeNormalizer(TradeFieldMap fields) : fields_(std::move(fields)) {}

    bool parse_trade(std::string_view raw,
                     const std::string &symbol,
                     std::int64_t recv_ms,
                     Tick &out) override
    {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc))
            return false;

        simdjson::ondemand::object obj;
        if (doc.get_object().get(obj))
            return false;

        // Event discriminator must name a trade
        std::string_view type_sv;
        if (obj[fields_.event_type].get(type_sv))
            return false;
        if (type_sv != fields_.trade_event)
            return false;

        Tick t;
        if (!read_number(obj, fields_.price, t.price))
            return false;
        if (!read_number(obj, fields_.qty, t.size))
            return false;

        std::string_view sym_sv;
        if (!fields_.symbol.empty() && !obj[fields_.symbol].get(sym_sv) && !sym_sv.empty())
            t.symbol = SymbolCodec::to_canonical(std::string(sym_sv));
        else
            t.symbol = SymbolCodec::to_canonical(symbol);

        t.trade_id = read_int(obj, fields_.trade_id);

        if (!fields_.buyer_maker.empty())
        {
            bool maker = false;
            if (!obj[fields_.buyer_maker].get(maker))
                t.is_buyer_maker = maker;
        }

        // Timestamp: trade time, then event time, then local receive time
        const auto trade_ms = read_int(obj, fields_.trade_time);
        t.event_time_ms = read_int(obj, fields_.event_time);
        if (trade_ms)
            t.ts_ms = *trade_ms;
        else if (t.event_time_ms)
            t.ts_ms = *t.event_time_ms;
        else
            t.ts_ms = recv_ms;

        out = std::move(t);
        return true;
    }

private:
    TradeFieldMap fields_;
    simdjson::ondemand::parser parser_;
};

// factories
ITradeNormalizer *make_json_trade_normalizer(TradeFieldMap fields)
{
    return new JsonTradeNormalizer(std::move(fields));
}

ITradeNormalizer *make_binance_normalizer() { return new JsonTradeNormalizer(TradeFieldMap{}); }
