#pragma once
#include "tick.hpp"
#include <cstdint>
#include <string>
#include <string_view>

// Field names of one feed's trade message.
struct TradeFieldMap
{
    std::string event_type{"e"};
    std::string trade_event{"trade"}; // required value of event_type
    std::string symbol{"s"};
    std::string price{"p"};
    std::string qty{"q"};
    std::string trade_time{"T"};
    std::string event_time{"E"};
    std::string trade_id{"t"};
    std::string buyer_maker{"m"};
};

struct ITradeNormalizer
{
    virtual ~ITradeNormalizer() = default;

    // Parse one raw trade frame into 'out'.
    // `symbol` is the subscription the frame arrived on; `recv_ms` is the local
    // receive time used when the frame carries no timestamp.
    // Returns false for malformed frames and for frames that are not trades.
    virtual bool parse_trade(std::string_view raw,
                             const std::string &symbol,
                             std::int64_t recv_ms,
                             Tick &out) = 0;
};

// factories
ITradeNormalizer *make_json_trade_normalizer(TradeFieldMap fields);
ITradeNormalizer *make_binance_normalizer();
