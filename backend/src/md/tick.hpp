/*
Normalized trade tick
*/

#pragma once
#include <cstdint>
#include <optional>
#include <string>

struct Tick
{
    std::string symbol;    // canonical, lower-case "btcusdt"
    std::int64_t ts_ms{0}; // trade time, else event time, else receive time
    double price{0};
    double size{0};
    std::optional<std::int64_t> trade_id;
    std::optional<std::int64_t> event_time_ms;
    std::optional<bool> is_buyer_maker;
};
