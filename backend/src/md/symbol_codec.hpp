#pragma once
#include <string>

struct SymbolCodec
{
    // Canonical form is trimmed lower-case ("BTCUSDT " -> "btcusdt").
    static std::string to_canonical(const std::string &feed_sym);
    // Stream path for a canonical symbol ("btcusdt" -> "/ws/btcusdt@trade").
    static std::string to_stream_path(const std::string &canonical, const std::string &channel = "trade");
};
