#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Compiled-in defaults; every one can be overridden from the environment.
inline const std::vector<std::string> kDefaultSymbols = {
    "btcusdt",
    "ethusdt",
};

inline const std::vector<std::string> kDefaultTimeframes = {
    "1s",
    "1min",
};

inline constexpr const char* kDefaultFeedHost = "fstream.binance.com";
inline constexpr std::size_t kDefaultWindow = 60;
inline constexpr long kDefaultCycleMs = 1000;
inline constexpr std::size_t kDefaultBufferCapacity = 100000;
inline constexpr std::size_t kDefaultMemoryTicks = 1000000;
inline constexpr std::size_t kDefaultMemoryBars = 100000;
