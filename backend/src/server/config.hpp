#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "bars/ohlc_bar.hpp"
#include "bars/resampler.hpp"
#include "pipeline/tick_buffer.hpp"

struct PipelineConfig {
    std::vector<std::string> symbols;
    std::vector<Timeframe> timeframes;
    std::size_t window{60};
    std::chrono::milliseconds cycle{1000};
    std::size_t buffer_capacity{100000};
    Backpressure backpressure{Backpressure::DropOldest};
    GapFill gap_fill{GapFill::CarryForward};
    std::string alerts_file;
    std::string feed_host;
    std::string db_url;   // empty => in-memory store
    std::size_t memory_ticks{1000000}; // in-memory retention per symbol, 0 = unbounded
    std::size_t memory_bars{100000};   // per (symbol, timeframe)
};

// Load KEY=VALUE lines into the environment without overwriting variables
// that are already set. Missing file is not an error.
void load_env_file(const std::string& filepath = ".env");

// TICKFLOW_* variables over the compiled-in defaults. Unparseable values are
// reported and replaced by the default.
PipelineConfig load_pipeline_config();

// Conditions from a JSON file of the form {"alerts": ["zscore > 2", {"condition": "..."}]}.
// Throws std::runtime_error if the file cannot be read or parsed.
std::vector<std::string> load_alert_conditions(const std::string& filepath);

std::vector<std::string> split_list(const std::string& csv);
