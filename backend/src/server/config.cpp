#include "server/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "md/symbol_codec.hpp"
#include "server/defaults_config.hpp"

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

std::optional<std::string> env(const char* key) {
    const char* v = std::getenv(key);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::optional<long> parse_positive(const std::string& s) {
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || v < 0) return std::nullopt;
    return v;
}

void bad_value(const char* key, const std::string& value) {
    std::cerr << "[setup] ignoring " << key << "='" << value << "'; using default" << std::endl;
}

} // namespace

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return; // system env vars only
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        const size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim(key);
        trim(value);

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }
        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
}

std::vector<std::string> split_list(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) comma = csv.size();
        std::string item = csv.substr(start, comma - start);
        trim(item);
        if (!item.empty()) out.push_back(std::move(item));
        start = comma + 1;
    }
    return out;
}

PipelineConfig load_pipeline_config() {
    PipelineConfig cfg;

    const auto symbols = env("TICKFLOW_SYMBOLS");
    for (const auto& s : symbols ? split_list(*symbols) : kDefaultSymbols) {
        cfg.symbols.push_back(SymbolCodec::to_canonical(s));
    }

    const auto tfs = env("TICKFLOW_TIMEFRAMES");
    for (const auto& label : tfs ? split_list(*tfs) : kDefaultTimeframes) {
        if (auto tf = parse_timeframe(label)) {
            cfg.timeframes.push_back(*tf);
        } else {
            bad_value("TICKFLOW_TIMEFRAMES", label);
        }
    }
    if (cfg.timeframes.empty()) {
        for (const auto& label : kDefaultTimeframes) cfg.timeframes.push_back(*parse_timeframe(label));
    }

    cfg.window = kDefaultWindow;
    if (auto v = env("TICKFLOW_WINDOW")) {
        auto n = parse_positive(*v);
        if (n && *n >= 2) cfg.window = static_cast<std::size_t>(*n);
        else bad_value("TICKFLOW_WINDOW", *v);
    }

    cfg.cycle = std::chrono::milliseconds(kDefaultCycleMs);
    if (auto v = env("TICKFLOW_CYCLE_MS")) {
        auto n = parse_positive(*v);
        if (n && *n > 0) cfg.cycle = std::chrono::milliseconds(*n);
        else bad_value("TICKFLOW_CYCLE_MS", *v);
    }

    cfg.buffer_capacity = kDefaultBufferCapacity;
    if (auto v = env("TICKFLOW_BUFFER_CAPACITY")) {
        if (auto n = parse_positive(*v)) cfg.buffer_capacity = static_cast<std::size_t>(*n);
        else bad_value("TICKFLOW_BUFFER_CAPACITY", *v);
    }

    if (auto v = env("TICKFLOW_BACKPRESSURE")) {
        if (*v == "drop_oldest") cfg.backpressure = Backpressure::DropOldest;
        else if (*v == "drop_newest") cfg.backpressure = Backpressure::DropNewest;
        else if (*v == "block") cfg.backpressure = Backpressure::Block;
        else bad_value("TICKFLOW_BACKPRESSURE", *v);
    }

    if (auto v = env("TICKFLOW_GAP_FILL")) {
        if (*v == "carry_forward") cfg.gap_fill = GapFill::CarryForward;
        else if (*v == "sparse") cfg.gap_fill = GapFill::Sparse;
        else bad_value("TICKFLOW_GAP_FILL", *v);
    }

    cfg.memory_ticks = kDefaultMemoryTicks;
    if (auto v = env("TICKFLOW_MEMORY_TICKS")) {
        if (auto n = parse_positive(*v)) cfg.memory_ticks = static_cast<std::size_t>(*n);
        else bad_value("TICKFLOW_MEMORY_TICKS", *v);
    }

    cfg.memory_bars = kDefaultMemoryBars;
    if (auto v = env("TICKFLOW_MEMORY_BARS")) {
        if (auto n = parse_positive(*v)) cfg.memory_bars = static_cast<std::size_t>(*n);
        else bad_value("TICKFLOW_MEMORY_BARS", *v);
    }

    cfg.alerts_file = env("TICKFLOW_ALERTS_FILE").value_or("");
    cfg.feed_host = env("TICKFLOW_FEED_HOST").value_or(kDefaultFeedHost);
    cfg.db_url = env("TICKFLOW_DB_URL").value_or("");
    return cfg;
}

std::vector<std::string> load_alert_conditions(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open alerts file: " + filepath);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse alerts file " + filepath + ": " + e.what());
    }

    std::vector<std::string> out;
    if (!doc.is_object() || !doc.contains("alerts") || !doc["alerts"].is_array()) {
        throw std::runtime_error("Alerts file " + filepath + " has no \"alerts\" array");
    }
    for (const auto& item : doc["alerts"]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_object() && item.contains("condition") && item["condition"].is_string()) {
            out.push_back(item["condition"].get<std::string>());
        } else {
            std::cerr << "[setup] skipping alert entry " << item.dump() << std::endl;
        }
    }
    return out;
}
