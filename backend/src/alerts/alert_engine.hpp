#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "alerts/expr.hpp"

struct AlertRule {
    std::uint64_t id{0};
    std::string condition;
    bool triggered{false};
    std::optional<std::int64_t> triggered_at_ms;
    std::uint64_t trigger_count{0};
};

struct AlertEvent {
    std::uint64_t rule_id{0};
    std::string condition;
    std::int64_t triggered_at_ms{0};
    std::uint64_t trigger_count{0};
    AlertContext context;
};

// Edge-triggered rule set. A rule fires once when its condition becomes true
// and stays triggered until reset. All methods are thread-safe; callbacks run
// on the evaluating thread with the engine lock released.
class AlertEngine {
public:
    using OnTrigger = std::function<void(const AlertRule&, const AlertContext&)>;
    using Clock = std::function<std::int64_t()>; // epoch ms

    static constexpr std::size_t kHistoryCapacity = 1000;

    AlertEngine();
    explicit AlertEngine(Clock clock);

    // Throws ExprParseError; nothing is added then.
    std::uint64_t add_rule(const std::string& condition, OnTrigger cb = {});

    bool remove_rule(std::uint64_t id);
    // Removes every rule with exactly this condition text; returns how many.
    std::size_t remove_condition(const std::string& condition);

    bool reset(std::uint64_t id);
    void reset_all();

    // Returns the number of rules that fired on this call.
    std::size_t evaluate(const AlertContext& ctx);

    std::vector<AlertRule> list_rules() const;
    // Most recent `limit` events, oldest first.
    std::vector<AlertEvent> history(std::size_t limit = 100) const;

private:
    struct Entry {
        AlertRule rule;
        Expr expr;
        OnTrigger cb;
    };

    Clock clock_;
    mutable std::mutex m_;
    std::vector<Entry> rules_;
    std::deque<AlertEvent> history_;
    std::uint64_t next_id_{1};
};
