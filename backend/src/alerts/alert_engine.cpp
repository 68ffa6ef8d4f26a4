#include "alert_engine.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace {

std::int64_t system_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

AlertEngine::AlertEngine() : AlertEngine(Clock(system_ms)) {}

AlertEngine::AlertEngine(Clock clock) : clock_(std::move(clock)) {}

std::uint64_t AlertEngine::add_rule(const std::string& condition, OnTrigger cb) {
    Expr expr = Expr::parse(condition);

    std::lock_guard<std::mutex> lk(m_);
    const std::uint64_t id = next_id_++;
    AlertRule rule;
    rule.id = id;
    rule.condition = condition;
    rules_.push_back(Entry{std::move(rule), std::move(expr), std::move(cb)});
    std::cout << "[alerts] added #" << id << ": " << condition << std::endl;
    return id;
}

bool AlertEngine::remove_rule(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(m_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&](const Entry& e) { return e.rule.id == id; });
    if (it == rules_.end()) return false;
    std::cout << "[alerts] removed #" << id << ": " << it->rule.condition << std::endl;
    rules_.erase(it);
    return true;
}

std::size_t AlertEngine::remove_condition(const std::string& condition) {
    std::lock_guard<std::mutex> lk(m_);
    const auto before = rules_.size();
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&](const Entry& e) { return e.rule.condition == condition; }),
                 rules_.end());
    const std::size_t removed = before - rules_.size();
    if (removed) std::cout << "[alerts] removed " << removed << " x " << condition << std::endl;
    return removed;
}

bool AlertEngine::reset(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& e : rules_) {
        if (e.rule.id == id) {
            e.rule.triggered = false;
            return true;
        }
    }
    return false;
}

void AlertEngine::reset_all() {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& e : rules_) e.rule.triggered = false;
}

std::size_t AlertEngine::evaluate(const AlertContext& ctx) {
    std::vector<std::pair<AlertRule, OnTrigger>> fired;
    {
        std::lock_guard<std::mutex> lk(m_);
        for (auto& e : rules_) {
            if (e.rule.triggered) continue;

            bool hit = false;
            try {
                hit = e.expr.test(ctx);
            } catch (const ExprEvalError& ex) {
                std::cerr << "[alerts] #" << e.rule.id << " '" << e.rule.condition
                          << "': " << ex.what() << std::endl;
            }
            if (!hit) continue;

            const std::int64_t now = clock_();
            e.rule.triggered = true;
            e.rule.triggered_at_ms = now;
            ++e.rule.trigger_count;

            history_.push_back(AlertEvent{e.rule.id, e.rule.condition, now, e.rule.trigger_count, ctx});
            while (history_.size() > kHistoryCapacity) history_.pop_front();

            std::cout << "[alerts] triggered #" << e.rule.id << ": " << e.rule.condition
                      << " (count " << e.rule.trigger_count << ")" << std::endl;
            fired.emplace_back(e.rule, e.cb);
        }
    }

    for (auto& [rule, cb] : fired) {
        if (!cb) continue;
        try {
            cb(rule, ctx);
        } catch (const std::exception& ex) {
            std::cerr << "[alerts] callback for #" << rule.id << " threw: " << ex.what() << std::endl;
        }
    }
    return fired.size();
}

std::vector<AlertRule> AlertEngine::list_rules() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<AlertRule> out;
    out.reserve(rules_.size());
    for (const auto& e : rules_) out.push_back(e.rule);
    return out;
}

std::vector<AlertEvent> AlertEngine::history(std::size_t limit) const {
    std::lock_guard<std::mutex> lk(m_);
    const std::size_t n = std::min(limit, history_.size());
    return std::vector<AlertEvent>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}
