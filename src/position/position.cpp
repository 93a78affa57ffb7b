#include "position/position.hpp"
#include <stdexcept>

namespace hedge {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    } else {
        out.reset();
    }
}

Outcome read_outcome(const nlohmann::json& j, const char* key) {
    auto o = outcome_from_string(j.value(key, ""));
    if (!o) {
        throw std::runtime_error(std::string("invalid outcome in field ") + key);
    }
    return *o;
}

} // namespace

std::string status_to_string(PositionStatus s) {
    switch (s) {
        case PositionStatus::OPEN: return "OPEN";
        case PositionStatus::RESOLVED_WIN: return "RESOLVED_WIN";
        case PositionStatus::RESOLVED_LOSS: return "RESOLVED_LOSS";
        case PositionStatus::RESOLVED_STALE: return "RESOLVED_STALE";
    }
    return "UNKNOWN";
}

std::optional<PositionStatus> status_from_string(const std::string& s) {
    if (s == "OPEN") return PositionStatus::OPEN;
    if (s == "RESOLVED_WIN") return PositionStatus::RESOLVED_WIN;
    if (s == "RESOLVED_LOSS") return PositionStatus::RESOLVED_LOSS;
    if (s == "RESOLVED_STALE") return PositionStatus::RESOLVED_STALE;
    return std::nullopt;
}

Notional TrackerState::open_exposure() const {
    Notional total = 0.0;
    for (const auto& p : open_positions) {
        total += p.cost;
    }
    return total;
}

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{
        {"order_id", p.order_id},
        {"direction", direction_to_string(p.direction)},
        {"outcome", outcome_to_string(p.outcome)},
        {"entry_price", p.entry_price},
        {"size", p.size},
        {"cost", p.cost},
        {"market_id", p.market_id},
        {"market_end_ms", p.market_end_ms},
        {"price_to_beat", optional_json(p.price_to_beat)},
        {"opened_at_ms", p.opened_at_ms},
        {"status", status_to_string(p.status)},
        {"pnl", optional_json(p.pnl)},
        {"return_amount", optional_json(p.return_amount)},
        {"resolved_at_ms", optional_json(p.resolved_at_ms)},
        {"resolved_price", optional_json(p.resolved_price)},
        {"resolution_ambiguous", p.resolution_ambiguous},
        {"strategy", p.strategy},
        {"up_price", p.up_price},
        {"down_price", p.down_price},
        {"momentum_pct", p.momentum_pct},
        {"overreaction", p.overreaction}
    };
}

void from_json(const nlohmann::json& j, Position& p) {
    p.order_id = j.at("order_id").get<std::string>();
    p.outcome = read_outcome(j, "outcome");
    p.direction = j.value("direction", "LONG") == "SHORT" ? Direction::SHORT : Direction::LONG;
    p.entry_price = j.value("entry_price", 0.0);
    p.size = j.value("size", 0.0);
    p.cost = j.value("cost", 0.0);
    p.market_id = j.value("market_id", "");
    p.market_end_ms = j.value("market_end_ms", int64_t{0});
    read_optional(j, "price_to_beat", p.price_to_beat);
    p.opened_at_ms = j.value("opened_at_ms", int64_t{0});

    auto status = status_from_string(j.value("status", "OPEN"));
    if (!status) {
        throw std::runtime_error("invalid position status for " + p.order_id);
    }
    p.status = *status;

    read_optional(j, "pnl", p.pnl);
    read_optional(j, "return_amount", p.return_amount);
    read_optional(j, "resolved_at_ms", p.resolved_at_ms);
    read_optional(j, "resolved_price", p.resolved_price);
    p.resolution_ambiguous = j.value("resolution_ambiguous", false);
    p.strategy = j.value("strategy", "");
    p.up_price = j.value("up_price", 0.0);
    p.down_price = j.value("down_price", 0.0);
    p.momentum_pct = j.value("momentum_pct", 0.0);
    p.overreaction = j.value("overreaction", false);
}

void to_json(nlohmann::json& j, const RecentOutcome& r) {
    j = nlohmann::json{
        {"win", r.win},
        {"outcome", outcome_to_string(r.outcome)},
        {"pnl", r.pnl},
        {"resolved_at_ms", r.resolved_at_ms}
    };
}

void from_json(const nlohmann::json& j, RecentOutcome& r) {
    r.win = j.value("win", false);
    r.outcome = read_outcome(j, "outcome");
    r.pnl = j.value("pnl", 0.0);
    r.resolved_at_ms = j.value("resolved_at_ms", int64_t{0});
}

void to_json(nlohmann::json& j, const TrackerState& s) {
    j = nlohmann::json{
        {"version", 1},
        {"open_positions", s.open_positions},
        {"closed_positions", s.closed_positions},
        {"total_pnl", s.total_pnl},
        {"wins", s.wins},
        {"losses", s.losses},
        {"total_cost", s.total_cost},
        {"total_return", s.total_return},
        {"recent_outcomes", s.recent_outcomes},
        {"paused_at_ms", optional_json(s.paused_at_ms)},
        {"pause_reason", s.pause_reason},
        {"pause_loss_mark", s.pause_loss_mark},
        {"halted", s.halted},
        {"halt_reason", s.halt_reason},
        {"baseline_pnl", s.baseline_pnl},
        {"baseline_wins", s.baseline_wins},
        {"baseline_losses", s.baseline_losses}
    };
}

void from_json(const nlohmann::json& j, TrackerState& s) {
    if (j.contains("open_positions")) j.at("open_positions").get_to(s.open_positions);
    if (j.contains("closed_positions")) j.at("closed_positions").get_to(s.closed_positions);
    s.total_pnl = j.value("total_pnl", 0.0);
    s.wins = j.value("wins", 0);
    s.losses = j.value("losses", 0);
    s.total_cost = j.value("total_cost", 0.0);
    s.total_return = j.value("total_return", 0.0);
    if (j.contains("recent_outcomes")) j.at("recent_outcomes").get_to(s.recent_outcomes);
    read_optional(j, "paused_at_ms", s.paused_at_ms);
    s.pause_reason = j.value("pause_reason", "");
    s.pause_loss_mark = j.value("pause_loss_mark", 0);
    s.halted = j.value("halted", false);
    s.halt_reason = j.value("halt_reason", "");
    s.baseline_pnl = j.value("baseline_pnl", 0.0);
    s.baseline_wins = j.value("baseline_wins", 0);
    s.baseline_losses = j.value("baseline_losses", 0);
}

} // namespace hedge
