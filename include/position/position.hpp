#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace hedge {

enum class PositionStatus {
    OPEN,
    RESOLVED_WIN,
    RESOLVED_LOSS,
    RESOLVED_STALE
};

std::string status_to_string(PositionStatus s);
std::optional<PositionStatus> status_from_string(const std::string& s);

/**
 * A confirmed buy of one outcome, held until the market resolves.
 * Immutable once resolved.
 */
struct Position {
    std::string order_id;
    Direction direction{Direction::LONG};
    Outcome outcome{Outcome::UP};
    Price entry_price{0.0};
    Size size{0.0};
    Notional cost{0.0};
    std::string market_id;
    int64_t market_end_ms{0};
    std::optional<double> price_to_beat;
    int64_t opened_at_ms{0};
    PositionStatus status{PositionStatus::OPEN};

    // Set on resolution
    std::optional<Notional> pnl;
    std::optional<Notional> return_amount;
    std::optional<int64_t> resolved_at_ms;
    std::optional<double> resolved_price;
    bool resolution_ambiguous{false};  // Resolved as a loss without price data

    // Entry context for the journal
    std::string strategy;
    Price up_price{0.0};
    Price down_price{0.0};
    double momentum_pct{0.0};
    bool overreaction{false};

    bool is_open() const { return status == PositionStatus::OPEN; }
    bool is_win() const { return status == PositionStatus::RESOLVED_WIN; }
};

// One resolved result in the governor's ring buffer
struct RecentOutcome {
    bool win{false};
    Outcome outcome{Outcome::UP};
    Notional pnl{0.0};
    int64_t resolved_at_ms{0};
};

/**
 * Everything the position tracker persists across restarts.
 */
struct TrackerState {
    std::vector<Position> open_positions;
    std::vector<Position> closed_positions;
    Notional total_pnl{0.0};
    int wins{0};
    int losses{0};
    Notional total_cost{0.0};
    Notional total_return{0.0};
    std::deque<RecentOutcome> recent_outcomes;

    // Loss-streak pause
    std::optional<int64_t> paused_at_ms;
    std::string pause_reason;
    int pause_loss_mark{0};  // losses count when the last pause triggered

    // Latched halt, cleared by an operator
    bool halted{false};
    std::string halt_reason;
    Notional baseline_pnl{0.0};
    int baseline_wins{0};
    int baseline_losses{0};

    Notional open_exposure() const;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const RecentOutcome& r);
void from_json(const nlohmann::json& j, RecentOutcome& r);

void to_json(nlohmann::json& j, const TrackerState& s);
void from_json(const nlohmann::json& j, TrackerState& s);

} // namespace hedge
