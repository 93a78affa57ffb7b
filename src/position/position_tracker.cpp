#include "position/position_tracker.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace hedge {

void to_json(nlohmann::json& j, const StopLossAlert& a) {
    j = nlohmann::json{
        {"order_id", a.order_id},
        {"market_id", a.market_id},
        {"outcome", outcome_to_string(a.outcome)},
        {"entry_price", a.entry_price},
        {"current_price", a.current_price},
        {"loss_pct", a.loss_pct},
        {"unrealized_pnl", a.unrealized_pnl}
    };
}

void to_json(nlohmann::json& j, const TrackerStats& s) {
    j = nlohmann::json{
        {"open_positions", s.open_positions},
        {"open_exposure", s.open_exposure},
        {"total_trades", s.total_trades},
        {"wins", s.wins},
        {"losses", s.losses},
        {"win_rate", s.win_rate},
        {"total_pnl", s.total_pnl},
        {"total_cost", s.total_cost},
        {"total_return", s.total_return},
        {"avg_pnl", s.avg_pnl},
        {"roi", s.roi},
        {"recent_trades", s.recent_trades},
        {"recent_win_rate", s.recent_win_rate},
        {"recent_pnl", s.recent_pnl},
        {"current_streak", s.current_streak},
        {"streak_type", s.streak_type.empty() ? nlohmann::json(nullptr) : nlohmann::json(s.streak_type)},
        {"paused", s.paused},
        {"pause_reason", s.pause_reason},
        {"pause_remaining_ms", s.pause_remaining_ms},
        {"halted", s.halted},
        {"halt_reason", s.halt_reason}
    };
}

PositionTracker::PositionTracker(
    const RiskConfig& config,
    std::shared_ptr<StateStore> store,
    std::shared_ptr<TradeJournal> journal
)
    : config_(config)
    , governor_(config)
    , store_(std::move(store))
    , journal_(std::move(journal))
{
    load();
}

void PositionTracker::load() {
    if (!store_) return;

    auto j = store_->load();
    if (!j) return;

    try {
        TrackerState loaded;
        from_json(*j, loaded);
        while (loaded.recent_outcomes.size() > static_cast<size_t>(config_.recent_outcomes_capacity)) {
            loaded.recent_outcomes.pop_front();
        }
        state_ = std::move(loaded);
        spdlog::info("Loaded tracker state: {}W/{}L | P&L: ${:.2f} | {} open",
                     state_.wins, state_.losses, state_.total_pnl, state_.open_positions.size());
    } catch (const std::exception& e) {
        spdlog::error("Saved tracker state is invalid, starting fresh: {}", e.what());
        state_ = TrackerState{};
    }
}

void PositionTracker::save_locked() {
    if (!store_) return;
    if (!store_->save(state_)) {
        spdlog::warn("Tracker state not persisted; will retry on next change");
    }
}

void PositionTracker::add_position(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position pos = position;
    pos.status = PositionStatus::OPEN;
    state_.open_positions.push_back(pos);
    state_.total_cost += pos.cost;

    spdlog::info("Position opened: {} {} | {:.0f} shares @ ${:.3f} | Cost: ${:.2f} | {}",
                 direction_to_string(pos.direction), outcome_to_string(pos.outcome),
                 pos.size, pos.entry_price, pos.cost, pos.strategy);
    save_locked();
}

void PositionTracker::close_locked(Position& pos, bool win, PositionStatus status, int64_t now_ms) {
    pos.status = status;
    pos.resolved_at_ms = now_ms;
    pos.return_amount = win ? pos.size * 1.0 : 0.0;
    pos.pnl = *pos.return_amount - pos.cost;

    if (win) {
        state_.wins++;
    } else {
        state_.losses++;
    }
    state_.total_pnl += *pos.pnl;
    state_.total_return += *pos.return_amount;

    RecentOutcome recent;
    recent.win = win;
    recent.outcome = pos.outcome;
    recent.pnl = *pos.pnl;
    recent.resolved_at_ms = now_ms;
    state_.recent_outcomes.push_back(recent);
    while (state_.recent_outcomes.size() > static_cast<size_t>(config_.recent_outcomes_capacity)) {
        state_.recent_outcomes.pop_front();
    }

    governor_.on_resolution(state_, win);
}

std::string PositionTracker::streak_label_locked() const {
    const auto& recent = state_.recent_outcomes;
    if (recent.empty()) return "";

    bool win = recent.back().win;
    int count = 0;
    for (auto it = recent.rbegin(); it != recent.rend() && it->win == win; ++it) {
        ++count;
    }
    return fmt::format("{}{}", win ? 'W' : 'L', count);
}

void PositionTracker::journal_locked(const Position& pos) {
    if (!journal_) return;

    JournalRow row;
    row.timestamp_ms = pos.resolved_at_ms.value_or(0);
    row.market_id = pos.market_id;
    row.direction = pos.direction;
    row.outcome = pos.outcome;
    row.win = pos.is_win();
    row.status = status_to_string(pos.status);
    row.strategy = pos.strategy;
    row.entry_price = pos.entry_price;
    row.opposite_price = pos.outcome == Outcome::UP ? pos.down_price : pos.up_price;
    row.combined_price = pos.up_price + pos.down_price;
    row.cost = pos.cost;
    row.pnl = pos.pnl.value_or(0.0);
    row.price_to_beat = pos.price_to_beat;
    row.resolved_price = pos.resolved_price;
    if (pos.price_to_beat && pos.resolved_price && *pos.price_to_beat != 0.0) {
        row.move_pct = (*pos.resolved_price - *pos.price_to_beat) / *pos.price_to_beat * 100.0;
    }
    row.overreaction = pos.overreaction;
    row.streak = streak_label_locked();

    if (!journal_->append_trade(row)) {
        spdlog::warn("Journal row for {} not written", pos.order_id);
    }
}

std::vector<Position> PositionTracker::check_resolutions(
    std::optional<ResolutionPrice> current,
    std::optional<double> fallback_price_to_beat,
    int64_t now_ms
) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> resolved;

    auto& open = state_.open_positions;
    for (auto it = open.begin(); it != open.end();) {
        if (now_ms < it->market_end_ms) {
            ++it;
            continue;
        }

        // No resolution input yet; cleanup_stale forces a loss if it never comes
        if (!current || current->observed_at_ms < it->market_end_ms) {
            spdlog::debug("Position {} ended, waiting for a resolution price", it->order_id);
            ++it;
            continue;
        }
        const double current_price = current->price;

        Position pos = *it;
        std::optional<double> ptb = pos.price_to_beat ? pos.price_to_beat : fallback_price_to_beat;
        if (!pos.price_to_beat) pos.price_to_beat = ptb;

        pos.resolved_price = current_price;

        bool win = false;
        if (ptb) {
            bool went_up = current_price > *ptb;
            win = (pos.outcome == Outcome::UP) ? went_up : !went_up;
        } else {
            pos.resolution_ambiguous = true;
            spdlog::warn("Resolution ambiguous for {} ({}): no price to beat, counted as loss",
                         pos.order_id, pos.market_id);
        }

        close_locked(pos, win, win ? PositionStatus::RESOLVED_WIN : PositionStatus::RESOLVED_LOSS, now_ms);

        spdlog::info("Position resolved {}: {} {} | P&L: ${:.2f} | Total P&L: ${:.2f}",
                     win ? "WIN" : "LOSS", direction_to_string(pos.direction),
                     outcome_to_string(pos.outcome), *pos.pnl, state_.total_pnl);

        journal_locked(pos);
        state_.closed_positions.push_back(pos);
        resolved.push_back(pos);
        it = open.erase(it);
    }

    if (!resolved.empty()) {
        save_locked();
    }
    return resolved;
}

std::vector<Position> PositionTracker::cleanup_stale(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> stale;
    const int64_t threshold = static_cast<int64_t>(config_.stale_after_minutes) * MS_PER_MINUTE;

    auto& open = state_.open_positions;
    for (auto it = open.begin(); it != open.end();) {
        if (now_ms - it->market_end_ms <= threshold) {
            ++it;
            continue;
        }

        Position pos = *it;
        close_locked(pos, false, PositionStatus::RESOLVED_STALE, now_ms);

        spdlog::warn("Stale position resolved as loss: {} {} | P&L: ${:.2f}",
                     direction_to_string(pos.direction), outcome_to_string(pos.outcome), *pos.pnl);

        journal_locked(pos);
        state_.closed_positions.push_back(pos);
        stale.push_back(pos);
        it = open.erase(it);
    }

    if (!stale.empty()) {
        save_locked();
    }
    return stale;
}

std::vector<StopLossAlert> PositionTracker::check_stop_loss(const std::string& market_id,
                                                            Price up_price, Price down_price) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StopLossAlert> alerts;

    for (const auto& pos : state_.open_positions) {
        if (pos.market_id != market_id) continue;
        Price current = pos.outcome == Outcome::UP ? up_price : down_price;
        if (current <= 0.0 || pos.cost <= 0.0) continue;

        Notional value = current * pos.size;
        Notional unrealized = value - pos.cost;
        double loss_pct = unrealized / pos.cost;

        if (loss_pct <= -config_.stop_loss_pct) {
            StopLossAlert alert;
            alert.order_id = pos.order_id;
            alert.market_id = pos.market_id;
            alert.outcome = pos.outcome;
            alert.entry_price = pos.entry_price;
            alert.current_price = current;
            alert.loss_pct = loss_pct;
            alert.unrealized_pnl = unrealized;
            alerts.push_back(alert);

            spdlog::warn("Stop-loss advisory: {} down {:.1f}% | ${:.3f} -> ${:.3f} (value ${:.2f} vs cost ${:.2f})",
                         outcome_to_string(pos.outcome), loss_pct * 100.0,
                         pos.entry_price, current, value, pos.cost);
        }
    }

    return alerts;
}

RiskGovernor::CheckResult PositionTracker::should_stop_trading(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = governor_.check(state_, now_ms);
    if (result.state_changed) {
        save_locked();
    }
    return result;
}

void PositionTracker::clear_halt() {
    std::lock_guard<std::mutex> lock(mutex_);
    governor_.clear_halt(state_);
    save_locked();
}

TrackerStats PositionTracker::get_stats(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    TrackerStats stats;

    stats.open_positions = static_cast<int>(state_.open_positions.size());
    stats.open_exposure = state_.open_exposure();
    stats.wins = state_.wins;
    stats.losses = state_.losses;
    stats.total_trades = state_.wins + state_.losses;
    stats.total_pnl = state_.total_pnl;
    stats.total_cost = state_.total_cost;
    stats.total_return = state_.total_return;

    if (stats.total_trades > 0) {
        stats.win_rate = 100.0 * stats.wins / stats.total_trades;
        stats.avg_pnl = stats.total_pnl / stats.total_trades;
    }
    if (stats.total_cost > 0.0) {
        stats.roi = stats.total_pnl / stats.total_cost * 100.0;
    }

    const auto& closed = state_.closed_positions;
    const size_t window = static_cast<size_t>(RECENT_WINDOW);
    size_t start = closed.size() > window ? closed.size() - window : 0;
    int recent_wins = 0;
    for (size_t i = start; i < closed.size(); ++i) {
        if (closed[i].is_win()) recent_wins++;
        stats.recent_pnl += closed[i].pnl.value_or(0.0);
    }
    stats.recent_trades = static_cast<int>(closed.size() - start);
    if (stats.recent_trades > 0) {
        stats.recent_win_rate = 100.0 * recent_wins / stats.recent_trades;
    }

    for (auto it = closed.rbegin(); it != closed.rend(); ++it) {
        bool win = it->is_win();
        if (stats.streak_type.empty()) {
            stats.streak_type = win ? "WIN" : "LOSS";
            stats.current_streak = 1;
        } else if ((stats.streak_type == "WIN") == win) {
            stats.current_streak++;
        } else {
            break;
        }
    }

    if (state_.paused_at_ms) {
        int64_t remaining = static_cast<int64_t>(config_.pause_minutes) * MS_PER_MINUTE
                            - (now_ms - *state_.paused_at_ms);
        if (remaining > 0) {
            stats.paused = true;
            stats.pause_reason = state_.pause_reason;
            stats.pause_remaining_ms = remaining;
        }
    }
    stats.halted = state_.halted;
    stats.halt_reason = state_.halt_reason;

    return stats;
}

Notional PositionTracker::open_exposure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.open_exposure();
}

int PositionTracker::consecutive_losses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RiskGovernor::consecutive_losses(state_);
}

RiskGovernor::WinStreak PositionTracker::win_streak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RiskGovernor::win_streak(state_);
}

TrackerState PositionTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace hedge
