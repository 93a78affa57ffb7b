#include "risk/risk_governor.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>

namespace hedge {

RiskGovernor::RiskGovernor(const RiskConfig& config)
    : config_(config) {}

int64_t RiskGovernor::pause_duration_ms() const {
    return static_cast<int64_t>(config_.pause_minutes) * MS_PER_MINUTE;
}

int RiskGovernor::consecutive_losses(const TrackerState& state) {
    int count = 0;
    for (auto it = state.recent_outcomes.rbegin(); it != state.recent_outcomes.rend(); ++it) {
        if (it->win) break;
        ++count;
    }
    return count;
}

RiskGovernor::WinStreak RiskGovernor::win_streak(const TrackerState& state) {
    WinStreak streak;
    for (auto it = state.recent_outcomes.rbegin(); it != state.recent_outcomes.rend(); ++it) {
        if (!it->win) break;
        if (streak.side && *streak.side != it->outcome) break;
        streak.side = it->outcome;
        ++streak.count;
    }
    return streak;
}

RiskGovernor::CheckResult RiskGovernor::check(TrackerState& state, int64_t now_ms) const {
    CheckResult result;

    if (state.halted) {
        result.stop = true;
        result.reason = state.halt_reason;
        return result;
    }

    // Latching rules, measured from the last operator reset
    Notional pnl = state.total_pnl - state.baseline_pnl;
    int wins = state.wins - state.baseline_wins;
    int losses = state.losses - state.baseline_losses;
    int trades = wins + losses;

    std::string halt_reason;
    if (pnl < config_.pnl_floor) {
        halt_reason = fmt::format("P&L ${:.2f} hit max drawdown (${:.2f})", pnl, config_.pnl_floor);
    } else if (trades >= config_.min_trades_for_win_rate) {
        double win_rate = static_cast<double>(wins) / trades;
        if (win_rate < config_.min_win_rate) {
            halt_reason = fmt::format("Win rate {:.0f}% too low after {} trades",
                                      win_rate * 100.0, trades);
        }
    }

    if (!halt_reason.empty()) {
        state.halted = true;
        state.halt_reason = halt_reason;
        spdlog::error("TRADING HALTED: {} (operator reset required)", halt_reason);
        result.stop = true;
        result.reason = halt_reason;
        result.state_changed = true;
        return result;
    }

    if (state.paused_at_ms) {
        int64_t elapsed = now_ms - *state.paused_at_ms;
        if (elapsed < pause_duration_ms()) {
            result.stop = true;
            result.reason = fmt::format("{} (paused, {} left)", state.pause_reason,
                                        time_utils::format_duration_ms(pause_duration_ms() - elapsed));
            return result;
        }

        spdlog::info("Loss-streak pause expired after {}", time_utils::format_duration_ms(elapsed));
        state.paused_at_ms.reset();
        state.pause_reason.clear();
        result.state_changed = true;
    }

    int streak = consecutive_losses(state);
    if (streak >= config_.loss_streak_pause && state.losses > state.pause_loss_mark) {
        state.paused_at_ms = now_ms;
        state.pause_reason = fmt::format("{} consecutive losses", streak);
        state.pause_loss_mark = state.losses;
        spdlog::warn("Trading paused for {}m: {}", config_.pause_minutes, state.pause_reason);
        result.stop = true;
        result.reason = state.pause_reason;
        result.state_changed = true;
    }

    return result;
}

void RiskGovernor::on_resolution(TrackerState& state, bool win) const {
    if (win && state.paused_at_ms) {
        spdlog::info("Win resolved, lifting pause ({})", state.pause_reason);
        state.paused_at_ms.reset();
        state.pause_reason.clear();
    }
}

void RiskGovernor::clear_halt(TrackerState& state) const {
    if (state.halted) {
        spdlog::warn("Halt cleared by operator (was: {})", state.halt_reason);
    }
    state.halted = false;
    state.halt_reason.clear();
    state.baseline_pnl = state.total_pnl;
    state.baseline_wins = state.wins;
    state.baseline_losses = state.losses;
}

} // namespace hedge
