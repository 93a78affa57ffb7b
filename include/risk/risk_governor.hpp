#pragma once

#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "position/position.hpp"

namespace hedge {

/**
 * Decides whether trading must stop, based on resolved outcome history.
 *
 * - A loss streak of loss_streak_pause pauses trading for pause_minutes.
 *   The pause lifts on expiry or on the next win, and an expired pause
 *   does not re-trigger until another loss extends the streak.
 * - Cumulative P&L below pnl_floor, or a low win rate after enough trades,
 *   latches a halt. Deactivation requires explicit operator action
 *   (clear_halt), which re-baselines both rules.
 *
 * Stateless itself: all pause/halt state lives in TrackerState so it persists.
 */
class RiskGovernor {
public:
    struct CheckResult {
        bool stop{false};
        std::string reason;
        bool state_changed{false};  // Pause or halt fields were updated
    };

    explicit RiskGovernor(const RiskConfig& config);

    CheckResult check(TrackerState& state, int64_t now_ms) const;

    // Called by the tracker for every resolution
    void on_resolution(TrackerState& state, bool win) const;

    void clear_halt(TrackerState& state) const;

    static int consecutive_losses(const TrackerState& state);

    // Length of the winning run at the tail of history, all on one side
    struct WinStreak {
        std::optional<Outcome> side;
        int count{0};
    };
    static WinStreak win_streak(const TrackerState& state);

    const RiskConfig& config() const { return config_; }

private:
    RiskConfig config_;

    int64_t pause_duration_ms() const;
};

} // namespace hedge
