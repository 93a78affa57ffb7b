#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "position/position.hpp"
#include "risk/risk_governor.hpp"
#include "persistence/state_store.hpp"
#include "persistence/trade_journal.hpp"

namespace hedge {

/**
 * Open position whose mark-to-market loss reached the stop-loss threshold.
 * Informational only; nothing is sold.
 */
struct StopLossAlert {
    std::string order_id;
    std::string market_id;
    Outcome outcome{Outcome::UP};
    Price entry_price{0.0};
    Price current_price{0.0};
    double loss_pct{0.0};         // Negative fraction, e.g. -0.25
    Notional unrealized_pnl{0.0};
};

void to_json(nlohmann::json& j, const StopLossAlert& a);

/**
 * Spot observation offered for settling ended markets. Only a sample taken
 * at or after a market's end can settle it.
 */
struct ResolutionPrice {
    double price{0.0};
    int64_t observed_at_ms{0};
};

struct TrackerStats {
    int open_positions{0};
    Notional open_exposure{0.0};
    int total_trades{0};
    int wins{0};
    int losses{0};
    double win_rate{0.0};         // Percent
    Notional total_pnl{0.0};
    Notional total_cost{0.0};
    Notional total_return{0.0};
    Notional avg_pnl{0.0};
    double roi{0.0};              // Percent of total cost
    int recent_trades{0};
    double recent_win_rate{0.0};  // Percent over the last 10
    Notional recent_pnl{0.0};
    int current_streak{0};
    std::string streak_type;      // "WIN", "LOSS" or empty
    bool paused{false};
    std::string pause_reason;
    int64_t pause_remaining_ms{0};
    bool halted{false};
    std::string halt_reason;
};

void to_json(nlohmann::json& j, const TrackerStats& s);

/**
 * Owns position lifecycle, aggregate P&L and the governor state.
 *
 * State is loaded from the store at construction and saved after every
 * mutation. Save failures are logged and do not interrupt trading.
 * Thread-safe: stats may be read from another thread.
 */
class PositionTracker {
public:
    static constexpr int RECENT_WINDOW = 10;

    PositionTracker(
        const RiskConfig& config,
        std::shared_ptr<StateStore> store,
        std::shared_ptr<TradeJournal> journal
    );

    // Record a confirmed fill as an open position
    void add_position(const Position& position);

    // Resolve every open position whose market has ended. Without a price
    // observed after that end nothing resolves; a missing price to beat
    // resolves as a loss. Repeat calls are no-ops.
    std::vector<Position> check_resolutions(
        std::optional<ResolutionPrice> current,
        std::optional<double> fallback_price_to_beat,
        int64_t now_ms
    );

    // Force-resolve positions left open too long past their market end
    std::vector<Position> cleanup_stale(int64_t now_ms);

    // Marks only positions in market_id; other markets' prices are not comparable
    std::vector<StopLossAlert> check_stop_loss(const std::string& market_id,
                                               Price up_price, Price down_price) const;

    RiskGovernor::CheckResult should_stop_trading(int64_t now_ms);
    void clear_halt();

    TrackerStats get_stats(int64_t now_ms) const;

    // Inputs for the decision engine's risk gates
    Notional open_exposure() const;
    int consecutive_losses() const;
    RiskGovernor::WinStreak win_streak() const;

    TrackerState snapshot() const;

private:
    RiskConfig config_;
    RiskGovernor governor_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<TradeJournal> journal_;

    mutable std::mutex mutex_;
    TrackerState state_;

    void load();
    void save_locked();

    // Moves an open position to closed and updates the aggregates
    void close_locked(Position& pos, bool win, PositionStatus status, int64_t now_ms);
    void journal_locked(const Position& pos);
    std::string streak_label_locked() const;
};

} // namespace hedge
