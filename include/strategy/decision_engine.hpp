#pragma once

#include <string>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "strategy/window_manager.hpp"

namespace hedge {

/**
 * Every way a decision can end. Each rejecting gate has its own reason string.
 */
enum class Gate {
    TRADING_DISABLED,
    INVALID_QUOTE,
    MISSING_END_TIME,
    RISK_HALT,
    CIRCUIT_BREAKER,
    TOO_EARLY,
    MARKET_CLOSED,
    COOLDOWN,
    PROFIT_LOCKED,
    WINDOW_BUDGET,
    NO_EDGE,
    TOO_LATE_TO_OPEN,
    NO_CHEAP_SIDE,
    CANT_HEDGE,
    NO_MOMENTUM,
    NO_OVERREACTION,
    AGAINST_MOMENTUM,
    WAITING_FOR_HEDGE,
    NO_REBALANCE,
    PAIR_COST_TOO_HIGH,
    PAIR_COST_INCREASE,
    LATE_HEDGE_UNPROFITABLE,
    STREAK_BLOCK,
    ACCEPTED
};

std::string gate_reason(Gate g);
std::string gate_to_string(Gate g);

// Which rule path produced a buy
enum class EntryStrategy {
    INITIAL,
    HEDGE,
    LATE_HEDGE,
    REBALANCE,
    GROW
};

std::string strategy_to_string(EntryStrategy s);

inline bool is_hedge(EntryStrategy s) {
    return s == EntryStrategy::HEDGE || s == EntryStrategy::LATE_HEDGE;
}

/**
 * Risk inputs the decision needs from the position tracker.
 */
struct RiskState {
    Notional open_exposure{0.0};
    int consecutive_losses{0};
    std::optional<Outcome> win_streak_side;  // Side of the current winning run
    int win_streak{0};
};

struct TradeInstruction {
    Outcome outcome{Outcome::UP};
    Price price{0.0};                 // Quoted ask for the outcome
    Notional dollars{0.0};
    EntryStrategy strategy{EntryStrategy::INITIAL};
    double elapsed_minutes{0.0};
    double momentum_pct{0.0};         // Magnitude of the underlying's move
    bool overreaction{false};
    std::optional<double> simulated_pair_cost;
};

struct Decision {
    bool trade{false};
    Gate gate{Gate::ACCEPTED};
    std::string reason;
    std::string detail;
    std::optional<TradeInstruction> instruction;

    static Decision reject(Gate gate, std::string detail = "");
    static Decision accept(const TradeInstruction& instruction, std::string detail = "");
};

void to_json(nlohmann::json& j, const Decision& d);

/**
 * Hedged pair accumulation decision function.
 *
 * evaluate() is pure: no I/O, no clock reads, no mutation. Gates run in a
 * fixed order and the first failing one decides the reason.
 */
class TradeDecisionEngine {
public:
    TradeDecisionEngine(const StrategyConfig& strategy, const RiskConfig& risk,
                        const ExecutionConfig& execution);

    Decision evaluate(
        const Quote& quote,
        const Window& window,
        const MomentumHint& momentum,
        const RiskState& risk,
        int64_t now_ms
    ) const;

    // Cheap-price ceiling for the given minute of the cycle
    double cheap_threshold(double elapsed_minutes) const;

    // Minutes since the 15m market opened, derived from its end time
    static double elapsed_minutes(int64_t market_end_ms, int64_t now_ms);

    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;
    RiskConfig risk_;
    ExecutionConfig execution_;

    struct Momentum {
        double magnitude{0.0};
        std::optional<Outcome> direction;
    };
    static std::optional<Momentum> read_momentum(const MomentumHint& hint);

    Decision open_position(const Quote& quote, const Window& window,
                           const MomentumHint& momentum, const RiskState& risk,
                           double elapsed, double threshold) const;
    Decision hedge_position(const Quote& quote, const Window& window,
                            const RiskState& risk, double elapsed, double threshold) const;
    Decision rebalance_position(const Quote& quote, const Window& window,
                                const RiskState& risk, double elapsed, double threshold) const;

    // Pair-cost simulation, streak block and sizing shared by all branches
    Decision finalize(const Window& window, TradeInstruction instruction,
                      const RiskState& risk) const;

    Notional discounted(Notional dollars, const RiskState& risk) const;
};

} // namespace hedge
