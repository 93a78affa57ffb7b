#include "strategy/decision_engine.hpp"
#include "execution/order_sizing.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace hedge {

std::string gate_reason(Gate g) {
    switch (g) {
        case Gate::TRADING_DISABLED: return "trading disabled";
        case Gate::INVALID_QUOTE: return "invalid quote";
        case Gate::MISSING_END_TIME: return "missing market end time";
        case Gate::RISK_HALT: return "risk governor stop";
        case Gate::CIRCUIT_BREAKER: return "circuit breaker";
        case Gate::TOO_EARLY: return "too early";
        case Gate::MARKET_CLOSED: return "market closed";
        case Gate::COOLDOWN: return "cooldown";
        case Gate::PROFIT_LOCKED: return "profit locked";
        case Gate::WINDOW_BUDGET: return "window budget exhausted";
        case Gate::NO_EDGE: return "no edge";
        case Gate::TOO_LATE_TO_OPEN: return "too late to open";
        case Gate::NO_CHEAP_SIDE: return "no cheap side";
        case Gate::CANT_HEDGE: return "can't hedge";
        case Gate::NO_MOMENTUM: return "no momentum data";
        case Gate::NO_OVERREACTION: return "no overreaction";
        case Gate::AGAINST_MOMENTUM: return "against momentum";
        case Gate::WAITING_FOR_HEDGE: return "waiting for hedge";
        case Gate::NO_REBALANCE: return "no rebalance opportunity";
        case Gate::PAIR_COST_TOO_HIGH: return "pair cost too high";
        case Gate::PAIR_COST_INCREASE: return "pair cost would increase";
        case Gate::LATE_HEDGE_UNPROFITABLE: return "late hedge unprofitable";
        case Gate::STREAK_BLOCK: return "streak bias block";
        case Gate::ACCEPTED: return "";
    }
    return "unknown";
}

std::string gate_to_string(Gate g) {
    switch (g) {
        case Gate::TRADING_DISABLED: return "TRADING_DISABLED";
        case Gate::INVALID_QUOTE: return "INVALID_QUOTE";
        case Gate::MISSING_END_TIME: return "MISSING_END_TIME";
        case Gate::RISK_HALT: return "RISK_HALT";
        case Gate::CIRCUIT_BREAKER: return "CIRCUIT_BREAKER";
        case Gate::TOO_EARLY: return "TOO_EARLY";
        case Gate::MARKET_CLOSED: return "MARKET_CLOSED";
        case Gate::COOLDOWN: return "COOLDOWN";
        case Gate::PROFIT_LOCKED: return "PROFIT_LOCKED";
        case Gate::WINDOW_BUDGET: return "WINDOW_BUDGET";
        case Gate::NO_EDGE: return "NO_EDGE";
        case Gate::TOO_LATE_TO_OPEN: return "TOO_LATE_TO_OPEN";
        case Gate::NO_CHEAP_SIDE: return "NO_CHEAP_SIDE";
        case Gate::CANT_HEDGE: return "CANT_HEDGE";
        case Gate::NO_MOMENTUM: return "NO_MOMENTUM";
        case Gate::NO_OVERREACTION: return "NO_OVERREACTION";
        case Gate::AGAINST_MOMENTUM: return "AGAINST_MOMENTUM";
        case Gate::WAITING_FOR_HEDGE: return "WAITING_FOR_HEDGE";
        case Gate::NO_REBALANCE: return "NO_REBALANCE";
        case Gate::PAIR_COST_TOO_HIGH: return "PAIR_COST_TOO_HIGH";
        case Gate::PAIR_COST_INCREASE: return "PAIR_COST_INCREASE";
        case Gate::LATE_HEDGE_UNPROFITABLE: return "LATE_HEDGE_UNPROFITABLE";
        case Gate::STREAK_BLOCK: return "STREAK_BLOCK";
        case Gate::ACCEPTED: return "ACCEPTED";
    }
    return "UNKNOWN";
}

std::string strategy_to_string(EntryStrategy s) {
    switch (s) {
        case EntryStrategy::INITIAL: return "INITIAL";
        case EntryStrategy::HEDGE: return "HEDGE";
        case EntryStrategy::LATE_HEDGE: return "LATE_HEDGE";
        case EntryStrategy::REBALANCE: return "REBALANCE";
        case EntryStrategy::GROW: return "GROW";
    }
    return "UNKNOWN";
}

Decision Decision::reject(Gate gate, std::string detail) {
    Decision d;
    d.trade = false;
    d.gate = gate;
    d.reason = gate_reason(gate);
    d.detail = std::move(detail);
    return d;
}

Decision Decision::accept(const TradeInstruction& instruction, std::string detail) {
    Decision d;
    d.trade = true;
    d.gate = Gate::ACCEPTED;
    d.instruction = instruction;
    d.detail = std::move(detail);
    return d;
}

void to_json(nlohmann::json& j, const Decision& d) {
    j = nlohmann::json{
        {"trade", d.trade},
        {"gate", gate_to_string(d.gate)},
        {"reason", d.reason},
        {"detail", d.detail}
    };
    if (d.instruction) {
        const auto& i = *d.instruction;
        j["outcome"] = outcome_to_string(i.outcome);
        j["price"] = i.price;
        j["dollars"] = i.dollars;
        j["strategy"] = strategy_to_string(i.strategy);
        j["elapsed_minutes"] = i.elapsed_minutes;
        j["momentum_pct"] = i.momentum_pct;
        j["overreaction"] = i.overreaction;
        j["simulated_pair_cost"] = i.simulated_pair_cost
            ? nlohmann::json(*i.simulated_pair_cost) : nlohmann::json(nullptr);
    }
}

TradeDecisionEngine::TradeDecisionEngine(const StrategyConfig& strategy,
                                         const RiskConfig& risk,
                                         const ExecutionConfig& execution)
    : config_(strategy), risk_(risk), execution_(execution) {}

double TradeDecisionEngine::elapsed_minutes(int64_t market_end_ms, int64_t now_ms) {
    double remaining = static_cast<double>(market_end_ms - now_ms) / MS_PER_MINUTE;
    return MARKET_CYCLE_MINUTES - remaining;
}

double TradeDecisionEngine::cheap_threshold(double elapsed) const {
    if (elapsed < config_.tier1_until_minute) return config_.tier1_max_price;
    if (elapsed < config_.tier2_until_minute) return config_.tier2_max_price;
    return config_.tier3_max_price;
}

std::optional<TradeDecisionEngine::Momentum>
TradeDecisionEngine::read_momentum(const MomentumHint& hint) {
    if (hint.empty()) return std::nullopt;

    Momentum m;
    m.magnitude = std::max(std::fabs(hint.delta1m.value_or(0.0)),
                           std::fabs(hint.delta3m.value_or(0.0)));

    double signal = 0.0;
    if (hint.delta3m && *hint.delta3m != 0.0) {
        signal = *hint.delta3m;
    } else if (hint.delta1m) {
        signal = *hint.delta1m;
    }
    if (signal > 0.0) m.direction = Outcome::UP;
    else if (signal < 0.0) m.direction = Outcome::DOWN;
    return m;
}

Decision TradeDecisionEngine::evaluate(
    const Quote& quote,
    const Window& window,
    const MomentumHint& momentum,
    const RiskState& risk,
    int64_t now_ms
) const {
    if (!config_.trading_enabled) {
        return Decision::reject(Gate::TRADING_DISABLED);
    }
    if (!quote.has_valid_prices()) {
        return Decision::reject(Gate::INVALID_QUOTE,
            fmt::format("up={:.3f} down={:.3f}", quote.up_price, quote.down_price));
    }
    if (!quote.market_end_ms) {
        return Decision::reject(Gate::MISSING_END_TIME, quote.market_id);
    }

    // Circuit breaker on open cost
    if (risk.open_exposure >= risk_.max_open_exposure) {
        return Decision::reject(Gate::CIRCUIT_BREAKER,
            fmt::format("open exposure ${:.2f}", risk.open_exposure));
    }

    double elapsed = elapsed_minutes(*quote.market_end_ms, now_ms);
    if (elapsed < config_.min_elapsed_minutes) {
        return Decision::reject(Gate::TOO_EARLY, fmt::format("elapsed {:.2f}m", elapsed));
    }
    if (elapsed >= MARKET_CYCLE_MINUTES) {
        return Decision::reject(Gate::MARKET_CLOSED, fmt::format("elapsed {:.2f}m", elapsed));
    }

    if (auto last = window.last_buy_ms()) {
        int64_t since = now_ms - *last;
        if (since < config_.cooldown_ms) {
            return Decision::reject(Gate::COOLDOWN, fmt::format("{}ms since last buy", since));
        }
    }

    if (window.locked) {
        return Decision::reject(Gate::PROFIT_LOCKED);
    }

    if (window.total_spend() >= config_.max_window_spend) {
        return Decision::reject(Gate::WINDOW_BUDGET,
            fmt::format("spent ${:.2f}", window.total_spend()));
    }

    double threshold = cheap_threshold(elapsed);

    bool holds_up = window.holds(Outcome::UP);
    bool holds_down = window.holds(Outcome::DOWN);

    if (!holds_up && !holds_down) {
        double sum = quote.up_price + quote.down_price;
        if (sum > config_.max_entry_sum) {
            return Decision::reject(Gate::NO_EDGE, fmt::format("sum {:.3f}", sum));
        }
        return open_position(quote, window, momentum, risk, elapsed, threshold);
    }

    if (holds_up != holds_down) {
        return hedge_position(quote, window, risk, elapsed, threshold);
    }

    return rebalance_position(quote, window, risk, elapsed, threshold);
}

Decision TradeDecisionEngine::open_position(const Quote& quote, const Window& window,
                                            const MomentumHint& momentum,
                                            const RiskState& risk,
                                            double elapsed, double threshold) const {
    if (elapsed > config_.new_position_cutoff_minutes) {
        return Decision::reject(Gate::TOO_LATE_TO_OPEN, fmt::format("elapsed {:.2f}m", elapsed));
    }

    std::vector<Outcome> cheap;
    for (Outcome o : {Outcome::UP, Outcome::DOWN}) {
        if (quote.price_of(o) <= threshold) cheap.push_back(o);
    }
    if (cheap.empty()) {
        return Decision::reject(Gate::NO_CHEAP_SIDE,
            fmt::format("up={:.3f} down={:.3f} threshold={:.2f}",
                        quote.up_price, quote.down_price, threshold));
    }

    std::vector<Outcome> hedgeable;
    for (Outcome o : cheap) {
        if (quote.price_of(opposite(o)) <= config_.hedge_max_opposite_price) {
            hedgeable.push_back(o);
        }
    }
    if (hedgeable.empty()) {
        return Decision::reject(Gate::CANT_HEDGE,
            fmt::format("opposite above {:.2f}", config_.hedge_max_opposite_price));
    }

    auto m = read_momentum(momentum);
    if (!m) {
        return Decision::reject(Gate::NO_MOMENTUM);
    }
    if (m->magnitude < config_.min_momentum_pct) {
        return Decision::reject(Gate::NO_OVERREACTION,
            fmt::format("move {:.3f}% < {:.2f}%", m->magnitude, config_.min_momentum_pct));
    }

    auto match = std::find_if(hedgeable.begin(), hedgeable.end(),
                              [&](Outcome o) { return m->direction && *m->direction == o; });
    if (match == hedgeable.end()) {
        return Decision::reject(Gate::AGAINST_MOMENTUM,
            fmt::format("momentum {}", m->direction ? outcome_to_string(*m->direction) : "flat"));
    }

    TradeInstruction instruction;
    instruction.outcome = *match;
    instruction.price = quote.price_of(*match);
    instruction.dollars = config_.base_order_dollars;
    instruction.strategy = EntryStrategy::INITIAL;
    instruction.elapsed_minutes = elapsed;
    instruction.momentum_pct = m->magnitude;
    instruction.overreaction = true;
    return finalize(window, instruction, risk);
}

Decision TradeDecisionEngine::hedge_position(const Quote& quote, const Window& window,
                                             const RiskState& risk,
                                             double elapsed, double threshold) const {
    Outcome held = window.holds(Outcome::UP) ? Outcome::UP : Outcome::DOWN;
    Outcome missing = opposite(held);
    Price price = quote.price_of(missing);

    TradeInstruction instruction;
    instruction.outcome = missing;
    instruction.price = price;
    instruction.elapsed_minutes = elapsed;

    if (price <= threshold) {
        instruction.strategy = EntryStrategy::HEDGE;
    } else if (elapsed >= config_.late_hedge_minute && price <= config_.late_hedge_max_price) {
        instruction.strategy = EntryStrategy::LATE_HEDGE;
    } else {
        return Decision::reject(Gate::WAITING_FOR_HEDGE,
            fmt::format("{} at {:.3f} above {:.2f}", outcome_to_string(missing), price, threshold));
    }

    // Match the held quantity at the price the executor will pay
    Price limit = limit_price_for(price, execution_);
    instruction.dollars = window.qty(held) * limit;
    return finalize(window, instruction, risk);
}

Decision TradeDecisionEngine::rebalance_position(const Quote& quote, const Window& window,
                                                 const RiskState& risk,
                                                 double elapsed, double threshold) const {
    TradeInstruction instruction;
    instruction.elapsed_minutes = elapsed;

    if (window.qty_up != window.qty_down) {
        Outcome smaller = window.qty_up < window.qty_down ? Outcome::UP : Outcome::DOWN;
        Price price = quote.price_of(smaller);
        if (price <= threshold) {
            Size gap = window.qty(opposite(smaller)) - window.qty(smaller);
            instruction.outcome = smaller;
            instruction.price = price;
            instruction.dollars = gap * limit_price_for(price, execution_);
            instruction.strategy = EntryStrategy::REBALANCE;
            return finalize(window, instruction, risk);
        }
    } else if (quote.up_price <= threshold && quote.down_price <= threshold) {
        Outcome cheaper = quote.up_price <= quote.down_price ? Outcome::UP : Outcome::DOWN;
        instruction.outcome = cheaper;
        instruction.price = quote.price_of(cheaper);
        instruction.dollars = config_.base_order_dollars;
        instruction.strategy = EntryStrategy::GROW;
        return finalize(window, instruction, risk);
    }

    return Decision::reject(Gate::NO_REBALANCE,
        fmt::format("up={:.0f}@{:.3f} down={:.0f}@{:.3f}",
                    window.qty_up, quote.up_price, window.qty_down, quote.down_price));
}

Notional TradeDecisionEngine::discounted(Notional dollars, const RiskState& risk) const {
    if (risk.consecutive_losses >= config_.loss_streak_discount_after) {
        dollars = std::max(config_.min_order_dollars, dollars * config_.loss_streak_size_factor);
    }
    return dollars;
}

Decision TradeDecisionEngine::finalize(const Window& window, TradeInstruction instruction,
                                       const RiskState& risk) const {
    bool hedge = is_hedge(instruction.strategy);
    if (!hedge) {
        instruction.dollars = discounted(instruction.dollars, risk);
    }

    Notional remaining = config_.max_window_spend - window.total_spend();
    instruction.dollars = std::min(instruction.dollars, remaining);

    // Same sizing the executor applies
    Price limit = limit_price_for(instruction.price, execution_);
    Size shares = shares_for(instruction.dollars, limit, execution_);
    Notional cost = shares * limit;

    // The share floor can push the fill past what the window has left
    if (cost > remaining + 1e-9) {
        return Decision::reject(Gate::WINDOW_BUDGET,
            fmt::format("{:.0f} shares cost ${:.2f}, ${:.2f} left", shares, cost, remaining));
    }

    instruction.simulated_pair_cost =
        WindowManager::simulate_pair_cost(window, instruction.outcome, shares, cost);

    if (instruction.simulated_pair_cost) {
        double sim = *instruction.simulated_pair_cost;
        if (instruction.strategy == EntryStrategy::LATE_HEDGE) {
            if (sim >= 1.0) {
                return Decision::reject(Gate::LATE_HEDGE_UNPROFITABLE,
                    fmt::format("simulated pair cost {:.4f}", sim));
            }
        } else {
            if (sim >= config_.max_pair_cost) {
                return Decision::reject(Gate::PAIR_COST_TOO_HIGH,
                    fmt::format("simulated pair cost {:.4f} >= {:.2f}", sim, config_.max_pair_cost));
            }
            auto current = WindowManager::pair_cost(window);
            if (current && sim > *current + 1e-12) {
                return Decision::reject(Gate::PAIR_COST_INCREASE,
                    fmt::format("simulated {:.4f} > current {:.4f}", sim, *current));
            }
        }
    }

    if (!hedge && risk.win_streak >= config_.streak_block_wins &&
        risk.win_streak_side && *risk.win_streak_side == instruction.outcome &&
        instruction.price > config_.streak_block_max_price) {
        return Decision::reject(Gate::STREAK_BLOCK,
            fmt::format("{} wins on {}", risk.win_streak, outcome_to_string(instruction.outcome)));
    }

    std::string detail = fmt::format("{} {} ${:.2f} @ {:.3f}",
        strategy_to_string(instruction.strategy), outcome_to_string(instruction.outcome),
        instruction.dollars, instruction.price);
    spdlog::debug("Decision: {}", detail);
    return Decision::accept(instruction, detail);
}

} // namespace hedge
