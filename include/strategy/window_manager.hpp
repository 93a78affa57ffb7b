#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace hedge {

/**
 * One confirmed buy inside a window. Never modified after it is appended.
 */
struct BuyRecord {
    Outcome outcome{Outcome::UP};
    Price price{0.0};
    Size size{0.0};
    Notional cost{0.0};
    std::string order_id;
    std::string strategy;
    int64_t timestamp_ms{0};
};

/**
 * Hedge accumulation state for a single 15m market instance.
 *
 * Quantities and costs only grow. locked is set once the smaller leg's $1
 * payout exceeds everything spent in the window.
 */
struct Window {
    std::string market_id;
    Size qty_up{0.0};
    Notional cost_up{0.0};
    Size qty_down{0.0};
    Notional cost_down{0.0};
    std::vector<BuyRecord> buys;
    bool locked{false};
    std::optional<double> start_pair_cost;
    int64_t created_at_ms{0};

    Size qty(Outcome o) const { return o == Outcome::UP ? qty_up : qty_down; }
    Notional cost(Outcome o) const { return o == Outcome::UP ? cost_up : cost_down; }
    Notional total_spend() const { return cost_up + cost_down; }
    bool holds(Outcome o) const { return qty(o) > 0.0; }
    bool empty() const { return qty_up <= 0.0 && qty_down <= 0.0; }

    std::optional<int64_t> last_buy_ms() const {
        if (buys.empty()) return std::nullopt;
        return buys.back().timestamp_ms;
    }
};

/**
 * Owns the active window and the archive of finished ones.
 * Not thread-safe; the trading engine is the single writer.
 */
class WindowManager {
public:
    static constexpr size_t MAX_HISTORY = 50;

    WindowManager() = default;

    // Returns the window for market_id, archiving the current one on rollover
    Window& get_or_create(const std::string& market_id, int64_t now_ms);

    // Append a buy and recompute the lock
    void record_buy(Window& window, Outcome outcome, Price price, Size size,
                    Notional cost, const std::string& order_id,
                    const std::string& strategy, int64_t now_ms);

    const Window* active() const { return active_ ? &*active_ : nullptr; }
    const std::deque<Window>& history() const { return history_; }

    // Blended cost of one Up + one Down share, if both legs are held
    static std::optional<double> pair_cost(const Window& window);

    // Pair cost after a hypothetical buy, without touching the window
    static std::optional<double> simulate_pair_cost(const Window& window, Outcome outcome,
                                                    Size size, Notional cost);

    static bool is_locked(Size qty_up, Notional cost_up, Size qty_down, Notional cost_down);

private:
    std::optional<Window> active_;
    std::deque<Window> history_;
};

// JSON view used for stats and events
void to_json(nlohmann::json& j, const BuyRecord& b);
void to_json(nlohmann::json& j, const Window& w);

} // namespace hedge
