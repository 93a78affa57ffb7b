#include "strategy/window_manager.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace hedge {

Window& WindowManager::get_or_create(const std::string& market_id, int64_t now_ms) {
    if (active_ && active_->market_id == market_id) {
        return *active_;
    }

    if (active_) {
        spdlog::info("Window rollover: archiving {} (up={:.0f} down={:.0f} spend=${:.2f} locked={})",
                     active_->market_id, active_->qty_up, active_->qty_down,
                     active_->total_spend(), active_->locked);
        history_.push_back(std::move(*active_));
        while (history_.size() > MAX_HISTORY) {
            history_.pop_front();
        }
    }

    Window window;
    window.market_id = market_id;
    window.created_at_ms = now_ms;
    active_ = std::move(window);

    spdlog::debug("Window opened for {}", market_id);
    return *active_;
}

void WindowManager::record_buy(Window& window, Outcome outcome, Price price, Size size,
                               Notional cost, const std::string& order_id,
                               const std::string& strategy, int64_t now_ms) {
    BuyRecord buy;
    buy.outcome = outcome;
    buy.price = price;
    buy.size = size;
    buy.cost = cost;
    buy.order_id = order_id;
    buy.strategy = strategy;
    buy.timestamp_ms = now_ms;
    window.buys.push_back(buy);

    bool was_paired = window.qty_up > 0.0 && window.qty_down > 0.0;

    if (outcome == Outcome::UP) {
        window.qty_up += size;
        window.cost_up += cost;
    } else {
        window.qty_down += size;
        window.cost_down += cost;
    }

    if (!was_paired && !window.start_pair_cost) {
        window.start_pair_cost = pair_cost(window);
    }

    bool was_locked = window.locked;
    window.locked = is_locked(window.qty_up, window.cost_up, window.qty_down, window.cost_down);

    if (window.locked && !was_locked) {
        spdlog::info("Profit locked on {}: min_qty={:.0f} > spend=${:.2f}",
                     window.market_id, std::min(window.qty_up, window.qty_down),
                     window.total_spend());
    }
}

std::optional<double> WindowManager::pair_cost(const Window& window) {
    if (window.qty_up <= 0.0 || window.qty_down <= 0.0) {
        return std::nullopt;
    }
    return window.cost_up / window.qty_up + window.cost_down / window.qty_down;
}

std::optional<double> WindowManager::simulate_pair_cost(const Window& window, Outcome outcome,
                                                        Size size, Notional cost) {
    Window copy;
    copy.qty_up = window.qty_up;
    copy.cost_up = window.cost_up;
    copy.qty_down = window.qty_down;
    copy.cost_down = window.cost_down;

    if (outcome == Outcome::UP) {
        copy.qty_up += size;
        copy.cost_up += cost;
    } else {
        copy.qty_down += size;
        copy.cost_down += cost;
    }
    return pair_cost(copy);
}

bool WindowManager::is_locked(Size qty_up, Notional cost_up, Size qty_down, Notional cost_down) {
    return std::min(qty_up, qty_down) * 1.0 > cost_up + cost_down;
}

void to_json(nlohmann::json& j, const BuyRecord& b) {
    j = nlohmann::json{
        {"outcome", outcome_to_string(b.outcome)},
        {"price", b.price},
        {"size", b.size},
        {"cost", b.cost},
        {"order_id", b.order_id},
        {"strategy", b.strategy},
        {"timestamp_ms", b.timestamp_ms}
    };
}

void to_json(nlohmann::json& j, const Window& w) {
    j = nlohmann::json{
        {"market_id", w.market_id},
        {"qty_up", w.qty_up},
        {"cost_up", w.cost_up},
        {"qty_down", w.qty_down},
        {"cost_down", w.cost_down},
        {"buys", w.buys},
        {"locked", w.locked},
        {"created_at_ms", w.created_at_ms}
    };

    auto pc = WindowManager::pair_cost(w);
    j["pair_cost"] = pc ? nlohmann::json(*pc) : nlohmann::json(nullptr);
    j["start_pair_cost"] = w.start_pair_cost ? nlohmann::json(*w.start_pair_cost)
                                             : nlohmann::json(nullptr);
}

} // namespace hedge
