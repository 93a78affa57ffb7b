#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/order_gateway.hpp"
#include "position/position_tracker.hpp"
#include "strategy/decision_engine.hpp"
#include "strategy/window_manager.hpp"

namespace hedge {

struct ExecutionResult {
    bool success{false};
    std::string reason;
    std::string order_id;
    Price limit_price{0.0};
    Size shares{0.0};
    Notional cost{0.0};
    int attempts{0};
};

void to_json(nlohmann::json& j, const ExecutionResult& r);

/**
 * Prices, sizes and submits a buy instruction, then folds a confirmed fill
 * into the window and the position tracker. A failed submission leaves both
 * untouched.
 */
class OrderExecutor {
public:
    OrderExecutor(
        const ExecutionConfig& config,
        std::shared_ptr<OrderGateway> gateway,
        WindowManager& windows,
        PositionTracker& tracker
    );

    ExecutionResult execute(
        const TradeInstruction& instruction,
        const Quote& quote,
        Window& window,
        int64_t now_ms
    );

    int64_t orders_submitted() const { return orders_submitted_.load(); }
    int64_t orders_filled() const { return orders_filled_.load(); }
    int64_t orders_failed() const { return orders_failed_.load(); }

private:
    ExecutionConfig config_;
    std::shared_ptr<OrderGateway> gateway_;
    WindowManager& windows_;
    PositionTracker& tracker_;

    std::atomic<int64_t> orders_submitted_{0};
    std::atomic<int64_t> orders_filled_{0};
    std::atomic<int64_t> orders_failed_{0};

    ExecutionResult fail(ExecutionResult result, const std::string& reason);
};

} // namespace hedge
