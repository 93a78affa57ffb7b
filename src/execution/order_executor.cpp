#include "execution/order_executor.hpp"
#include "execution/order_sizing.hpp"
#include <spdlog/spdlog.h>

namespace hedge {

void to_json(nlohmann::json& j, const ExecutionResult& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"reason", r.reason},
        {"order_id", r.order_id},
        {"limit_price", r.limit_price},
        {"shares", r.shares},
        {"cost", r.cost},
        {"attempts", r.attempts}
    };
}

OrderExecutor::OrderExecutor(
    const ExecutionConfig& config,
    std::shared_ptr<OrderGateway> gateway,
    WindowManager& windows,
    PositionTracker& tracker
)
    : config_(config)
    , gateway_(std::move(gateway))
    , windows_(windows)
    , tracker_(tracker)
{
}

ExecutionResult OrderExecutor::fail(ExecutionResult result, const std::string& reason) {
    orders_failed_++;
    result.success = false;
    result.reason = reason;
    spdlog::warn("Order failed: {}", reason);
    return result;
}

ExecutionResult OrderExecutor::execute(
    const TradeInstruction& instruction,
    const Quote& quote,
    Window& window,
    int64_t now_ms
) {
    ExecutionResult result;
    result.limit_price = limit_price_for(instruction.price, config_);
    result.shares = shares_for(instruction.dollars, result.limit_price, config_);
    result.cost = result.shares * result.limit_price;

    auto token = quote.token_for(instruction.outcome);
    if (!token || token->empty()) {
        return fail(result, "missing token id");
    }
    if (!quote.market_end_ms) {
        return fail(result, "missing market end time");
    }

    OrderRequest request;
    request.token_id = *token;
    request.side = Side::BUY;
    request.price = result.limit_price;
    request.size = result.shares;
    request.type = OrderType::GTC;

    spdlog::info("Submitting {} {} {:.0f} @ {:.3f} (${:.2f}) via {}",
                 strategy_to_string(instruction.strategy), outcome_to_string(instruction.outcome),
                 result.shares, result.limit_price, result.cost, gateway_->name());

    orders_submitted_++;
    OrderResponse response;
    try {
        response = gateway_->submit(request);
    } catch (const std::exception& e) {
        return fail(result, fmt::format("gateway error: {}", e.what()));
    }
    result.attempts = response.attempts;

    if (!response.success) {
        return fail(result, response.error_message.empty() ? "order rejected" : response.error_message);
    }
    if (response.order_id.empty()) {
        return fail(result, "no order id returned");
    }

    result.success = true;
    result.order_id = response.order_id;
    orders_filled_++;

    std::string strategy = strategy_to_string(instruction.strategy);
    windows_.record_buy(window, instruction.outcome, result.limit_price, result.shares,
                        result.cost, result.order_id, strategy, now_ms);

    Position position;
    position.order_id = result.order_id;
    position.direction = direction_for(instruction.outcome);
    position.outcome = instruction.outcome;
    position.entry_price = result.limit_price;
    position.size = result.shares;
    position.cost = result.cost;
    position.market_id = quote.market_id;
    position.market_end_ms = *quote.market_end_ms;
    position.price_to_beat = quote.price_to_beat;
    position.opened_at_ms = now_ms;
    position.strategy = strategy;
    position.up_price = quote.up_price;
    position.down_price = quote.down_price;
    position.momentum_pct = instruction.momentum_pct;
    position.overreaction = instruction.overreaction;
    tracker_.add_position(position);

    return result;
}

} // namespace hedge
