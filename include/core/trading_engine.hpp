#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/event_log.hpp"
#include "execution/order_executor.hpp"
#include "execution/order_gateway.hpp"
#include "market_data/market_feed.hpp"
#include "persistence/state_store.hpp"
#include "persistence/trade_journal.hpp"
#include "position/position_tracker.hpp"
#include "strategy/decision_engine.hpp"
#include "strategy/window_manager.hpp"

namespace hedge {

/**
 * What one tick did, for the caller and for tests.
 */
struct TickReport {
    Decision decision;
    std::optional<ExecutionResult> execution;
    std::vector<Position> resolved;
    std::vector<Position> stale;
    std::vector<StopLossAlert> stop_loss;
};

/**
 * Owns every trading component and runs the per-tick control flow:
 * resolve, clean up stale positions, stop-loss advisory, governor,
 * decide, execute.
 *
 * on_tick is serialized; get_stats may be called from any thread.
 */
class TradingEngine {
public:
    TradingEngine(
        const Config& config,
        std::shared_ptr<OrderGateway> gateway,
        std::shared_ptr<StateStore> store,
        std::shared_ptr<TradeJournal> journal
    );

    TickReport on_tick(const MarketSnapshot& snapshot, int64_t now_ms);

    // Operator action: lift a latched governor halt
    void clear_halt(int64_t now_ms);

    nlohmann::json get_stats(int64_t now_ms) const;

    EventLog& events() { return events_; }
    const PositionTracker& tracker() const { return tracker_; }
    const WindowManager& windows() const { return windows_; }
    TradingMode mode() const { return config_.mode; }

private:
    Config config_;
    std::shared_ptr<TradeJournal> journal_;

    EventLog events_;
    WindowManager windows_;
    PositionTracker tracker_;
    TradeDecisionEngine decision_engine_;
    OrderExecutor executor_;

    mutable std::mutex tick_mutex_;
    std::set<std::string> stop_loss_alerted_;
    int64_t ticks_{0};
    int64_t trades_executed_{0};
    std::string last_reason_;

    void publish(EventType type, int64_t now_ms, const std::string& market_id, nlohmann::json data);
    void report_decision(const Decision& decision, const std::string& market_id, int64_t now_ms);
    RiskState risk_state() const;
};

} // namespace hedge
