#include "core/trading_engine.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hedge {

TradingEngine::TradingEngine(
    const Config& config,
    std::shared_ptr<OrderGateway> gateway,
    std::shared_ptr<StateStore> store,
    std::shared_ptr<TradeJournal> journal
)
    : config_(config)
    , journal_(journal)
    , tracker_(config.risk, std::move(store), journal)
    , decision_engine_(config.strategy, config.risk, config.execution)
    , executor_(config.execution, std::move(gateway), windows_, tracker_)
{
    if (config_.mode == TradingMode::LIVE) {
        throw std::runtime_error("live mode requires a signing gateway, which this build does not provide");
    }

    // Rejections repeat every tick; only the rest goes to the journal
    if (journal_) {
        events_.subscribe([this](const EngineEvent& e) {
            if (e.type == EventType::DECISION && !e.data.value("trade", false)) {
                return;
            }
            nlohmann::json j = e;
            journal_->append_event(event_type_to_string(e.type), j);
        });
    }

    spdlog::info("Trading engine ready: mode={} trading_enabled={}",
                 mode_to_string(config_.mode), config_.strategy.trading_enabled);
}

void TradingEngine::publish(EventType type, int64_t now_ms, const std::string& market_id,
                            nlohmann::json data) {
    EngineEvent event;
    event.type = type;
    event.ts_ms = now_ms;
    event.market_id = market_id;
    event.data = std::move(data);
    events_.publish(std::move(event));
}

void TradingEngine::report_decision(const Decision& decision, const std::string& market_id,
                                    int64_t now_ms) {
    nlohmann::json j = decision;
    publish(EventType::DECISION, now_ms, market_id, j);

    if (decision.trade) {
        spdlog::info("TRADE {}: {}", market_id, decision.detail);
    } else if (decision.reason != last_reason_) {
        spdlog::info("No trade: {}{}", decision.reason,
                     decision.detail.empty() ? "" : " (" + decision.detail + ")");
    } else {
        spdlog::debug("No trade: {} ({})", decision.reason, decision.detail);
    }
    last_reason_ = decision.trade ? std::string() : decision.reason;
}

RiskState TradingEngine::risk_state() const {
    RiskState risk;
    risk.open_exposure = tracker_.open_exposure();
    risk.consecutive_losses = tracker_.consecutive_losses();
    auto streak = tracker_.win_streak();
    risk.win_streak_side = streak.side;
    risk.win_streak = streak.count;
    return risk;
}

TickReport TradingEngine::on_tick(const MarketSnapshot& snapshot, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    ticks_++;
    TickReport report;

    std::optional<ResolutionPrice> spot;
    if (snapshot.spot) spot = ResolutionPrice{snapshot.spot->price, snapshot.spot->ts_ms};
    std::optional<double> fallback_ptb;
    if (snapshot.quote) fallback_ptb = snapshot.quote->price_to_beat;
    std::string market_id = snapshot.quote ? snapshot.quote->market_id : std::string();

    // 1. Resolutions
    report.resolved = tracker_.check_resolutions(spot, fallback_ptb, now_ms);
    for (const auto& pos : report.resolved) {
        stop_loss_alerted_.erase(pos.order_id);
        publish(EventType::RESOLUTION, now_ms, pos.market_id, pos);
    }

    // 2. Stale cleanup
    report.stale = tracker_.cleanup_stale(now_ms);
    for (const auto& pos : report.stale) {
        stop_loss_alerted_.erase(pos.order_id);
        publish(EventType::STALE_CLEANUP, now_ms, pos.market_id, pos);
    }

    // 3. Stop-loss advisory, once per position
    if (snapshot.quote) {
        report.stop_loss = tracker_.check_stop_loss(snapshot.quote->market_id,
                                                     snapshot.quote->up_price,
                                                     snapshot.quote->down_price);
        for (const auto& alert : report.stop_loss) {
            if (stop_loss_alerted_.insert(alert.order_id).second) {
                publish(EventType::STOP_LOSS_ADVISORY, now_ms, alert.market_id, alert);
            }
        }
    }

    // 4. Governor
    auto governor = tracker_.should_stop_trading(now_ms);
    if (governor.stop) {
        if (governor.state_changed) {
            auto state = tracker_.snapshot();
            EventType type = state.halted ? EventType::TRADING_HALTED : EventType::TRADING_PAUSED;
            publish(type, now_ms, market_id, nlohmann::json{{"reason", governor.reason}});
        }
        report.decision = Decision::reject(Gate::RISK_HALT);
        report.decision.reason = governor.reason;
        report_decision(report.decision, market_id, now_ms);
        return report;
    }

    if (!snapshot.quote) {
        report.decision = Decision::reject(Gate::INVALID_QUOTE, "no current quote");
        report_decision(report.decision, market_id, now_ms);
        return report;
    }
    const Quote& quote = *snapshot.quote;

    // 5. Decide
    const Window* previous = windows_.active();
    std::string previous_id = previous ? previous->market_id : std::string();
    Window& window = windows_.get_or_create(quote.market_id, now_ms);
    if (!previous_id.empty() && previous_id != quote.market_id) {
        const auto& archived = windows_.history().back();
        publish(EventType::WINDOW_ROLLOVER, now_ms, previous_id, archived);
    }

    report.decision = decision_engine_.evaluate(quote, window, snapshot.momentum, risk_state(), now_ms);
    report_decision(report.decision, quote.market_id, now_ms);

    if (!report.decision.trade || !report.decision.instruction) {
        return report;
    }

    // 6. Execute
    const TradeInstruction& instruction = *report.decision.instruction;
    if (config_.mode == TradingMode::DRY_RUN) {
        spdlog::info("[DRY RUN] Would buy {} ${:.2f} @ {:.3f} ({})",
                     outcome_to_string(instruction.outcome), instruction.dollars,
                     instruction.price, strategy_to_string(instruction.strategy));
        return report;
    }

    report.execution = executor_.execute(instruction, quote, window, now_ms);
    nlohmann::json order = *report.execution;
    order["strategy"] = strategy_to_string(instruction.strategy);
    order["outcome"] = outcome_to_string(instruction.outcome);
    publish(EventType::ORDER, now_ms, quote.market_id, order);

    if (report.execution->success) {
        trades_executed_++;
    }
    return report;
}

void TradingEngine::clear_halt(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    tracker_.clear_halt();
    publish(EventType::HALT_CLEARED, now_ms, "", nlohmann::json::object());
}

nlohmann::json TradingEngine::get_stats(int64_t now_ms) const {
    nlohmann::json j = tracker_.get_stats(now_ms);

    j["mode"] = mode_to_string(config_.mode);
    j["trading_enabled"] = config_.strategy.trading_enabled;

    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        const Window* active = windows_.active();
        j["window"] = active ? nlohmann::json(*active) : nlohmann::json(nullptr);
        j["ticks"] = ticks_;
        j["trades_executed"] = trades_executed_;
    }

    auto state = tracker_.snapshot();
    int last_hour = 0;
    const int64_t hour_ago = now_ms - 60 * MS_PER_MINUTE;
    for (const auto& p : state.open_positions) {
        if (p.opened_at_ms >= hour_ago) last_hour++;
    }
    for (const auto& p : state.closed_positions) {
        if (p.opened_at_ms >= hour_ago) last_hour++;
    }
    j["trades_last_hour"] = last_hour;
    j["orders_submitted"] = executor_.orders_submitted();
    j["orders_failed"] = executor_.orders_failed();

    return j;
}

} // namespace hedge
