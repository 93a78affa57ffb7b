#include <gtest/gtest.h>
#include <algorithm>
#include "core/trading_engine.hpp"

using namespace hedge;

namespace {

class MemoryStateStore : public StateStore {
public:
    std::optional<nlohmann::json> saved;

    std::optional<nlohmann::json> load() override { return saved; }

    bool save(const nlohmann::json& state) override {
        saved = state;
        return true;
    }
};

class RecordingJournal : public TradeJournal {
public:
    std::vector<JournalRow> rows;
    std::vector<std::string> events;

    bool append_trade(const JournalRow& row) override {
        rows.push_back(row);
        return true;
    }

    bool append_event(const std::string& event_type, const nlohmann::json&) override {
        events.push_back(event_type);
        return true;
    }

    int count(const std::string& type) const {
        return static_cast<int>(std::count(events.begin(), events.end(), type));
    }
};

} // namespace

class TradingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryStateStore>();
        journal_ = std::make_shared<RecordingJournal>();
        gateway_ = std::make_shared<PaperGateway>();
    }

    TradingEngine& engine() {
        if (!engine_) {
            engine_ = std::make_unique<TradingEngine>(config_, gateway_, store_, journal_);
        }
        return *engine_;
    }

    int64_t at(double minute) const {
        return end_ - static_cast<int64_t>((MARKET_CYCLE_MINUTES - minute) * MS_PER_MINUTE);
    }

    MarketSnapshot snap(double up, double down, double minute, double spot = 97100.0,
                        double delta3m = 0.3) const {
        MarketSnapshot s;
        Quote q;
        q.market_id = "m1";
        q.up_price = up;
        q.down_price = down;
        q.market_end_ms = end_;
        q.market_start_ms = end_ - 15 * MS_PER_MINUTE;
        q.price_to_beat = 97000.0;
        q.up_token_id = "tok-up";
        q.down_token_id = "tok-down";
        s.quote = q;
        s.spot = SpotSample{spot, at(minute)};
        s.momentum.delta3m = delta3m;
        return s;
    }

    void preload(const TrackerState& state) {
        store_->saved = nlohmann::json(state);
    }

    static RecentOutcome loss(double pnl) {
        RecentOutcome r;
        r.win = false;
        r.pnl = pnl;
        return r;
    }

    Config config_;
    std::shared_ptr<MemoryStateStore> store_;
    std::shared_ptr<RecordingJournal> journal_;
    std::shared_ptr<PaperGateway> gateway_;
    std::unique_ptr<TradingEngine> engine_;
    const int64_t end_ = 1'700'000'900'000;
};

// ============================================================================
// Trading flow
// ============================================================================

TEST_F(TradingEngineTest, OpensHedgesThenLocksProfit) {
    auto r1 = engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));
    ASSERT_TRUE(r1.decision.trade) << r1.decision.reason;
    ASSERT_TRUE(r1.execution.has_value());
    EXPECT_TRUE(r1.execution->success);
    EXPECT_EQ(r1.execution->order_id, "paper-1");
    EXPECT_DOUBLE_EQ(r1.execution->shares, 9.0);

    auto r2 = engine().on_tick(snap(0.55, 0.38, 6.0), at(6.0));
    ASSERT_TRUE(r2.decision.trade) << r2.decision.reason << " " << r2.decision.detail;
    EXPECT_EQ(r2.decision.instruction->strategy, EntryStrategy::HEDGE);
    EXPECT_EQ(r2.decision.instruction->outcome, Outcome::DOWN);
    ASSERT_TRUE(r2.execution.has_value());
    EXPECT_DOUBLE_EQ(r2.execution->shares, 9.0);

    const Window* w = engine().windows().active();
    ASSERT_NE(w, nullptr);
    EXPECT_TRUE(w->locked);

    auto r3 = engine().on_tick(snap(0.30, 0.30, 7.0), at(7.0));
    EXPECT_FALSE(r3.decision.trade);
    EXPECT_EQ(r3.decision.reason, "profit locked");

    auto stats = engine().get_stats(at(7.0));
    EXPECT_EQ(stats["trades_executed"], 2);
    EXPECT_EQ(stats["open_positions"], 2);
    EXPECT_EQ(stats["orders_submitted"], 2);
    EXPECT_EQ(stats["trades_last_hour"], 2);
    EXPECT_EQ(stats["mode"], "PAPER");
    EXPECT_TRUE(stats["window"]["locked"].get<bool>());
}

TEST_F(TradingEngineTest, ResolvesAtMarketEndAndRollsWindow) {
    engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));
    engine().on_tick(snap(0.55, 0.38, 6.0), at(6.0));

    // First tick of the next market, spot above the old target
    MarketSnapshot next = snap(0.50, 0.50, 15.0, 97100.0);
    next.quote->market_id = "m2";
    next.quote->market_end_ms = end_ + 15 * MS_PER_MINUTE;
    next.quote->market_start_ms = end_;
    next.quote->price_to_beat = 97100.0;
    auto r = engine().on_tick(next, end_ + 1000);

    ASSERT_EQ(r.resolved.size(), 2u);
    EXPECT_EQ(r.decision.reason, "too early");

    auto state = engine().tracker().snapshot();
    EXPECT_EQ(state.wins, 1);
    EXPECT_EQ(state.losses, 1);
    EXPECT_NEAR(state.total_pnl, (9.0 - 9 * 0.303) - 9 * 0.383, 1e-9);
    EXPECT_TRUE(state.open_positions.empty());

    EXPECT_EQ(journal_->rows.size(), 2u);
    EXPECT_EQ(engine().events().recent_of_type(EventType::RESOLUTION, 10).size(), 2u);
    EXPECT_EQ(engine().events().recent_of_type(EventType::WINDOW_ROLLOVER, 10).size(), 1u);
    EXPECT_EQ(engine().windows().active()->market_id, "m2");
    EXPECT_EQ(engine().windows().history().back().market_id, "m1");
}

TEST_F(TradingEngineTest, DryRunPlacesNoOrders) {
    config_.mode = TradingMode::DRY_RUN;
    auto r = engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));

    EXPECT_TRUE(r.decision.trade);
    EXPECT_FALSE(r.execution.has_value());
    EXPECT_EQ(gateway_->orders_submitted(), 0);
    EXPECT_TRUE(engine().tracker().snapshot().open_positions.empty());
    EXPECT_TRUE(engine().windows().active()->empty());
}

TEST_F(TradingEngineTest, MissingQuoteIsRejected) {
    MarketSnapshot empty;
    auto r = engine().on_tick(empty, at(3.0));
    EXPECT_FALSE(r.decision.trade);
    EXPECT_EQ(r.decision.gate, Gate::INVALID_QUOTE);
    EXPECT_EQ(r.decision.detail, "no current quote");
}

TEST_F(TradingEngineTest, LiveModeRefused) {
    config_.mode = TradingMode::LIVE;
    EXPECT_THROW(engine(), std::runtime_error);
}

// ============================================================================
// Governor
// ============================================================================

TEST_F(TradingEngineTest, LossStreakPausesWithSingleEvent) {
    TrackerState state;
    for (int i = 0; i < 3; ++i) state.recent_outcomes.push_back(loss(-1.0));
    state.losses = 3;
    state.total_pnl = -3.0;
    preload(state);

    auto r1 = engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));
    EXPECT_FALSE(r1.decision.trade);
    EXPECT_EQ(r1.decision.gate, Gate::RISK_HALT);
    EXPECT_EQ(r1.decision.reason, "3 consecutive losses");

    auto r2 = engine().on_tick(snap(0.30, 0.60, 4.0), at(4.0));
    EXPECT_EQ(r2.decision.gate, Gate::RISK_HALT);
    EXPECT_NE(r2.decision.reason.find("paused"), std::string::npos);

    EXPECT_EQ(engine().events().recent_of_type(EventType::TRADING_PAUSED, 10).size(), 1u);
    EXPECT_EQ(journal_->count("trading_paused"), 1);
    EXPECT_EQ(gateway_->orders_submitted(), 0);
}

TEST_F(TradingEngineTest, HaltNeedsOperatorClear) {
    TrackerState state;
    state.recent_outcomes.push_back(loss(-9.0));
    state.losses = 1;
    state.total_pnl = -9.0;
    state.halted = true;
    state.halt_reason = "P&L $-9.00 hit max drawdown ($-8.00)";
    preload(state);

    auto r1 = engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));
    EXPECT_EQ(r1.decision.gate, Gate::RISK_HALT);
    EXPECT_EQ(r1.decision.reason, state.halt_reason);

    engine().clear_halt(at(3.5));
    EXPECT_EQ(engine().events().recent_of_type(EventType::HALT_CLEARED, 10).size(), 1u);
    EXPECT_FALSE(store_->saved->at("halted").get<bool>());

    auto r2 = engine().on_tick(snap(0.30, 0.60, 4.0), at(4.0));
    EXPECT_TRUE(r2.decision.trade) << r2.decision.reason;
}

// ============================================================================
// Housekeeping
// ============================================================================

TEST_F(TradingEngineTest, StopLossAdvisoryPublishedOncePerPosition) {
    engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));

    auto r1 = engine().on_tick(snap(0.20, 0.75, 4.0), at(4.0));
    auto r2 = engine().on_tick(snap(0.20, 0.75, 5.0), at(5.0));
    EXPECT_EQ(r1.stop_loss.size(), 1u);
    EXPECT_EQ(r2.stop_loss.size(), 1u);
    EXPECT_EQ(engine().events().recent_of_type(EventType::STOP_LOSS_ADVISORY, 10).size(), 1u);

    // Advisory only
    EXPECT_EQ(engine().tracker().snapshot().open_positions.size(), 1u);
}

TEST_F(TradingEngineTest, PositionWithoutResolutionPriceGoesStale) {
    engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));

    MarketSnapshot blind;
    auto waiting = engine().on_tick(blind, end_ + MS_PER_MINUTE);
    EXPECT_TRUE(waiting.resolved.empty());
    EXPECT_TRUE(waiting.stale.empty());

    auto r = engine().on_tick(blind, end_ + 6 * MS_PER_MINUTE);
    ASSERT_EQ(r.stale.size(), 1u);
    EXPECT_EQ(r.stale[0].status, PositionStatus::RESOLVED_STALE);
    EXPECT_NEAR(*r.stale[0].pnl, -r.stale[0].cost, 1e-9);
    EXPECT_EQ(engine().events().recent_of_type(EventType::STALE_CLEANUP, 10).size(), 1u);
}

TEST_F(TradingEngineTest, SpotFromBeforeMarketEndNeverSettles) {
    engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));

    // Spot feed went quiet at minute 5
    MarketSnapshot frozen;
    frozen.spot = SpotSample{97100.0, at(5.0)};

    auto r1 = engine().on_tick(frozen, end_ + 1000);
    EXPECT_TRUE(r1.resolved.empty());

    auto r2 = engine().on_tick(frozen, end_ + 6 * MS_PER_MINUTE);
    EXPECT_TRUE(r2.resolved.empty());
    ASSERT_EQ(r2.stale.size(), 1u);
    EXPECT_EQ(engine().tracker().snapshot().wins, 0);
    EXPECT_EQ(engine().tracker().snapshot().losses, 1);
}

TEST_F(TradingEngineTest, NextMarketQuoteDoesNotMarkPreviousPositions) {
    engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));

    // m2 is quoted before m1 has a settling price
    MarketSnapshot next;
    Quote q = *snap(0.10, 0.90, 15.0).quote;
    q.market_id = "m2";
    q.market_end_ms = end_ + 15 * MS_PER_MINUTE;
    q.market_start_ms = end_;
    next.quote = q;

    auto r = engine().on_tick(next, end_ + 1000);
    EXPECT_TRUE(r.resolved.empty());
    EXPECT_TRUE(r.stop_loss.empty());
    EXPECT_TRUE(engine().events().recent_of_type(EventType::STOP_LOSS_ADVISORY, 10).empty());
    EXPECT_EQ(engine().tracker().snapshot().open_positions.size(), 1u);
}

TEST_F(TradingEngineTest, JournalSkipsRejectedDecisions) {
    engine().on_tick(snap(0.50, 0.50, 3.0), at(3.0));
    EXPECT_EQ(journal_->count("decision"), 0);

    engine().on_tick(snap(0.30, 0.60, 3.5), at(3.5));
    EXPECT_EQ(journal_->count("decision"), 1);
    EXPECT_EQ(journal_->count("order"), 1);

    // Every decision still reaches the in-process log
    EXPECT_EQ(engine().events().recent_of_type(EventType::DECISION, 10).size(), 2u);
}

TEST_F(TradingEngineTest, OpenPositionsSurviveRestart) {
    engine().on_tick(snap(0.30, 0.60, 3.0), at(3.0));
    engine_.reset();

    TradingEngine restarted(config_, gateway_, store_, journal_);
    auto state = restarted.tracker().snapshot();
    ASSERT_EQ(state.open_positions.size(), 1u);
    EXPECT_EQ(state.open_positions[0].order_id, "paper-1");
    EXPECT_NEAR(restarted.tracker().open_exposure(), 9 * 0.303, 1e-9);
}
