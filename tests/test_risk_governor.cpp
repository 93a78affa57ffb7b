#include <gtest/gtest.h>
#include "risk/risk_governor.hpp"

using namespace hedge;

class RiskGovernorTest : public ::testing::Test {
protected:
    void record(bool win, double pnl, Outcome outcome = Outcome::UP) {
        RecentOutcome r;
        r.win = win;
        r.outcome = outcome;
        r.pnl = pnl;
        r.resolved_at_ms = now_;
        state_.recent_outcomes.push_back(r);
        if (win) state_.wins++;
        else state_.losses++;
        state_.total_pnl += pnl;
        governor_.on_resolution(state_, win);
    }

    RiskConfig config_;
    RiskGovernor governor_{config_};
    TrackerState state_;
    const int64_t now_ = 1'700'000'000'000;
    const int64_t minute_ = MS_PER_MINUTE;
};

TEST_F(RiskGovernorTest, FreshStateAllowsTrading) {
    auto r = governor_.check(state_, now_);
    EXPECT_FALSE(r.stop);
    EXPECT_FALSE(r.state_changed);
}

TEST_F(RiskGovernorTest, ConsecutiveLossesCountFromTail) {
    record(false, -1);
    record(true, 2);
    record(false, -1);
    record(false, -1);
    EXPECT_EQ(RiskGovernor::consecutive_losses(state_), 2);
}

TEST_F(RiskGovernorTest, WinStreakStopsAtSideChange) {
    record(true, 1, Outcome::DOWN);
    record(true, 1, Outcome::UP);
    record(true, 1, Outcome::UP);

    auto streak = RiskGovernor::win_streak(state_);
    EXPECT_EQ(streak.count, 2);
    ASSERT_TRUE(streak.side.has_value());
    EXPECT_EQ(*streak.side, Outcome::UP);

    record(false, -1);
    EXPECT_EQ(RiskGovernor::win_streak(state_).count, 0);
    EXPECT_FALSE(RiskGovernor::win_streak(state_).side.has_value());
}

TEST_F(RiskGovernorTest, LossStreakPausesThenExpires) {
    record(false, -1);
    record(false, -1);
    record(false, -1);

    auto r = governor_.check(state_, now_);
    EXPECT_TRUE(r.stop);
    EXPECT_TRUE(r.state_changed);
    EXPECT_EQ(r.reason, "3 consecutive losses");

    // Still paused ten minutes later
    r = governor_.check(state_, now_ + 10 * minute_);
    EXPECT_TRUE(r.stop);
    EXPECT_FALSE(r.state_changed);
    EXPECT_NE(r.reason.find("paused"), std::string::npos);

    // Expired after thirty; the same streak does not pause again
    r = governor_.check(state_, now_ + 30 * minute_);
    EXPECT_FALSE(r.stop);
    EXPECT_TRUE(r.state_changed);
    EXPECT_FALSE(state_.paused_at_ms.has_value());

    r = governor_.check(state_, now_ + 31 * minute_);
    EXPECT_FALSE(r.stop);
}

TEST_F(RiskGovernorTest, AnotherLossAfterExpiryPausesAgain) {
    record(false, -1);
    record(false, -1);
    record(false, -1);
    ASSERT_TRUE(governor_.check(state_, now_).stop);
    ASSERT_FALSE(governor_.check(state_, now_ + 30 * minute_).stop);

    record(false, -1);
    auto r = governor_.check(state_, now_ + 31 * minute_);
    EXPECT_TRUE(r.stop);
    EXPECT_EQ(r.reason, "4 consecutive losses");
}

TEST_F(RiskGovernorTest, WinLiftsPauseEarly) {
    record(false, -1);
    record(false, -1);
    record(false, -1);
    ASSERT_TRUE(governor_.check(state_, now_).stop);

    record(true, 2);
    EXPECT_FALSE(state_.paused_at_ms.has_value());
    EXPECT_FALSE(governor_.check(state_, now_ + minute_).stop);
}

TEST_F(RiskGovernorTest, DrawdownLatchesHalt) {
    record(false, -5);
    record(true, 1);
    record(false, -5);

    auto r = governor_.check(state_, now_);
    EXPECT_TRUE(r.stop);
    EXPECT_TRUE(r.state_changed);
    EXPECT_TRUE(state_.halted);
    EXPECT_EQ(r.reason, "P&L $-9.00 hit max drawdown ($-8.00)");

    // A later win does not unlatch it
    record(true, 5);
    r = governor_.check(state_, now_ + 60 * minute_);
    EXPECT_TRUE(r.stop);
    EXPECT_EQ(r.reason, "P&L $-9.00 hit max drawdown ($-8.00)");
}

TEST_F(RiskGovernorTest, LowWinRateHaltsOnlyAfterMinimumTrades) {
    // 1 win, 4 losses alternating so no loss streak reaches three
    record(false, -0.5);
    record(false, -0.5);
    record(true, 0.5);
    record(false, -0.5);
    record(false, -0.5);
    EXPECT_FALSE(governor_.check(state_, now_).stop);

    record(true, 0.5);   // 2 of 6 = 33%
    EXPECT_FALSE(governor_.check(state_, now_).stop);

    record(false, -0.5);  // 2 of 7 = 28%
    auto r = governor_.check(state_, now_);
    EXPECT_TRUE(r.stop);
    EXPECT_EQ(r.reason, "Win rate 29% too low after 7 trades");
}

TEST_F(RiskGovernorTest, ClearHaltRebaselines) {
    record(false, -5);
    record(false, -5);
    ASSERT_TRUE(governor_.check(state_, now_).stop);

    governor_.clear_halt(state_);
    EXPECT_FALSE(state_.halted);
    EXPECT_DOUBLE_EQ(state_.baseline_pnl, -10.0);
    EXPECT_FALSE(governor_.check(state_, now_).stop);

    // Drawdown measured from the new baseline
    record(true, 1);
    record(false, -5);
    EXPECT_FALSE(governor_.check(state_, now_).stop);
    record(false, -5);
    EXPECT_TRUE(governor_.check(state_, now_).stop);
}
