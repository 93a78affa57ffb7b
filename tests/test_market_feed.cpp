#include <gtest/gtest.h>
#include "market_data/market_feed.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>

using namespace hedge;

// ============================================================================
// Tick parsing
// ============================================================================

TEST(TickParseTest, QuoteTick) {
    auto tick = parse_tick_line(
        R"({"type":"quote","ts_ms":1000,"market_id":"m1","up":0.31,"down":0.62,)"
        R"("end_ms":900000,"up_token":"tu","down_token":"td"})");

    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(tick->type, TickType::QUOTE);
    EXPECT_EQ(*tick->ts_ms, 1000);
    EXPECT_EQ(tick->quote.market_id, "m1");
    EXPECT_DOUBLE_EQ(tick->quote.up_price, 0.31);
    EXPECT_DOUBLE_EQ(tick->quote.down_price, 0.62);
    EXPECT_EQ(*tick->quote.market_end_ms, 900000);
    EXPECT_FALSE(tick->quote.market_start_ms.has_value());
    EXPECT_EQ(*tick->quote.up_token_id, "tu");
    EXPECT_EQ(*tick->quote.down_token_id, "td");
}

TEST(TickParseTest, QuoteWithIsoEndTime) {
    auto tick = parse_tick_line(
        R"({"type":"quote","market_id":"m1","up":0.5,"down":0.5,"end_time":"2023-11-14T22:28:20Z"})");
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(*tick->quote.market_end_ms, 1'700'000'900'000);
    EXPECT_FALSE(tick->ts_ms.has_value());
}

TEST(TickParseTest, QuoteWithoutEndTimeRejected) {
    EXPECT_FALSE(parse_tick_line(R"({"type":"quote","market_id":"m1","up":0.5,"down":0.5})"));
}

TEST(TickParseTest, QuoteWithWrongTypesRejected) {
    EXPECT_FALSE(parse_tick_line(R"({"type":"quote","market_id":"m1","up":"0.5","down":0.5,"end_ms":1})"));
    EXPECT_FALSE(parse_tick_line(R"({"type":"quote","up":0.5,"down":0.5,"end_ms":1})"));
}

TEST(TickParseTest, SpotTick) {
    auto tick = parse_tick_line(R"({"type":"spot","ts_ms":5,"price":97000.5})");
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(tick->type, TickType::SPOT);
    EXPECT_DOUBLE_EQ(tick->price, 97000.5);
}

TEST(TickParseTest, BadSpotAndUnknownTypesRejected) {
    EXPECT_FALSE(parse_tick_line(R"({"type":"spot","price":0})"));
    EXPECT_FALSE(parse_tick_line(R"({"type":"spot"})"));
    EXPECT_FALSE(parse_tick_line(R"({"type":"trade","price":1})"));
    EXPECT_FALSE(parse_tick_line(R"({"price":1})"));
    EXPECT_FALSE(parse_tick_line("not json"));
    EXPECT_FALSE(parse_tick_line("[1,2]"));
}

// ============================================================================
// Price to beat
// ============================================================================

TEST(PriceToBeatLatchTest, LatchesFirstSpotAtOrAfterStart) {
    PriceToBeatLatch latch;
    EXPECT_FALSE(latch.observe("m1", 1000, SpotSample{100.0, 999}).has_value());
    EXPECT_FALSE(latch.get("m1").has_value());

    EXPECT_DOUBLE_EQ(*latch.observe("m1", 1000, SpotSample{101.0, 1000}), 101.0);
    // Never changes afterwards
    EXPECT_DOUBLE_EQ(*latch.observe("m1", 1000, SpotSample{150.0, 5000}), 101.0);
    EXPECT_DOUBLE_EQ(*latch.get("m1"), 101.0);
}

TEST(PriceToBeatLatchTest, MarketsAreIndependentAndBounded) {
    PriceToBeatLatch latch;
    for (size_t i = 0; i < PriceToBeatLatch::MAX_MARKETS + 1; ++i) {
        latch.observe("m" + std::to_string(i), 0, SpotSample{100.0 + i, 1});
    }
    EXPECT_FALSE(latch.get("m0").has_value());
    EXPECT_DOUBLE_EQ(*latch.get("m1"), 101.0);
}

// ============================================================================
// Momentum
// ============================================================================

TEST(MomentumTrackerTest, EmptyHistoryHasNoHint) {
    MomentumTracker tracker;
    EXPECT_TRUE(tracker.hint(1'000'000).empty());
}

TEST(MomentumTrackerTest, PercentMovesOverOneAndThreeMinutes) {
    MomentumTracker tracker;
    const int64_t t = 10 * MS_PER_MINUTE;
    tracker.add(SpotSample{100.0, t - 3 * MS_PER_MINUTE});
    tracker.add(SpotSample{100.1, t - MS_PER_MINUTE});
    tracker.add(SpotSample{100.3, t});

    auto h = tracker.hint(t);
    ASSERT_TRUE(h.delta1m.has_value());
    ASSERT_TRUE(h.delta3m.has_value());
    EXPECT_NEAR(*h.delta1m, (100.3 - 100.1) / 100.1 * 100.0, 1e-9);
    EXPECT_NEAR(*h.delta3m, 0.3, 1e-9);
}

TEST(MomentumTrackerTest, ShortHistoryOnlyGivesOneMinute) {
    MomentumTracker tracker;
    const int64_t t = 10 * MS_PER_MINUTE;
    tracker.add(SpotSample{100.0, t - 90'000});
    tracker.add(SpotSample{99.8, t});

    auto h = tracker.hint(t);
    EXPECT_TRUE(h.delta1m.has_value());
    EXPECT_FALSE(h.delta3m.has_value());
}

// ============================================================================
// Hub
// ============================================================================

class MarketDataHubTest : public ::testing::Test {
protected:
    Tick quote_tick(const std::string& market, double up, double down, int64_t end_ms) {
        Tick t;
        t.type = TickType::QUOTE;
        t.quote.market_id = market;
        t.quote.up_price = up;
        t.quote.down_price = down;
        t.quote.market_end_ms = end_ms;
        return t;
    }

    Tick spot_tick(double price) {
        Tick t;
        t.type = TickType::SPOT;
        t.price = price;
        return t;
    }

    FeedConfig config_;
    const int64_t end_ = 15 * MS_PER_MINUTE * 100;
    const int64_t start_ = end_ - 15 * MS_PER_MINUTE;
};

TEST_F(MarketDataHubTest, SnapshotCarriesQuoteSpotAndPriceToBeat) {
    MarketDataHub hub(config_);
    hub.on_tick(spot_tick(97000.0), start_ + 1000);
    hub.on_tick(quote_tick("m1", 0.4, 0.6, end_), start_ + 2000);

    auto snap = hub.snapshot(start_ + 2500);
    ASSERT_TRUE(snap.quote.has_value());
    ASSERT_TRUE(snap.spot.has_value());
    EXPECT_DOUBLE_EQ(snap.spot->price, 97000.0);
    ASSERT_TRUE(snap.quote->price_to_beat.has_value());
    EXPECT_DOUBLE_EQ(*snap.quote->price_to_beat, 97000.0);

    // Later spot moves do not move the target
    hub.on_tick(spot_tick(97500.0), start_ + 3000);
    hub.on_tick(quote_tick("m1", 0.5, 0.5, end_), start_ + 3000);
    EXPECT_DOUBLE_EQ(*hub.snapshot(start_ + 3500).quote->price_to_beat, 97000.0);
    EXPECT_EQ(hub.ticks_received(), 4);
}

TEST_F(MarketDataHubTest, StaleQuoteDropped) {
    MarketDataHub hub(config_);
    hub.on_tick(quote_tick("m1", 0.4, 0.6, end_), start_);

    EXPECT_TRUE(hub.snapshot(start_ + 5000).quote.has_value());
    EXPECT_FALSE(hub.snapshot(start_ + config_.max_quote_age_ms + 1).quote.has_value());
}

TEST_F(MarketDataHubTest, StaleSpotDropped) {
    MarketDataHub hub(config_);
    hub.on_tick(spot_tick(97000.0), start_);

    EXPECT_TRUE(hub.snapshot(start_ + 5000).spot.has_value());
    EXPECT_FALSE(hub.snapshot(start_ + config_.max_quote_age_ms + 1).spot.has_value());
}

TEST_F(MarketDataHubTest, SpotBeforeStartDoesNotLatch) {
    MarketDataHub hub(config_);
    hub.on_tick(spot_tick(96000.0), start_ - 1000);
    hub.on_tick(quote_tick("m1", 0.4, 0.6, end_), start_ - 500);

    auto snap = hub.snapshot(start_);
    ASSERT_TRUE(snap.quote.has_value());
    EXPECT_FALSE(snap.quote->price_to_beat.has_value());
}

// ============================================================================
// Feed reader
// ============================================================================

TEST(JsonlFeedReaderTest, ReadsFileIntoHub) {
    std::random_device rd;
    auto path = (std::filesystem::temp_directory_path() /
                 ("hedgepair_feed_" + std::to_string(rd()) + ".jsonl")).string();
    {
        std::ofstream out(path);
        out << R"({"type":"spot","ts_ms":1000,"price":97000})" << "\n";
        out << "garbage\n";
        out << "\n";
        out << R"({"type":"quote","ts_ms":2000,"market_id":"m1","up":0.4,"down":0.6,"end_ms":900000})" << "\n";
    }

    FeedConfig config;
    MarketDataHub hub(config);
    JsonlFeedReader reader(path, hub, false);
    ASSERT_TRUE(reader.start());

    for (int i = 0; i < 200 && !reader.finished(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    reader.stop();

    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(reader.lines_read(), 3);
    EXPECT_EQ(reader.lines_rejected(), 1);
    EXPECT_EQ(hub.ticks_received(), 2);

    std::filesystem::remove(path);
}

TEST(JsonlFeedReaderTest, MissingFileFailsToStart) {
    FeedConfig config;
    MarketDataHub hub(config);
    JsonlFeedReader reader("/nonexistent/ticks.jsonl", hub, false);
    EXPECT_FALSE(reader.start());
}
