// Tests for position sizing, the trade gate, trailing stops and the daily session reset

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "trader/strategy_analysis/risk_manager.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

using namespace ConfluenceScalper;
using namespace ConfluenceScalper::Core;
using TestHelpers::utc;

namespace {

Signal make_long_signal(double entry_price, double stop_loss) {
    Signal signal;
    signal.direction = TradeDirection::LONG;
    signal.entry_price = entry_price;
    signal.stop_loss = stop_loss;
    signal.take_profit = entry_price + 2.0 * (entry_price - stop_loss);
    return signal;
}

} // anonymous namespace

class RiskManagerTest : public ::testing::Test {
protected:
    Config::RiskConfig risk_config;
    RiskSessionState session_state{10000.0};
    RiskManager risk_manager{risk_config, session_state};
    TimePoint session_open = utc("2024-01-02T10:00:00Z");
};

// ===========================================================================
// Position sizing
// ===========================================================================

TEST_F(RiskManagerTest, SizesOnPercentOfEquity) {
    EXPECT_EQ(risk_manager.size_position(make_long_signal(2340.0, 2338.5)), 66);
}

TEST_F(RiskManagerTest, SizeIsCappedByUsdRisk) {
    risk_manager.record_equity(50000.0);
    // 1% would be 500; the 200 USD cap applies
    EXPECT_EQ(risk_manager.size_position(make_long_signal(2340.0, 2338.5)), 133);
}

TEST_F(RiskManagerTest, SizeNeverBelowMinimumUnits) {
    risk_manager.record_equity(100.0);
    EXPECT_EQ(risk_manager.size_position(make_long_signal(2340.0, 2338.5)), 1);
}

TEST_F(RiskManagerTest, HugeSizeSaturatesAtIntMax) {
    risk_config.max_risk_usd = 1.0e12;
    risk_manager.record_equity(1.0e12);
    EXPECT_EQ(risk_manager.size_position(make_long_signal(2340.0, 2339.9999)), std::numeric_limits<int>::max());
}

TEST_F(RiskManagerTest, ZeroStopDistanceSizesNothing) {
    EXPECT_EQ(risk_manager.size_position(make_long_signal(2340.0, 2340.0)), 0);
}

TEST_F(RiskManagerTest, InvalidEquityIsRejected) {
    EXPECT_THROW(risk_manager.record_equity(-1.0), std::invalid_argument);
    EXPECT_THROW(risk_manager.record_equity(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(RiskSessionState(-5.0), std::invalid_argument);
    EXPECT_DOUBLE_EQ(session_state.get_equity(), 10000.0);
}

// ===========================================================================
// Trailing stop
// ===========================================================================

TEST_F(RiskManagerTest, TrailWaitsForActivationDistance) {
    EXPECT_DOUBLE_EQ(risk_manager.trail_stop(TradeDirection::LONG, 2340.0, 2340.5, 1.0, 2338.5), 2338.5);
}

TEST_F(RiskManagerTest, LongTrailOnlyRatchetsUp) {
    double trailed_stop = risk_manager.trail_stop(TradeDirection::LONG, 2340.0, 2342.0, 1.0, 2338.5);
    EXPECT_NEAR(trailed_stop, 2341.2, 1e-9);

    double after_pullback = risk_manager.trail_stop(TradeDirection::LONG, 2340.0, 2341.5, 1.0, trailed_stop);
    EXPECT_DOUBLE_EQ(after_pullback, trailed_stop);
}

TEST_F(RiskManagerTest, ShortTrailOnlyRatchetsDown) {
    double trailed_stop = risk_manager.trail_stop(TradeDirection::SHORT, 2340.0, 2338.0, 1.0, 2341.5);
    EXPECT_NEAR(trailed_stop, 2338.8, 1e-9);

    double after_pullback = risk_manager.trail_stop(TradeDirection::SHORT, 2340.0, 2338.6, 1.0, trailed_stop);
    EXPECT_DOUBLE_EQ(after_pullback, trailed_stop);
}

TEST_F(RiskManagerTest, BreakevenFloorAppliesOnceActive) {
    risk_config.trail_distance_atr_multiple = 5.0;
    // Trailing level 2336.0 sits below entry, so breakeven plus offset wins
    double trailed_stop = risk_manager.trail_stop(BrokerPositionView(TradeDirection::LONG, 2340.0, 2338.5), 2341.0, 1.0);
    EXPECT_NEAR(trailed_stop, 2340.05, 1e-9);
}

// ===========================================================================
// Trade gate
// ===========================================================================

TEST_F(RiskManagerTest, FreshSessionAllowsTrading) {
    TradeGateDecision decision = risk_manager.can_open_trade(0, session_open);
    EXPECT_TRUE(decision.allowed);
    EXPECT_TRUE(decision.reason.empty());
}

TEST_F(RiskManagerTest, OpenPositionLimitIsCheckedFirst) {
    risk_manager.record_trade_closed(-400.0);
    TradeGateDecision decision = risk_manager.can_open_trade(2, session_open);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Max open positions (2/2)");
}

TEST_F(RiskManagerTest, DailyDrawdownLimit) {
    risk_manager.can_open_trade(0, session_open);
    risk_manager.record_trade_closed(-300.0);
    risk_manager.record_equity(9700.0);

    TradeGateDecision decision = risk_manager.can_open_trade(0, session_open + std::chrono::hours(1));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Daily drawdown limit hit (-3.00%)");
}

TEST_F(RiskManagerTest, DailyUsdLossLimit) {
    risk_config.max_daily_drawdown_pct = 10.0;
    risk_manager.can_open_trade(0, session_open);
    risk_manager.record_trade_closed(-500.0);

    TradeGateDecision decision = risk_manager.can_open_trade(0, session_open + std::chrono::hours(1));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Daily USD loss limit hit ($-500.00)");
}

TEST_F(RiskManagerTest, TradesPerDayLimit) {
    for (int trade_index = 0; trade_index < 5; ++trade_index) {
        risk_manager.record_trade_opened(session_open + std::chrono::minutes(20 * trade_index));
    }
    TradeGateDecision decision = risk_manager.can_open_trade(0, session_open + std::chrono::hours(3));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Max trades/day reached (5/5)");
}

TEST_F(RiskManagerTest, CooldownReportsRemainingSeconds) {
    risk_manager.record_trade_opened(session_open);

    TradeGateDecision decision = risk_manager.can_open_trade(0, session_open + std::chrono::minutes(5));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Cooling period: 600s remaining");

    EXPECT_TRUE(risk_manager.can_open_trade(0, session_open + std::chrono::minutes(15)).allowed);
}

// ===========================================================================
// Daily reset
// ===========================================================================

TEST_F(RiskManagerTest, NewUtcDayResetsSessionCounters) {
    for (int trade_index = 0; trade_index < 5; ++trade_index) {
        risk_manager.record_trade_opened(session_open + std::chrono::minutes(20 * trade_index));
    }
    risk_manager.record_trade_closed(-120.0);
    risk_manager.record_equity(9880.0);

    TradeGateDecision decision = risk_manager.can_open_trade(0, utc("2024-01-03T08:00:00Z"));
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(session_state.get_session_trade_count(), 0);
    EXPECT_DOUBLE_EQ(session_state.get_session_pnl(), 0.0);
    EXPECT_DOUBLE_EQ(session_state.get_session_start_equity(), 9880.0);
}

TEST_F(RiskManagerTest, DailyResetIsIdempotent) {
    EXPECT_FALSE(risk_manager.apply_daily_reset(session_open));
    risk_manager.record_trade_opened(session_open);

    TimePoint next_day = utc("2024-01-03T00:05:00Z");
    EXPECT_TRUE(risk_manager.apply_daily_reset(next_day));
    EXPECT_FALSE(risk_manager.apply_daily_reset(next_day));
    EXPECT_FALSE(risk_manager.apply_daily_reset(session_open));
    ASSERT_TRUE(session_state.get_session_day().has_value());
    EXPECT_EQ(*session_state.get_session_day(), TimeUtils::utc_day_index(next_day));
    EXPECT_EQ(session_state.get_session_trade_count(), 0);
}

TEST_F(RiskManagerTest, SummaryReportsDrawdownFromPeak) {
    risk_manager.record_equity(10500.0);
    risk_manager.record_equity(10290.0);

    RiskSessionSummary summary = risk_manager.session_summary();
    EXPECT_DOUBLE_EQ(summary.equity, 10290.0);
    EXPECT_DOUBLE_EQ(summary.peak_equity, 10500.0);
    EXPECT_NEAR(summary.drawdown_pct, -2.0, 1e-9);
}
