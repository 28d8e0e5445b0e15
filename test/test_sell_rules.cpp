// test_sell_rules.cpp
// Exit rule priority, intraday stop / target pricing, hold gates and conditional sells

#include <cassert>
#include <iostream>

#include "test_support.hpp"
#include "../include/equitybt/execution/price_basis.hpp"
#include "../include/equitybt/rules/sell_rule_engine.hpp"

using namespace equitybt;
using namespace equitybt::testing;

namespace {

DayQuote quote(const std::string& date, double open, double high, double low, double close,
               std::optional<double> prev_close = std::nullopt) {
    DayQuote q;
    q.date = d(date);
    q.open = open;
    q.high = high;
    q.low = low;
    q.close = close;
    q.prev_close = prev_close;
    return q;
}

SellRuleConfig stopAndTarget(double stop, double target) {
    SellRuleConfig config;
    config.stop_loss_pct = stop;
    config.target_gain_pct = target;
    return config;
}

} // namespace

// ============================================================================
// Price Basis
// ============================================================================

void test_price_basis_selection() {
    auto q = quote("2024-03-05", 101.0, 110.0, 95.0, 105.0, 100.0);
    assert(near(q.price(PriceBasis::OPEN, 0.0), 101.0));
    assert(near(q.price(PriceBasis::CLOSE, 0.0), 105.0));
    assert(near(q.price(PriceBasis::PREV_CLOSE, 0.0), 100.0));
    assert(near(q.price(PriceBasis::CLOSE, -2.0), 102.9));

    auto no_prev = quote("2024-03-05", 0.0, 110.0, 95.0, 105.0);
    assert(near(no_prev.price(PriceBasis::PREV_CLOSE, 0.0), 105.0));
    assert(near(no_prev.price(PriceBasis::OPEN, 0.0), 105.0));

    assert(parsePriceBasis("\xEC\x8B\x9C\xEA\xB0\x80", "basis") == PriceBasis::OPEN);
    assert(parsePriceBasis("prev_close", "basis") == PriceBasis::PREV_CLOSE);
    assert(throws<ConfigurationException>([] { parsePriceBasis("VWAP", "basis"); }));
}

// ============================================================================
// Stop Loss and Target Gain
// ============================================================================

void test_stop_loss_sells_at_threshold_price() {
    ConditionEvaluator evaluator;
    SellRuleEngine engine(stopAndTarget(10.0, 20.0), evaluator);

    // Bought at 1000; intraday low 880 crosses the 10% stop
    auto decision = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-05", 950.0, 960.0, 880.0, 890.0), false);
    assert(decision);
    assert(decision->reason == SellReason::STOP_LOSS);
    assert(near(decision->price, 900.0));
}

void test_target_gain_sells_at_threshold_price() {
    ConditionEvaluator evaluator;
    SellRuleEngine engine(stopAndTarget(10.0, 20.0), evaluator);

    auto decision = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-05", 1050.0, 1250.0, 1040.0, 1100.0), false);
    assert(decision);
    assert(decision->reason == SellReason::TARGET_GAIN);
    assert(near(decision->price, 1200.0));
}

void test_stop_loss_beats_target_on_wide_bar() {
    ConditionEvaluator evaluator;
    SellRuleEngine engine(stopAndTarget(10.0, 20.0), evaluator);

    auto decision = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-05", 1000.0, 1300.0, 850.0, 1000.0), false);
    assert(decision);
    assert(decision->reason == SellReason::STOP_LOSS);
}

void test_no_rule_fires_inside_band() {
    ConditionEvaluator evaluator;
    SellRuleEngine engine(stopAndTarget(10.0, 20.0), evaluator);
    auto decision = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-05", 1000.0, 1150.0, 920.0, 1010.0), false);
    assert(!decision);
    assert(!engine.evaluate(0.0, d("2024-03-04"), quote("2024-03-05", 1.0, 1.0, 0.1, 0.5), false));
}

// ============================================================================
// Hold Days
// ============================================================================

void test_max_hold_has_priority() {
    ConditionEvaluator evaluator;
    SellRuleConfig config = stopAndTarget(10.0, 20.0);
    config.max_hold_days = 5;
    config.sell_price_basis = PriceBasis::OPEN;
    SellRuleEngine engine(config, evaluator);

    // Stop would also fire, max-hold wins and uses the hold basis
    auto decision = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-11", 950.0, 960.0, 850.0, 900.0), false);
    assert(decision);
    assert(decision->reason == SellReason::MAX_HOLD);
    assert(near(decision->price, 950.0));

    auto before = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-08", 1000.0, 1010.0, 990.0, 1000.0), false);
    assert(!before);
}

void test_min_hold_gates_other_rules() {
    ConditionEvaluator evaluator;
    SellRuleConfig config = stopAndTarget(10.0, 20.0);
    config.min_hold_days = 3;
    SellRuleEngine engine(config, evaluator);

    assert(!engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-06", 900.0, 900.0, 800.0, 850.0), false));
    auto decision = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-07", 900.0, 900.0, 800.0, 850.0), false);
    assert(decision && decision->reason == SellReason::STOP_LOSS);
}

void test_stop_waits_for_min_hold() {
    ConditionEvaluator evaluator;
    SellRuleConfig config = stopAndTarget(10.0, 20.0);
    config.max_hold_days = 5;
    config.min_hold_days = 2;
    SellRuleEngine engine(config, evaluator);

    const Date bought = d("2024-03-04");
    assert(!engine.evaluate(1000.0, bought, quote("2024-03-05", 950.0, 960.0, 880.0, 900.0), false));

    auto decision = engine.evaluate(1000.0, bought, quote("2024-03-07", 950.0, 960.0, 880.0, 900.0), false);
    assert(decision);
    assert(decision->reason == SellReason::STOP_LOSS);
    assert(decision->price == 900.0);
}

void test_invalid_rule_config() {
    ConditionEvaluator evaluator;
    SellRuleConfig bad_hold;
    bad_hold.min_hold_days = 10;
    bad_hold.max_hold_days = 5;
    try {
        SellRuleEngine engine(bad_hold, evaluator);
        throw std::runtime_error("expected min > max to be rejected");
    } catch (const ConfigurationException& e) {
        assert(e.field() == "sell.min_hold_days");
    }

    SellRuleConfig bad_stop;
    bad_stop.stop_loss_pct = -5.0;
    assert(throws<ConfigurationException>([&] { SellRuleEngine engine(bad_stop, evaluator); }));
}

// ============================================================================
// Conditional Sell
// ============================================================================

void test_conditional_sell() {
    ConditionEvaluator evaluator;
    SellRuleConfig config = stopAndTarget(10.0, 20.0);
    config.sell_price_basis = PriceBasis::CLOSE;

    ConditionalSellConfig conditional;
    Condition c;
    c.id = "hot";
    c.factor = "RSI_14";
    c.op = CompareOp::GT;
    c.threshold = 70.0;
    conditional.conditions = {c};
    conditional.price_basis = PriceBasis::PREV_CLOSE;
    conditional.price_offset = 1.0;
    config.conditional = conditional;

    SellRuleEngine engine(config, evaluator);
    assert(engine.hasConditionalSell());
    assert((engine.conditionalFactors() == std::vector<std::string>{"RSI_14"}));

    FactorPanel panel(d("2024-03-05"), {"A", "B", "C"}, {"RSI_14"});
    panel.set(0, 0, FactorValue::defined(75.0));
    panel.set(1, 0, FactorValue::defined(40.0));
    panel.set(2, 0, FactorValue::undefined());
    auto hits = engine.conditionalHits(panel);
    assert(hits.size() == 1 && hits.count("A"));

    auto q = quote("2024-03-05", 1010.0, 1020.0, 1000.0, 1015.0, 1000.0);
    auto decision = engine.evaluate(1000.0, d("2024-03-04"), q, true);
    assert(decision);
    assert(decision->reason == SellReason::CONDITIONAL);
    assert(near(decision->price, 1010.0));
    assert(!engine.evaluate(1000.0, d("2024-03-04"), q, false));

    // Stop and target are checked before the conditional rule
    auto stopped = engine.evaluate(1000.0, d("2024-03-04"), quote("2024-03-05", 950.0, 950.0, 880.0, 900.0), true);
    assert(stopped && stopped->reason == SellReason::STOP_LOSS);
}

int main() {
    quietLogs();
    std::cout << "\n=== Sell Rule Test Suite ===" << std::endl;
    std::cout << "============================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Price Basis Tests:" << std::endl;
    reporter.test("Basis Selection", test_price_basis_selection);

    std::cout << "\nStop / Target Tests:" << std::endl;
    reporter.test("Stop Loss Price", test_stop_loss_sells_at_threshold_price);
    reporter.test("Target Gain Price", test_target_gain_sells_at_threshold_price);
    reporter.test("Stop Before Target", test_stop_loss_beats_target_on_wide_bar);
    reporter.test("Inside Band", test_no_rule_fires_inside_band);

    std::cout << "\nHold Day Tests:" << std::endl;
    reporter.test("Max Hold Priority", test_max_hold_has_priority);
    reporter.test("Min Hold Gate", test_min_hold_gates_other_rules);
    reporter.test("Stop After Min Hold", test_stop_waits_for_min_hold);
    reporter.test("Invalid Config", test_invalid_rule_config);

    std::cout << "\nConditional Sell Tests:" << std::endl;
    reporter.test("Conditional Sell", test_conditional_sell);

    return reporter.report();
}
