// test_condition_evaluator.cpp
// Expression parsing, columnar predicate evaluation, memoization and candidate ranking

#include <cassert>
#include <iostream>
#include <thread>

#include "test_support.hpp"
#include "../include/equitybt/conditions/condition_evaluator.hpp"
#include "../include/equitybt/factors/factor_panel.hpp"

using namespace equitybt;
using namespace equitybt::testing;

namespace {

Condition cond(const std::string& id, const std::string& factor, CompareOp op, double threshold) {
    Condition c;
    c.id = id;
    c.factor = factor;
    c.op = op;
    c.threshold = threshold;
    return c;
}

// Rows A..E with PER / ROE; C has an undefined PER, D a not-applicable PER
FactorPanel samplePanel() {
    FactorPanel panel(d("2024-05-02"), {"A", "B", "C", "D", "E"}, {"PER", "ROE"});
    const size_t per = *panel.columnIndex("PER");
    const size_t roe = *panel.columnIndex("ROE");

    panel.set(0, per, FactorValue::defined(8.0));
    panel.set(1, per, FactorValue::defined(12.0));
    panel.set(2, per, FactorValue::undefined());
    panel.set(3, per, FactorValue::notApplicable());
    panel.set(4, per, FactorValue::defined(5.0));

    panel.set(0, roe, FactorValue::defined(15.0));
    panel.set(1, roe, FactorValue::defined(20.0));
    panel.set(2, roe, FactorValue::defined(25.0));
    panel.set(3, roe, FactorValue::defined(5.0));
    panel.set(4, roe, FactorValue::undefined());
    return panel;
}

std::vector<std::string> passing(const FactorPanel& panel, const std::vector<uint8_t>& mask) {
    std::vector<std::string> out;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) out.push_back(panel.stockCode(i));
    }
    return out;
}

const std::vector<Condition> kConditions = {
    cond("A", "PER", CompareOp::LT, 10.0),
    cond("B", "ROE", CompareOp::GT, 10.0),
};

} // namespace

// ============================================================================
// Parsing
// ============================================================================

void test_parses_operators_and_precedence() {
    ConditionEvaluator evaluator;
    auto panel = samplePanel();

    // and binds tighter than or
    auto p = evaluator.compile("A or B and A", kConditions);
    auto codes = passing(panel, p->evaluate(panel));
    assert((codes == std::vector<std::string>{"A", "E"}));

    auto q = evaluator.compile("(A || B) && !A", kConditions);
    codes = passing(panel, q->evaluate(panel));
    assert((codes == std::vector<std::string>{"B", "C"}));

    auto r = evaluator.compile("a AND b", {cond("a", "PER", CompareOp::LT, 10.0),
                                            cond("b", "ROE", CompareOp::GE, 15.0)});
    codes = passing(panel, r->evaluate(panel));
    assert((codes == std::vector<std::string>{"A"}));
}

void test_rejects_malformed_expressions() {
    ConditionEvaluator evaluator;
    const std::vector<std::string> bad = {
        "A and", "(A or B", "A or B)", "A B", "and A", "A and C", "A $ B", "()", "not",
    };
    for (const auto& text : bad) {
        bool threw = throws<ConfigurationException>([&] { evaluator.compile(text, kConditions); });
        if (!threw) throw std::runtime_error("accepted malformed expression '" + text + "'");
    }
}

void test_error_names_field_and_position() {
    ConditionEvaluator evaluator;
    try {
        evaluator.compile("A and Z", kConditions, "buy_expression");
        throw std::runtime_error("expected a configuration error");
    } catch (const ConfigurationException& e) {
        assert(e.field() == "buy_expression");
        assert(std::string(e.what()).find("position 6") != std::string::npos);
    }
}

void test_rejects_invalid_conditions() {
    ConditionEvaluator evaluator;
    assert(throws<ConfigurationException>([&] { evaluator.compile("", {}); }));
    assert(throws<ConfigurationException>([&] {
        evaluator.compile("", {cond("A", "NOT_A_FACTOR", CompareOp::LT, 1.0)});
    }));
    assert(throws<ConfigurationException>([&] {
        evaluator.compile("", {cond("A", "PER", CompareOp::LT, 1.0), cond("A", "ROE", CompareOp::GT, 1.0)});
    }));
    assert(throws<ConfigurationException>([&] {
        evaluator.compile("", {cond("A", "PER", CompareOp::LT, std::nan(""))});
    }));
    assert(throws<ConfigurationException>([&] { parseCompareOp("=<", "op"); }));
    assert(parseCompareOp("<=", "op") == CompareOp::LE);
    assert(parseCompareOp("==", "op") == CompareOp::EQ);
}

// ============================================================================
// Evaluation
// ============================================================================

void test_empty_expression_means_all() {
    ConditionEvaluator evaluator;
    auto panel = samplePanel();
    auto p = evaluator.compile("", kConditions);
    auto codes = passing(panel, p->evaluate(panel));
    assert((codes == std::vector<std::string>{"A"}));
}

void test_undefined_cells_fail_every_operator() {
    ConditionEvaluator evaluator;
    auto panel = samplePanel();
    for (CompareOp op : {CompareOp::LT, CompareOp::LE, CompareOp::GT, CompareOp::GE, CompareOp::EQ}) {
        auto p = evaluator.compile("", {cond("X", "PER", op, 8.0)});
        auto mask = p->evaluate(panel);
        assert(mask[2] == 0);
        assert(mask[3] == 0);
    }
}

void test_not_is_plain_negation() {
    ConditionEvaluator evaluator;
    auto panel = samplePanel();
    auto p = evaluator.compile("not A", kConditions);
    auto codes = passing(panel, p->evaluate(panel));
    // Undefined PER makes A false, so "not A" holds for C and D
    assert((codes == std::vector<std::string>{"B", "C", "D"}));
}

void test_missing_panel_column_is_error() {
    ConditionEvaluator evaluator;
    FactorPanel panel(d("2024-05-02"), {"A"}, {"ROE"});
    auto p = evaluator.compile("A", kConditions);
    assert(throws<BacktestException>([&] { p->evaluate(panel); }));
}

void test_required_factors() {
    ConditionEvaluator evaluator;
    auto p = evaluator.compile("A or B", kConditions);
    assert((p->requiredFactors() == std::vector<std::string>{"PER", "ROE"}));
}

// ============================================================================
// Memoization
// ============================================================================

void test_compilation_is_memoized() {
    ConditionEvaluator evaluator;
    auto first = evaluator.compile("A and B", kConditions);
    auto reordered = evaluator.compile("A and B", {kConditions[1], kConditions[0]});
    assert(first.get() == reordered.get());
    assert(evaluator.memoSize() == 1);

    auto other = evaluator.compile("A or B", kConditions);
    assert(other.get() != first.get());
    assert(evaluator.memoSize() == 2);

    auto changed = evaluator.compile("A and B", {cond("A", "PER", CompareOp::LT, 11.0), kConditions[1]});
    assert(changed.get() != first.get());
    assert(evaluator.getStats().memo_hits == 1);
}

void test_concurrent_compilation() {
    ConditionEvaluator evaluator;
    auto panel = samplePanel();
    std::vector<std::thread> threads;
    std::vector<std::vector<std::string>> results(8);
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&, t] {
            auto p = evaluator.compile("A or B", kConditions);
            results[t] = passing(panel, p->evaluate(panel));
        });
    }
    for (auto& th : threads) th.join();
    for (const auto& r : results) assert(r == results[0]);
    assert(evaluator.memoSize() == 1);
}

// ============================================================================
// Ranking
// ============================================================================

void test_rank_by_priority() {
    auto panel = samplePanel();
    std::vector<uint8_t> all(panel.rowCount(), 1);

    auto desc = ConditionEvaluator::rank(panel, all, "ROE", false);
    assert((desc == std::vector<std::string>{"C", "B", "A", "D", "E"}));

    auto asc = ConditionEvaluator::rank(panel, all, "PER", true);
    // Defined values first, then undefined by code
    assert((asc == std::vector<std::string>{"E", "A", "B", "C", "D"}));
}

void test_rank_ties_break_by_code() {
    FactorPanel panel(d("2024-05-02"), {"Z", "M", "B"}, {"ROE"});
    for (size_t row = 0; row < 3; ++row) panel.set(row, 0, FactorValue::defined(10.0));
    std::vector<uint8_t> all(3, 1);
    auto ranked = ConditionEvaluator::rank(panel, all, "ROE", false);
    assert((ranked == std::vector<std::string>{"B", "M", "Z"}));

    auto unranked = ConditionEvaluator::rank(panel, {1, 0, 1}, "", false);
    assert((unranked == std::vector<std::string>{"B", "Z"}));
}

int main() {
    quietLogs();
    std::cout << "\n=== Condition Evaluator Test Suite ===" << std::endl;
    std::cout << "======================================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Parsing Tests:" << std::endl;
    reporter.test("Operators and Precedence", test_parses_operators_and_precedence);
    reporter.test("Malformed Expressions", test_rejects_malformed_expressions);
    reporter.test("Error Location", test_error_names_field_and_position);
    reporter.test("Invalid Conditions", test_rejects_invalid_conditions);

    std::cout << "\nEvaluation Tests:" << std::endl;
    reporter.test("Empty Expression", test_empty_expression_means_all);
    reporter.test("Undefined Cells", test_undefined_cells_fail_every_operator);
    reporter.test("Negation", test_not_is_plain_negation);
    reporter.test("Missing Column", test_missing_panel_column_is_error);
    reporter.test("Required Factors", test_required_factors);

    std::cout << "\nMemoization Tests:" << std::endl;
    reporter.test("Memoized Compilation", test_compilation_is_memoized);
    reporter.test("Concurrent Compilation", test_concurrent_compilation);

    std::cout << "\nRanking Tests:" << std::endl;
    reporter.test("Priority Order", test_rank_by_priority);
    reporter.test("Tie Break", test_rank_ties_break_by_code);

    return reporter.report();
}
