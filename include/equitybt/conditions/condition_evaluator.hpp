// condition_evaluator.hpp
// Compiles (expression, conditions) into a columnar predicate over a FactorPanel
// Atoms become byte masks; the postfix program combines whole masks per day

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../core/branch_hints.hpp"
#include "../core/exceptions.hpp"
#include "../factors/factor_panel.hpp"
#include "../factors/factor_registry.hpp"
#include "../math/simd_math.hpp"
#include "expression_parser.hpp"

namespace equitybt {

enum class CompareOp {
    LT,
    LE,
    GT,
    GE,
    EQ
};

inline const char* toString(CompareOp op) {
    switch (op) {
        case CompareOp::LT: return "<";
        case CompareOp::LE: return "<=";
        case CompareOp::GT: return ">";
        case CompareOp::GE: return ">=";
        case CompareOp::EQ: return "=";
    }
    return "?";
}

inline CompareOp parseCompareOp(const std::string& text, const std::string& field) {
    if (text == "<") return CompareOp::LT;
    if (text == "<=" || text == "\xE2\x89\xA4") return CompareOp::LE;  // ≤
    if (text == ">") return CompareOp::GT;
    if (text == ">=" || text == "\xE2\x89\xA5") return CompareOp::GE;  // ≥
    if (text == "=" || text == "==") return CompareOp::EQ;
    throw ConfigurationException(field, "unparseable operator '" + text + "'");
}

struct Condition {
    std::string id;
    std::string factor;
    CompareOp op = CompareOp::LT;
    double threshold = 0.0;
};

// ============================================================================
// Compiled Predicate
// ============================================================================

class CompiledPredicate {
private:
    std::vector<Condition> conditions_;
    PredicateProgram program_;
    std::vector<std::string> factors_;

    template<typename Cmp>
    static EQUITYBT_FORCE_INLINE void compareColumn(const std::vector<double>& values,
                                                    const std::vector<ValueState>& states,
                                                    double threshold, uint8_t* out, Cmp cmp) {
        const size_t n = values.size();
        for (size_t i = 0; i < n; ++i) {
            out[i] = static_cast<uint8_t>((states[i] == ValueState::Defined) & cmp(values[i], threshold));
        }
    }

    static void atomMask(const Condition& c, const FactorPanel& panel, std::vector<uint8_t>& out) {
        out.assign(panel.rowCount(), 0);
        auto col = panel.columnIndex(c.factor);
        if (EQUITYBT_UNLIKELY(!col)) {
            throw BacktestException("Panel for " + panel.date().toString() +
                                    " is missing factor '" + c.factor + "'");
        }
        const auto& values = panel.values(*col);
        const auto& states = panel.states(*col);
        switch (c.op) {
            case CompareOp::LT: compareColumn(values, states, c.threshold, out.data(), [](double v, double t) { return v < t; }); break;
            case CompareOp::LE: compareColumn(values, states, c.threshold, out.data(), [](double v, double t) { return v <= t; }); break;
            case CompareOp::GT: compareColumn(values, states, c.threshold, out.data(), [](double v, double t) { return v > t; }); break;
            case CompareOp::GE: compareColumn(values, states, c.threshold, out.data(), [](double v, double t) { return v >= t; }); break;
            case CompareOp::EQ: compareColumn(values, states, c.threshold, out.data(), [](double v, double t) { return v == t; }); break;
        }
    }

public:
    CompiledPredicate(std::vector<Condition> conditions, PredicateProgram program)
        : conditions_(std::move(conditions))
        , program_(std::move(program)) {
        std::set<std::string> unique;
        for (const auto& c : conditions_) unique.insert(c.factor);
        factors_.assign(unique.begin(), unique.end());
    }

    const std::vector<Condition>& conditions() const { return conditions_; }
    const PredicateProgram& program() const { return program_; }

    // Factors a panel must carry for evaluate()
    const std::vector<std::string>& requiredFactors() const { return factors_; }

    // One byte per panel row, 1 where the predicate holds
    std::vector<uint8_t> evaluate(const FactorPanel& panel) const {
        const size_t n = panel.rowCount();

        std::vector<std::vector<uint8_t>> atoms(conditions_.size());
        std::vector<bool> built(conditions_.size(), false);
        std::vector<std::vector<uint8_t>> stack;

        for (const auto& ins : program_) {
            switch (ins.op) {
                case Instruction::Op::PUSH:
                    if (!built[ins.operand]) {
                        atomMask(conditions_[ins.operand], panel, atoms[ins.operand]);
                        built[ins.operand] = true;
                    }
                    stack.push_back(atoms[ins.operand]);
                    break;
                case Instruction::Op::NOT:
                    simd::MaskOps::invert(stack.back().data(), n);
                    break;
                case Instruction::Op::AND:
                case Instruction::Op::OR: {
                    if (EQUITYBT_UNLIKELY(stack.size() < 2)) {
                        throw InvariantViolation("malformed predicate program");
                    }
                    std::vector<uint8_t> rhs = std::move(stack.back());
                    stack.pop_back();
                    if (ins.op == Instruction::Op::AND) {
                        simd::MaskOps::and_into(stack.back().data(), rhs.data(), n);
                    } else {
                        simd::MaskOps::or_into(stack.back().data(), rhs.data(), n);
                    }
                    break;
                }
            }
        }

        if (EQUITYBT_UNLIKELY(stack.size() != 1)) {
            throw InvariantViolation("malformed predicate program");
        }
        return std::move(stack.back());
    }
};

// ============================================================================
// Condition Evaluator
// ============================================================================

class ConditionEvaluator {
public:
    struct EvaluatorStats {
        uint64_t compilations = 0;
        uint64_t memo_hits = 0;
    };

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const CompiledPredicate>> memo_;
    EvaluatorStats stats_;

    static std::string formatThreshold(double v) {
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%.17g", v);
        return buf;
    }

    // Expression text plus the id-sorted condition set
    static std::string memoKey(const std::string& expression, const std::vector<Condition>& conditions) {
        std::vector<const Condition*> sorted;
        for (const auto& c : conditions) sorted.push_back(&c);
        std::sort(sorted.begin(), sorted.end(),
                  [](const Condition* a, const Condition* b) { return a->id < b->id; });

        std::string key = expression + ":";
        for (const auto* c : sorted) {
            key += c->id + "|" + c->factor + "|" + toString(c->op) + "|" + formatThreshold(c->threshold) + ";";
        }
        return key;
    }

    static std::shared_ptr<const CompiledPredicate> doCompile(const std::string& expression,
                                                              const std::vector<Condition>& conditions,
                                                              const std::string& field) {
        if (conditions.empty()) {
            throw ConfigurationException(field, "no conditions given");
        }

        const auto& registry = FactorRegistry::instance();
        std::map<std::string, size_t> index_by_id;
        for (size_t i = 0; i < conditions.size(); ++i) {
            const auto& c = conditions[i];
            if (c.id.empty()) {
                throw ConfigurationException(field, "condition #" + std::to_string(i + 1) + " has no id");
            }
            if (!index_by_id.emplace(c.id, i).second) {
                throw ConfigurationException(field, "duplicate condition id '" + c.id + "'");
            }
            if (!registry.contains(c.factor)) {
                throw ConfigurationException(field, "condition '" + c.id + "' uses unknown factor '" + c.factor + "'");
            }
            if (!std::isfinite(c.threshold)) {
                throw ConfigurationException(field, "condition '" + c.id + "' has a non-finite threshold");
            }
        }

        std::string trimmed = expression;
        trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
        trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);

        PredicateProgram program;
        if (trimmed.empty()) {
            // No expression: every condition must hold
            for (size_t i = 0; i < conditions.size(); ++i) {
                program.push_back({Instruction::Op::PUSH, i});
                if (i > 0) program.push_back({Instruction::Op::AND, 0});
            }
        } else {
            ExpressionParser parser(trimmed, field);
            program = parser.parse([&index_by_id](const std::string& id) -> std::optional<size_t> {
                auto it = index_by_id.find(id);
                if (it == index_by_id.end()) return std::nullopt;
                return it->second;
            });
        }
        return std::make_shared<CompiledPredicate>(conditions, std::move(program));
    }

public:
    // Memoized by (expression, canonical condition set); errors are ConfigurationException
    std::shared_ptr<const CompiledPredicate> compile(const std::string& expression,
                                                     const std::vector<Condition>& conditions,
                                                     const std::string& field = "buy_expression") {
        const std::string key = memoKey(expression, conditions);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = memo_.find(key);
            if (it != memo_.end()) {
                ++stats_.memo_hits;
                return it->second;
            }
        }

        auto compiled = doCompile(expression, conditions, field);

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.compilations;
        memo_[key] = compiled;
        return compiled;
    }

    // Passing rows ordered by the priority factor; undefined priorities last,
    // ties and the no-priority case by stock code ascending
    static std::vector<std::string> rank(const FactorPanel& panel, const std::vector<uint8_t>& mask,
                                         const std::string& priority_factor, bool ascending) {
        std::vector<size_t> rows;
        for (size_t row = 0; row < mask.size(); ++row) {
            if (mask[row]) rows.push_back(row);
        }

        if (!priority_factor.empty()) {
            const size_t col = panel.requireColumn(priority_factor);
            const auto& values = panel.values(col);
            const auto& states = panel.states(col);
            std::sort(rows.begin(), rows.end(), [&](size_t a, size_t b) {
                const bool da = states[a] == ValueState::Defined;
                const bool db = states[b] == ValueState::Defined;
                if (da != db) return da;
                if (da && values[a] != values[b]) {
                    return ascending ? values[a] < values[b] : values[a] > values[b];
                }
                return panel.stockCode(a) < panel.stockCode(b);
            });
        }

        std::vector<std::string> codes;
        codes.reserve(rows.size());
        for (size_t row : rows) codes.push_back(panel.stockCode(row));
        return codes;
    }

    size_t memoSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return memo_.size();
    }

    EvaluatorStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }
};

} // namespace equitybt
