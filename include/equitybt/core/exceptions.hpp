// exceptions.hpp
// Exception Types for the Equity Factor Backtesting Engine
// Configuration errors surface before a run; internal faults abort only the current run

#pragma once

#include <stdexcept>
#include <string>

namespace equitybt {

// ============================================================================
// Exception Hierarchy
// ============================================================================

class BacktestException : public std::runtime_error {
public:
    explicit BacktestException(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid run configuration: bad expression, unknown factor, contradictory rules
class ConfigurationException : public BacktestException {
public:
    ConfigurationException(const std::string& field, const std::string& rule)
        : BacktestException("Configuration Error: " + field + ": " + rule)
        , field_(field)
        , rule_(rule) {}

    const std::string& field() const { return field_; }
    const std::string& rule() const { return rule_; }

private:
    std::string field_;
    std::string rule_;
};

class DataException : public BacktestException {
public:
    explicit DataException(const std::string& msg) : BacktestException("Data Error: " + msg) {}
};

class CacheException : public BacktestException {
public:
    explicit CacheException(const std::string& msg) : BacktestException("Cache Error: " + msg) {}
};

// Raised when a bookkeeping guard detects a state that must never happen
class InvariantViolation : public BacktestException {
public:
    explicit InvariantViolation(const std::string& msg) : BacktestException("Invariant Violation: " + msg) {}
};

} // namespace equitybt
