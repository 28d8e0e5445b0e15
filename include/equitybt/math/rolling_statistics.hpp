// rolling_statistics.hpp
// Sliding-window statistics used by the price-derived factors
// Window sum and sum of squares give O(1) mean and sample variance

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <limits>

namespace equitybt {

// ============================================================================
// Rolling Statistics
// ============================================================================

class RollingStatistics {
private:
    size_t window_size_;
    std::deque<double> values_;

    double sum_ = 0.0;
    double sum_squares_ = 0.0;
    double mean_ = 0.0;
    double variance_ = 0.0;

    double min_value_ = std::numeric_limits<double>::max();
    double max_value_ = std::numeric_limits<double>::lowest();

public:
    explicit RollingStatistics(size_t window_size) : window_size_(window_size) {}

    void update(double value) {
        values_.push_back(value);
        sum_ += value;
        sum_squares_ += value * value;

        if (value < min_value_) min_value_ = value;
        if (value > max_value_) max_value_ = value;

        if (values_.size() > window_size_) {
            double old_value = values_.front();
            values_.pop_front();
            sum_ -= old_value;
            sum_squares_ -= old_value * old_value;

            if (old_value == min_value_ || old_value == max_value_) {
                auto [min_it, max_it] = std::minmax_element(values_.begin(), values_.end());
                min_value_ = *min_it;
                max_value_ = *max_it;
            }
        }

        const size_t count = values_.size();
        mean_ = sum_ / static_cast<double>(count);

        if (count > 1) {
            double ss = sum_squares_ - static_cast<double>(count) * mean_ * mean_;
            variance_ = std::max(0.0, ss / static_cast<double>(count - 1));
        } else {
            variance_ = 0.0;
        }
    }

    double getMean() const { return mean_; }
    double getStdDev() const { return std::sqrt(variance_); }
    double getMin() const { return min_value_; }
    double getMax() const { return max_value_; }
    size_t getCount() const { return values_.size(); }
    bool isFull() const { return values_.size() == window_size_; }
};

} // namespace equitybt
