// progress.hpp
// Progress reporting for a running backtest: callback and/or lock-free channel

#pragma once

#include <cstddef>
#include <functional>
#include "../concurrent/spsc_ring_buffer.hpp"
#include "../core/date.hpp"

namespace equitybt {

struct ProgressUpdate {
    double percent = 0.0;
    Date current_date;
    double cumulative_return = 0.0;   // percent
    size_t days_processed = 0;
    size_t total_days = 0;
    size_t total_trades = 0;
    size_t buy_count = 0;
    size_t sell_count = 0;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

// Consumed by an observer thread; updates are dropped while it is full
using ProgressChannel = SpscRingBuffer<ProgressUpdate, 64>;

// ============================================================================
// Progress Tracker
// ============================================================================

// Emits every `interval_pct` percent of processed days, plus the final day
class ProgressTracker {
private:
    double interval_pct_;
    double next_threshold_;

public:
    explicit ProgressTracker(double interval_pct)
        : interval_pct_(interval_pct)
        , next_threshold_(interval_pct) {}

    bool shouldEmit(size_t done, size_t total) {
        if (total == 0) return false;
        const double percent = static_cast<double>(done) / static_cast<double>(total) * 100.0;
        if (done == total) return true;
        if (percent + 1e-9 < next_threshold_) return false;
        while (next_threshold_ <= percent + 1e-9) next_threshold_ += interval_pct_;
        return true;
    }
};

} // namespace equitybt
