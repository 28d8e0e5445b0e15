// price_basis.hpp
// Reference price selection for buy and sell orders

#pragma once

#include <optional>
#include <string>
#include "../core/date.hpp"
#include "../core/exceptions.hpp"
#include "../data/market_data.hpp"

namespace equitybt {

enum class PriceBasis {
    OPEN,        // today's open
    CLOSE,       // today's close
    PREV_CLOSE   // previous trading day's close, today's close when there is none
};

inline const char* toString(PriceBasis basis) {
    switch (basis) {
        case PriceBasis::OPEN: return "OPEN";
        case PriceBasis::CLOSE: return "CLOSE";
        case PriceBasis::PREV_CLOSE: return "PREV_CLOSE";
    }
    return "CLOSE";
}

inline PriceBasis parsePriceBasis(const std::string& text, const std::string& field) {
    if (text == "OPEN" || text == "open" || text == "\xEC\x8B\x9C\xEA\xB0\x80") return PriceBasis::OPEN;  // 시가
    if (text == "CLOSE" || text == "close" || text == "CURRENT" || text == "current" ||
        text == "\xEC\xA2\x85\xEA\xB0\x80") return PriceBasis::CLOSE;  // 종가
    if (text == "PREV_CLOSE" || text == "prev_close" ||
        text == "\xEC\xA0\x84\xEC\x9D\xBC \xEC\xA2\x85\xEA\xB0\x80") return PriceBasis::PREV_CLOSE;  // 전일 종가
    throw ConfigurationException(field, "unknown price basis '" + text + "'");
}

// ============================================================================
// Day Quote
// ============================================================================

// Today's bar for one stock plus the previous trading day's close
struct DayQuote {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    std::optional<double> prev_close;

    static DayQuote fromBars(const Bar& today, const Bar* previous) {
        DayQuote q;
        q.date = today.date;
        q.open = today.open;
        q.high = today.high;
        q.low = today.low;
        q.close = today.close;
        if (previous && previous->hasValidClose()) q.prev_close = previous->close;
        return q;
    }

    double basis(PriceBasis b) const {
        switch (b) {
            case PriceBasis::OPEN: return open > 0.0 ? open : close;
            case PriceBasis::CLOSE: return close;
            case PriceBasis::PREV_CLOSE: return prev_close ? *prev_close : close;
        }
        return close;
    }

    // basis × (1 + offset%)
    double price(PriceBasis b, double offset_pct) const {
        return basis(b) * (1.0 + offset_pct / 100.0);
    }
};

} // namespace equitybt
