// date.hpp
// Civil Calendar Date for trading-day arithmetic
// Serial day numbers (1970-01-01 = 0), independent of the host time zone

#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include "exceptions.hpp"

namespace equitybt {

// ============================================================================
// Date
// ============================================================================

class Date {
private:
    int32_t days_ = 0;

    static int32_t daysFromCivil(int y, unsigned m, unsigned d) {
        y -= m <= 2 ? 1 : 0;
        const int era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int32_t>(doe) - 719468;
    }

    struct Civil {
        int year;
        unsigned month;
        unsigned day;
    };

    Civil toCivil() const {
        const int32_t z = days_ + 719468;
        const int32_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int y = static_cast<int>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return {y + (m <= 2 ? 1 : 0), m, d};
    }

    static bool isLeap(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

public:
    Date() = default;
    explicit Date(int32_t serial) : days_(serial) {}

    static unsigned daysInMonth(int y, unsigned m) {
        static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeap(y)) return 29;
        return kDays[m - 1];
    }

    static std::optional<Date> fromYMD(int y, unsigned m, unsigned d) {
        if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) return std::nullopt;
        return Date(daysFromCivil(y, m, d));
    }

    // Accepts YYYY-MM-DD and YYYYMMDD
    static std::optional<Date> tryParse(const std::string& text) {
        std::string digits;
        if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
            digits = text.substr(0, 4) + text.substr(5, 2) + text.substr(8, 2);
        } else if (text.size() == 8) {
            digits = text;
        } else {
            return std::nullopt;
        }
        for (char c : digits) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        const int y = std::stoi(digits.substr(0, 4));
        const unsigned m = static_cast<unsigned>(std::stoi(digits.substr(4, 2)));
        const unsigned d = static_cast<unsigned>(std::stoi(digits.substr(6, 2)));
        return fromYMD(y, m, d);
    }

    static Date parse(const std::string& text) {
        auto parsed = tryParse(text);
        if (!parsed) throw DataException("Invalid date '" + text + "'");
        return *parsed;
    }

    int32_t serial() const { return days_; }
    int year() const { return toCivil().year; }
    unsigned month() const { return toCivil().month; }
    unsigned day() const { return toCivil().day; }
    unsigned quarter() const { return (month() - 1) / 3 + 1; }

    // 0 = Monday ... 6 = Sunday
    int weekday() const {
        return ((days_ + 3) % 7 + 7) % 7;
    }

    // Serial of the Monday that starts this date's week
    int32_t weekStart() const { return days_ - weekday(); }

    int32_t monthKey() const { return year() * 12 + static_cast<int32_t>(month()) - 1; }
    int32_t quarterKey() const { return year() * 4 + static_cast<int32_t>(quarter()) - 1; }

    Date addDays(int32_t n) const { return Date(days_ + n); }

    std::string toString() const {
        const Civil c = toCivil();
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
        return buf;
    }

    // Calendar days between two dates
    int32_t operator-(const Date& other) const { return days_ - other.days_; }

    bool operator==(const Date& o) const { return days_ == o.days_; }
    bool operator!=(const Date& o) const { return days_ != o.days_; }
    bool operator<(const Date& o) const { return days_ < o.days_; }
    bool operator<=(const Date& o) const { return days_ <= o.days_; }
    bool operator>(const Date& o) const { return days_ > o.days_; }
    bool operator>=(const Date& o) const { return days_ >= o.days_; }
};

} // namespace equitybt
