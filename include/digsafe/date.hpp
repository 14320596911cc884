#pragma once

#include <string>

namespace digsafe {

    /**
     * @brief Proleptic Gregorian calendar date
     *
     * Dates compare chronologically and convert to a serial day number
     * (days since 1970-01-01) for arithmetic.
     */
    struct Date {
        int year = 1970;
        int month = 1;
        int day = 1;

        /**
         * @brief Parse an ISO-8601 date
         *
         * Accepts "YYYY-MM-DD", optionally followed by a "T..." time part which is
         * ignored.
         *
         * @throws std::invalid_argument on malformed text or an impossible date
         */
        static Date parse(const std::string &text);

        static Date from_days(long days);

        long days() const;

        /// Same month and day @p years later, clamping Feb 29 to Feb 28
        Date add_years(int years) const;

        std::string to_string() const;

        static bool is_leap_year(int year);
        static int days_in_month(int year, int month);
    };

    inline bool operator==(const Date &a, const Date &b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    inline bool operator!=(const Date &a, const Date &b) { return !(a == b); }
    inline bool operator<(const Date &a, const Date &b) {
        if (a.year != b.year)
            return a.year < b.year;
        if (a.month != b.month)
            return a.month < b.month;
        return a.day < b.day;
    }
    inline bool operator>(const Date &a, const Date &b) { return b < a; }
    inline bool operator<=(const Date &a, const Date &b) { return !(b < a); }
    inline bool operator>=(const Date &a, const Date &b) { return !(a < b); }

    /**
     * @brief Closed calendar interval [start, end]
     */
    class TimeWindow {
        Date start_;
        Date end_;

      public:
        /// @throws std::invalid_argument if start is after end
        TimeWindow(const Date &start, const Date &end);

        /// Parse both bounds from ISO-8601 text
        static TimeWindow parse(const std::string &start, const std::string &end);

        const Date &start() const { return start_; }
        const Date &end() const { return end_; }

        /// Number of calendar days covered, both bounds included
        long length_days() const { return end_.days() - start_.days() + 1; }
    };

    inline bool operator==(const TimeWindow &a, const TimeWindow &b) {
        return a.start() == b.start() && a.end() == b.end();
    }

} // namespace digsafe
