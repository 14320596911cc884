#include "digsafe/date.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace digsafe {

    namespace {
        int parse_digits(const std::string &text, std::size_t pos, std::size_t count) {
            int value = 0;
            for (std::size_t i = pos; i < pos + count; ++i) {
                if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                    throw std::invalid_argument("invalid date \"" + text + "\": expected YYYY-MM-DD");
                }
                value = value * 10 + (text[i] - '0');
            }
            return value;
        }
    } // namespace

    Date Date::parse(const std::string &text) {
        if (text.size() < 10 || text[4] != '-' || text[7] != '-' || (text.size() > 10 && text[10] != 'T')) {
            throw std::invalid_argument("invalid date \"" + text + "\": expected YYYY-MM-DD");
        }

        Date d;
        d.year = parse_digits(text, 0, 4);
        d.month = parse_digits(text, 5, 2);
        d.day = parse_digits(text, 8, 2);

        if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > days_in_month(d.year, d.month)) {
            throw std::invalid_argument("invalid date \"" + text + "\": no such calendar day");
        }
        return d;
    }

    bool Date::is_leap_year(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

    int Date::days_in_month(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && is_leap_year(year))
            return 29;
        return days[month - 1];
    }

    // Civil-from-days conversion over 400-year eras (H. Hinnant)
    long Date::days() const {
        long y = month <= 2 ? year - 1 : year;
        long era = (y >= 0 ? y : y - 399) / 400;
        long yoe = y - era * 400;
        long mp = month > 2 ? month - 3 : month + 9;
        long doy = (153 * mp + 2) / 5 + day - 1;
        long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    Date Date::from_days(long days) {
        days += 719468;
        long era = (days >= 0 ? days : days - 146096) / 146097;
        long doe = days - era * 146097;
        long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        long mp = (5 * doy + 2) / 153;

        Date d;
        d.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        d.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        d.year = static_cast<int>(yoe + era * 400 + (d.month <= 2 ? 1 : 0));
        return d;
    }

    Date Date::add_years(int years) const {
        Date d = *this;
        d.year += years;
        if (d.day > days_in_month(d.year, d.month)) {
            d.day = days_in_month(d.year, d.month);
        }
        return d;
    }

    std::string Date::to_string() const {
        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-" << std::setw(2)
            << day;
        return oss.str();
    }

    TimeWindow::TimeWindow(const Date &start, const Date &end) : start_(start), end_(end) {
        if (end_ < start_) {
            throw std::invalid_argument("time window starts (" + start_.to_string() + ") after it ends (" +
                                        end_.to_string() + ")");
        }
    }

    TimeWindow TimeWindow::parse(const std::string &start, const std::string &end) {
        return TimeWindow(Date::parse(start), Date::parse(end));
    }

} // namespace digsafe
