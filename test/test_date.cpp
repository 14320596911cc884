#include "doctest/doctest.h"
#include "digsafe/date.hpp"
#include "digsafe/temporal.hpp"

#include <stdexcept>

using digsafe::Date;
using digsafe::TemporalOverlapEngine;
using digsafe::TimeWindow;

TEST_CASE("Date parsing") {
    SUBCASE("Plain ISO date") {
        Date d = Date::parse("2024-03-15");
        CHECK(d.year == 2024);
        CHECK(d.month == 3);
        CHECK(d.day == 15);
        CHECK(d.to_string() == "2024-03-15");
    }

    SUBCASE("Time part is ignored") {
        CHECK(Date::parse("2024-03-15T10:30:00Z") == Date::parse("2024-03-15"));
    }

    SUBCASE("Malformed input throws") {
        CHECK_THROWS_AS(Date::parse(""), std::invalid_argument);
        CHECK_THROWS_AS(Date::parse("2024/03/15"), std::invalid_argument);
        CHECK_THROWS_AS(Date::parse("2024-3-15"), std::invalid_argument);
        CHECK_THROWS_AS(Date::parse("2024-03-15 10:00"), std::invalid_argument);
    }

    SUBCASE("Impossible calendar days throw") {
        CHECK_THROWS_AS(Date::parse("2023-02-29"), std::invalid_argument);
        CHECK_THROWS_AS(Date::parse("2024-13-01"), std::invalid_argument);
        CHECK_THROWS_AS(Date::parse("2024-04-31"), std::invalid_argument);
        CHECK_NOTHROW(Date::parse("2024-02-29"));
    }
}

TEST_CASE("Date arithmetic") {
    CHECK(Date::parse("1970-01-01").days() == 0);
    CHECK(Date::parse("2024-03-01").days() - Date::parse("2024-02-28").days() == 2);
    CHECK(Date::from_days(Date::parse("2031-07-19").days()) == Date::parse("2031-07-19"));

    SUBCASE("Adding years clamps leap days") {
        CHECK(Date::parse("2024-02-29").add_years(1) == Date::parse("2025-02-28"));
        CHECK(Date::parse("2024-02-29").add_years(4) == Date::parse("2028-02-29"));
        CHECK(Date::parse("2024-06-10").add_years(5) == Date::parse("2029-06-10"));
    }

    SUBCASE("Ordering") {
        CHECK(Date::parse("2024-03-15") < Date::parse("2024-03-16"));
        CHECK(Date::parse("2024-12-31") < Date::parse("2025-01-01"));
        CHECK(Date::parse("2024-03-15") >= Date::parse("2024-03-15"));
    }
}

TEST_CASE("Time windows") {
    SUBCASE("Start after end is rejected") {
        CHECK_THROWS_AS(TimeWindow::parse("2024-03-25", "2024-03-15"), std::invalid_argument);
    }

    SUBCASE("Single-day window") {
        TimeWindow w = TimeWindow::parse("2024-03-15", "2024-03-15");
        CHECK(w.length_days() == 1);
    }

    SUBCASE("Length includes both bounds") {
        CHECK(TimeWindow::parse("2024-03-15", "2024-03-25").length_days() == 11);
    }
}

TEST_CASE("Temporal overlap") {
    TimeWindow x = TimeWindow::parse("2024-03-15", "2024-03-25");

    SUBCASE("Partial overlap is symmetric") {
        TimeWindow y = TimeWindow::parse("2024-03-20", "2024-04-05");
        CHECK(TemporalOverlapEngine::overlaps(x, y));
        CHECK(TemporalOverlapEngine::overlaps(y, x));
        CHECK(TemporalOverlapEngine::overlap_days(x, y) == 6);
    }

    SUBCASE("Touching windows overlap") {
        TimeWindow y = TimeWindow::parse("2024-03-25", "2024-04-01");
        CHECK(TemporalOverlapEngine::overlaps(x, y));
        CHECK(TemporalOverlapEngine::overlaps(y, x));
        CHECK(TemporalOverlapEngine::overlap_days(x, y) == 1);
    }

    SUBCASE("Disjoint windows") {
        TimeWindow y = TimeWindow::parse("2024-04-10", "2024-04-20");
        CHECK_FALSE(TemporalOverlapEngine::overlaps(x, y));
        CHECK_FALSE(TemporalOverlapEngine::overlaps(y, x));
        CHECK(TemporalOverlapEngine::overlap_days(x, y) == 0);
    }

    SUBCASE("Containment") {
        TimeWindow y = TimeWindow::parse("2024-01-01", "2024-12-31");
        CHECK(TemporalOverlapEngine::overlaps(x, y));
        CHECK(TemporalOverlapEngine::overlap_days(y, x) == x.length_days());
    }
}
