#pragma once

#include "digsafe/date.hpp"

namespace digsafe {

    /**
     * @brief Closed-interval overlap of time windows
     *
     * Windows that share a single boundary day overlap.
     */
    class TemporalOverlapEngine {
      public:
        static bool overlaps(const TimeWindow &a, const TimeWindow &b) {
            return a.start() <= b.end() && b.start() <= a.end();
        }

        /// Number of shared calendar days, 0 when the windows are disjoint
        static long overlap_days(const TimeWindow &a, const TimeWindow &b) {
            if (!overlaps(a, b))
                return 0;
            const Date &start = a.start() < b.start() ? b.start() : a.start();
            const Date &end = a.end() < b.end() ? a.end() : b.end();
            return end.days() - start.days() + 1;
        }
    };

} // namespace digsafe
