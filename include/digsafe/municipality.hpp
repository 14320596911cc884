#pragma once

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "digsafe/proximity.hpp"

namespace digsafe {

    /**
     * @brief Finds the municipalities a geometry touches
     *
     * Boundaries must be validated polygons. A project crossing a border is
     * reported under every municipality it intersects.
     */
    class MunicipalityResolver {
        struct Entry {
            std::string code;
            NormalizedGeometry boundary;
        };

        std::vector<Entry> entries_;
        ProximityEngine proximity_;

      public:
        /**
         * @brief Register one municipality boundary
         *
         * @throws std::invalid_argument if @p boundary is not a polygon or the code is already known
         */
        void add(const std::string &code, const NormalizedGeometry &boundary) {
            if (boundary.kind() != GeometryKind::Polygon) {
                throw std::invalid_argument("municipality boundary must be a polygon: " + code);
            }
            for (const auto &entry : entries_) {
                if (entry.code == code) {
                    throw std::invalid_argument("duplicate municipality code: " + code);
                }
            }
            entries_.push_back(Entry{code, boundary});
        }

        std::size_t size() const { return entries_.size(); }

        /// Sorted codes of every municipality whose boundary intersects @p geometry
        std::vector<std::string> resolve(const NormalizedGeometry &geometry) const {
            std::set<std::string> codes;
            for (const auto &entry : entries_) {
                if (proximity_.intersects(geometry, entry.boundary)) {
                    codes.insert(entry.code);
                }
            }
            return std::vector<std::string>(codes.begin(), codes.end());
        }
    };

} // namespace digsafe
