#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

namespace digsafe {

    /**
     * @brief Bounding-box candidate lookup
     *
     * Returns ids of entries whose boxes overlap the query box. Callers still
     * run the exact geometry test on every candidate.
     */
    class SpatialIndex {
      public:
        virtual ~SpatialIndex() = default;

        /// Ids of overlapping entries, sorted and unique
        virtual std::vector<std::string> query(const datapod::AABB &box) const = 0;
    };

    /**
     * @brief SpatialIndex backed by a datapod R-tree over lon/lat boxes
     */
    class RTreeSpatialIndex : public SpatialIndex {
        datapod::RTree<std::size_t> rtree_;
        std::vector<std::string> ids_;

        // datapod boxes are 3D; every box gets the same z extent so only lon/lat decide overlap
        static datapod::AABB flatten(const datapod::AABB &box) {
            return datapod::AABB{datapod::Point{box.min_point.x, box.min_point.y, -1.0},
                                 datapod::Point{box.max_point.x, box.max_point.y, 1.0}};
        }

      public:
        void insert(const std::string &id, const datapod::AABB &box) {
            rtree_.insert(flatten(box), ids_.size());
            ids_.push_back(id);
        }

        void clear() {
            rtree_.clear();
            ids_.clear();
        }

        std::size_t size() const { return ids_.size(); }

        std::vector<std::string> query(const datapod::AABB &box) const override {
            std::vector<std::string> result;
            auto candidates = rtree_.query_intersects(flatten(box));
            for (const auto &candidate : candidates) {
                std::size_t idx = candidate.data;
                if (idx < ids_.size()) {
                    result.push_back(ids_[idx]);
                }
            }

            std::sort(result.begin(), result.end());
            result.erase(std::unique(result.begin(), result.end()), result.end());
            return result;
        }
    };

} // namespace digsafe
