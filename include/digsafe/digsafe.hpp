#pragma once

/**
 * @file digsafe.hpp
 * @brief Conflict detection for municipal excavation projects
 *
 * - validator.hpp: raw geometry validation and normalization
 * - proximity.hpp / temporal.hpp: spatial and temporal tests
 * - registry.hpp: project and moratorium sources
 * - aggregator.hpp: classification of one request against a snapshot
 * - detector.hpp: deadline-bounded detection, batch runs and statistics
 * - municipality.hpp: municipality lookup by boundary
 * - writer.hpp: JSON rendering of results
 */

#include "aggregator.hpp"
#include "config.hpp"
#include "date.hpp"
#include "detector.hpp"
#include "geometry.hpp"
#include "municipality.hpp"
#include "proximity.hpp"
#include "registry.hpp"
#include "spatial_index.hpp"
#include "temporal.hpp"
#include "types.hpp"
#include "validator.hpp"
#include "writer.hpp"
