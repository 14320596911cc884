#pragma once

/**
 * @file kernel.hpp
 * @brief Planar geometry kernel for digsafe
 *
 * Small computational-geometry routines kept apart from the conflict logic:
 * - geodesy.hpp: haversine distance and local equirectangular projection
 * - segment.hpp: orientation, segment intersection and distances
 * - ring.hpp: shoelace area, point-in-ring, duplicate removal
 */

#include "geodesy.hpp"
#include "ring.hpp"
#include "segment.hpp"
