#pragma once

#include "geocut/edge_set.hpp"
#include "geocut/planet_model.hpp"

#include <string>
#include <vector>

namespace geocut {

/**
 * Vertex as read from a ring file, in degrees
 */
struct LatLon {
    double latitude;
    double longitude;
};

using RawRing = std::vector<LatLon>;
using RawRings = std::vector<RawRing>;

/**
 * Read rings from a text file, plain or gzip-compressed.
 *
 * Format: one "latitude longitude" pair (degrees) per line, a blank line ends
 * a ring, lines starting with '#' are comments.
 *
 * Throws std::runtime_error naming the path (and line) when the file cannot
 * be opened or a line is malformed.
 */
RawRings readRings(const std::string& path);

RingList readRings(const std::string& path, const PlanetModel& planetModel);

RingList toGeoPoints(const RawRings& rawRings, const PlanetModel& planetModel);

} // namespace geocut
