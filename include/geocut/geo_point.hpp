#pragma once

#include "geocut/vector.hpp"
#include "geocut/planet_model.hpp"

namespace geocut {

/**
 * A point on the surface of a PlanetModel
 */
struct GeoPoint : public Vector {
    GeoPoint() = default;
    GeoPoint(double x_, double y_, double z_) : Vector(x_, y_, z_) {}
    explicit GeoPoint(const Vector& v) : Vector(v) {}

    /**
     * Surface point at the given geodetic latitude/longitude (radians)
     */
    GeoPoint(const PlanetModel& planetModel, double latitude, double longitude);

    static GeoPoint fromDegrees(const PlanetModel& planetModel, double latitudeDegrees, double longitudeDegrees);

    // Geodetic latitude in radians
    double getLatitude(const PlanetModel& planetModel) const;
    // Longitude in radians, 0 at the poles
    double getLongitude() const;
};

} // namespace geocut
