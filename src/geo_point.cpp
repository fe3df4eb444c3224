#include "geocut/geo_point.hpp"

#include <cmath>

namespace geocut {

GeoPoint::GeoPoint(const PlanetModel& planetModel, double latitude, double longitude) {
    const double ab = planetModel.getAb();
    const double c = planetModel.getC();
    const double cosLat = std::cos(latitude);
    const double sinLat = std::sin(latitude);

    // Prime vertical radius of curvature for a geodetic latitude
    const double n = ab * ab / std::sqrt(ab * ab * cosLat * cosLat + c * c * sinLat * sinLat);

    x = n * cosLat * std::cos(longitude);
    y = n * cosLat * std::sin(longitude);
    z = n * (c * c) / (ab * ab) * sinLat;
}

GeoPoint GeoPoint::fromDegrees(const PlanetModel& planetModel, double latitudeDegrees, double longitudeDegrees) {
    const double toRadians = M_PI / 180.0;
    return GeoPoint(planetModel, latitudeDegrees * toRadians, longitudeDegrees * toRadians);
}

double GeoPoint::getLatitude(const PlanetModel& planetModel) const {
    const double rho = std::sqrt(x * x + y * y);
    const double ratio = (planetModel.getAb() * planetModel.getAb()) / (planetModel.getC() * planetModel.getC());
    return std::atan2(z * ratio, rho);
}

double GeoPoint::getLongitude() const {
    if (std::abs(x) < MINIMUM_RESOLUTION && std::abs(y) < MINIMUM_RESOLUTION) {
        return 0.0;
    }
    return std::atan2(y, x);
}

} // namespace geocut
