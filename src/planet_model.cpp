#include "geocut/planet_model.hpp"

#include <cmath>
#include <stdexcept>

namespace geocut {

namespace {

// WGS84 radii in meters, normalized by the IUGG mean radius
const double WGS84_EQUATORIAL = 6378137.0;
const double WGS84_POLAR = 6356752.314245;
const double WGS84_MEAN = 6371008.7714;

} // namespace

const PlanetModel PlanetModel::SPHERE(1.0, 1.0);
const PlanetModel PlanetModel::WGS84(WGS84_EQUATORIAL / WGS84_MEAN, WGS84_POLAR / WGS84_MEAN);

PlanetModel::PlanetModel(double ab_, double c_) : ab(ab_), c(c_) {
    if (!std::isfinite(ab) || !std::isfinite(c) || ab <= 0.0 || c <= 0.0) {
        throw std::invalid_argument("PlanetModel semi-axes must be positive and finite");
    }
    inverseAbSquared = 1.0 / (ab * ab);
    inverseCSquared = 1.0 / (c * c);
}

} // namespace geocut
