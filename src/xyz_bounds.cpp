#include "geocut/xyz_bounds.hpp"

#include <algorithm>

namespace geocut {

XYZBounds& XYZBounds::addPoint(const Vector& point) {
    minX = std::min(minX, point.x - FUDGE_FACTOR);
    maxX = std::max(maxX, point.x + FUDGE_FACTOR);
    minY = std::min(minY, point.y - FUDGE_FACTOR);
    maxY = std::max(maxY, point.y + FUDGE_FACTOR);
    minZ = std::min(minZ, point.z - FUDGE_FACTOR);
    maxZ = std::max(maxZ, point.z + FUDGE_FACTOR);
    return *this;
}

XYZBounds& XYZBounds::addBounds(const XYZBounds& other) {
    if (other.isEmpty()) {
        return *this;
    }
    minX = std::min(minX, other.minX);
    maxX = std::max(maxX, other.maxX);
    minY = std::min(minY, other.minY);
    maxY = std::max(maxY, other.maxY);
    minZ = std::min(minZ, other.minZ);
    maxZ = std::max(maxZ, other.maxZ);
    return *this;
}

double XYZBounds::getMinimum(Axis axis) const {
    switch (axis) {
        case Axis::X: return minX;
        case Axis::Y: return minY;
        default: return minZ;
    }
}

double XYZBounds::getMaximum(Axis axis) const {
    switch (axis) {
        case Axis::X: return maxX;
        case Axis::Y: return maxY;
        default: return maxZ;
    }
}

bool XYZBounds::contains(const Vector& point) const {
    return point.x >= minX && point.x <= maxX &&
           point.y >= minY && point.y <= maxY &&
           point.z >= minZ && point.z <= maxZ;
}

} // namespace geocut
