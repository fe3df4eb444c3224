#pragma once

#include <stdexcept>

namespace geocut {

/**
 * A query reached a state that a well-formed polygon cannot produce,
 * e.g. a ring that never leaves the cutting plane.
 */
class ImpossiblePolygonError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace geocut
