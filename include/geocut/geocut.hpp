#pragma once

#include "geocut/vector.hpp"
#include "geocut/planet_model.hpp"
#include "geocut/geo_point.hpp"
#include "geocut/xyz_bounds.hpp"
#include "geocut/plane.hpp"
#include "geocut/errors.hpp"
#include "geocut/complex_polygon.hpp"
#include "geocut/ring_reader.hpp"
