#pragma once

// morphcore: chamfer distance maps, geodesic distances and connected
// component labeling on dense 2D/3D grids.
// Include individual headers for minimal compile times,
// or include this header for everything.

// Tier 1: Foundation
#include "log.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "scan_control.hpp"
#include "connectivity.hpp"

// Tier 2: Masks
#include "chamfer_mask.hpp"

// Tier 3: Algorithms
#include "distance_transform.hpp"
#include "geodesic_distance.hpp"
#include "connected_components.hpp"
