#pragma once

#include "chartiles/gdal/raster.h"
#include "chartiles/config/descriptors.h"

#include <string>
#include <vector>

namespace chartiles {

//
// Fit the affine taking window pixels to `srs` coordinates from ground control points.
// The points' pixel coordinates must already be relative to the window.
// Throws GcpError with fewer than 3 points, or when the points are collinear.
//
RowMatrix23d fitGcpAffine(const std::string& dataset, const std::vector<GroundControlPoint>& gcps,
		const OGRSpatialReference& srs);

// Shift full-source pixel coordinates into the window.
std::vector<GroundControlPoint> windowRelative(const std::vector<GroundControlPoint>& gcps, const PixelWindow& window);

}
