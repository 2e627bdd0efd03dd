#pragma once

#include "chartiles/gdal/raster.h"
#include "chartiles/config/descriptors.h"

#include <Eigen/Geometry>

#include <optional>
#include <string>

namespace chartiles {

//
// North-up destination grid of one reprojected dataset.
// pix2dst is [res 0 minX; 0 -res maxY].
//
struct TargetGeometry {
	RowMatrix23d pix2dst;
	int width = 0, height = 0;
	double res = 0;

	// Set when x was unwrapped across the antimeridian. x may then exceed the SRS's
	// usual range by up to one period.
	bool unwrapped = false;
	double period = 0;

	inline double minX() const { return pix2dst(0,2); }
	inline double maxY() const { return pix2dst(1,2); }
	inline double maxX() const { return minX() + width * res; }
	inline double minY() const { return maxY() - height * res; }
};

// Bounds of a w x h pixel window under affine A, over all four corners.
Eigen::AlignedBox2d boundsWithRotation(int w, int h, const RowMatrix23d& A);

//
// Destination grid for warping a w x h window whose pixels map to `src` coordinates through `srcAffine`.
//
// Without `forcedRes` the pixel size follows GDAL's suggested-warp rule (extent diagonal over pixel diagonal)
// and the size is rounded. With it, the size is the ceiling.
// With `antimeridian`, the pixel size is taken under a copy of `dst` centered on lon 180, and x is unwrapped
// so the extent stays continuous.
//
// Throws DatasetError if no point of the window can be transformed.
//
TargetGeometry computeTarget(const std::string& dataset,
		const OGRSpatialReference& src, const RowMatrix23d& srcAffine, int w, int h,
		const OGRSpatialReference& dst, bool antimeridian, std::optional<double> forcedRes = {});

//
// Clip a target to a geographic bound, snapping outward to whole pixels.
// Absent components keep the target's own bound. Idempotent.
// Throws DatasetError if nothing is left.
//
TargetGeometry applyGeoBound(const std::string& dataset, const TargetGeometry& t, const GeoBound& gb,
		const OGRSpatialReference& dst);

//
// An unwrapped target lying wholly east of the map edge (the western half of a split dataset, after its geobound)
// is moved back by one period. Anything else is returned unchanged.
//
TargetGeometry wrapToMap(const TargetGeometry& t);

// Same SRS, with the central meridian moved to 180.
OGRSpatialReference shiftedToAntimeridian(const OGRSpatialReference& dst);

}
