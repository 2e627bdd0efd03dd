#include "gcp.h"

#include "chartiles/errors.h"

#include <Eigen/LU>

#include <gdal.h>

#include <fmt/core.h>

namespace chartiles {

std::vector<GroundControlPoint> windowRelative(const std::vector<GroundControlPoint>& gcps, const PixelWindow& window) {
	std::vector<GroundControlPoint> out = gcps;
	for (auto& g : out) {
		g.px -= window.x;
		g.py -= window.y;
	}
	return out;
}

RowMatrix23d fitGcpAffine(const std::string& dataset, const std::vector<GroundControlPoint>& gcps,
		const OGRSpatialReference& srs) {
	const int n = static_cast<int>(gcps.size());
	if (n < 3) throw GcpError(dataset, n, "need at least 3 points");

	// Rank of [x y 1] is 3 iff the pixel positions are not collinear.
	Eigen::MatrixXd design(n, 3);
	for (int i=0; i<n; i++) design.row(i) << gcps[i].px, gcps[i].py, 1.;
	Eigen::FullPivLU<Eigen::MatrixXd> lu(design);
	lu.setThreshold(1e-9);
	if (lu.rank() < 3) throw GcpError(dataset, n, "points are collinear");

	std::vector<double> xs(n), ys(n);
	for (int i=0; i<n; i++) { xs[i] = gcps[i].lon; ys[i] = gcps[i].lat; }

	CoordinateTransformPtr ct;
	try {
		ct = makeTransform(wgs84(), srs);
	} catch (const std::runtime_error& e) {
		throw GcpError(dataset, n, e.what());
	}
	if (!ct->Transform(n, xs.data(), ys.data()))
		throw GcpError(dataset, n, "cannot transform points to the native projection");

	std::vector<GDAL_GCP> pts(n);
	GDALInitGCPs(n, pts.data());
	for (int i=0; i<n; i++) {
		pts[i].dfGCPPixel = gcps[i].px;
		pts[i].dfGCPLine  = gcps[i].py;
		pts[i].dfGCPX     = xs[i];
		pts[i].dfGCPY     = ys[i];
		pts[i].dfGCPZ     = 0;
	}

	double g[6];
	int ok = GDALGCPsToGeoTransform(n, pts.data(), g, TRUE);
	GDALDeinitGCPs(n, pts.data());
	if (!ok) throw GcpError(dataset, n, "least squares fit failed");

	return affineFromGeoTransform(g);
}

}
