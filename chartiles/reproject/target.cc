#include "target.h"

#include "chartiles/errors.h"

#include <fmt/core.h>

#include <cpl_conv.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace chartiles {

namespace {

	constexpr int EdgeSamples = 21;

	struct Extent {
		double minX, minY, maxX, maxY;
		inline double dx() const { return maxX - minX; }
		inline double dy() const { return maxY - minY; }
	};

	// Perimeter of an axis aligned box, EdgeSamples points per side.
	void samplePerimeter(const Eigen::AlignedBox2d& box, std::vector<double>& xs, std::vector<double>& ys) {
		xs.clear(); ys.clear();
		const Eigen::Vector2d lo = box.min(), hi = box.max();
		for (int i=0; i<EdgeSamples; i++) {
			double t = static_cast<double>(i) / (EdgeSamples - 1);
			double x = lo(0) + t * (hi(0) - lo(0));
			double y = lo(1) + t * (hi(1) - lo(1));
			xs.push_back(x);     ys.push_back(lo(1));
			xs.push_back(x);     ys.push_back(hi(1));
			xs.push_back(lo(0)); ys.push_back(y);
			xs.push_back(hi(0)); ys.push_back(y);
		}
	}

	// Transforms in place, dropping points that fail.
	void transformPoints(const std::string& dataset, OGRCoordinateTransformation* ct, std::vector<double>& xs, std::vector<double>& ys) {
		std::vector<int> ok(xs.size(), 0);
		ct->Transform(static_cast<int>(xs.size()), xs.data(), ys.data(), nullptr, ok.data());

		size_t j = 0;
		for (size_t i=0; i<xs.size(); i++) {
			if (ok[i] and std::isfinite(xs[i]) and std::isfinite(ys[i])) {
				xs[j] = xs[i];
				ys[j] = ys[i];
				j++;
			}
		}
		xs.resize(j); ys.resize(j);

		if (j == 0) throw DatasetError(dataset, "no point of the window could be transformed to the destination");
	}

	Extent extentOf(const std::vector<double>& xs, const std::vector<double>& ys) {
		Extent e;
		e.minX = *std::min_element(xs.begin(), xs.end());
		e.maxX = *std::max_element(xs.begin(), xs.end());
		e.minY = *std::min_element(ys.begin(), ys.end());
		e.maxY = *std::max_element(ys.begin(), ys.end());
		return e;
	}

	double suggestedResolution(const Extent& e, int w, int h) {
		return std::sqrt(e.dx()*e.dx() + e.dy()*e.dy()) / std::sqrt(static_cast<double>(w)*w + static_cast<double>(h)*h);
	}

	// Width of one revolution of longitude, in destination x.
	double periodOf(const OGRSpatialReference& dst) {
		auto ct = makeTransform(wgs84(), dst);
		double xs[2] = { -180., 180. };
		double ys[2] = { 0., 0. };
		if (!ct->Transform(2, xs, ys)) throw std::runtime_error("cannot transform the antimeridian to the destination");
		return xs[1] - xs[0];
	}

	TargetGeometry makeGeometry(const Extent& e, double res, bool ceilSize) {
		TargetGeometry t;
		t.res = res;
		double fw = e.dx() / res;
		double fh = e.dy() / res;
		t.width  = std::max(1, static_cast<int>(ceilSize ? std::ceil(fw - 1e-9) : std::round(fw)));
		t.height = std::max(1, static_cast<int>(ceilSize ? std::ceil(fh - 1e-9) : std::round(fh)));
		t.pix2dst << res, 0, e.minX,
		             0, -res, e.maxY;
		return t;
	}

}

Eigen::AlignedBox2d boundsWithRotation(int w, int h, const RowMatrix23d& A) {
	Eigen::AlignedBox2d box;
	box.extend(A * Eigen::Vector3d{0, 0, 1});
	box.extend(A * Eigen::Vector3d{(double)w, 0, 1});
	box.extend(A * Eigen::Vector3d{(double)w, (double)h, 1});
	box.extend(A * Eigen::Vector3d{0, (double)h, 1});
	return box;
}

OGRSpatialReference shiftedToAntimeridian(const OGRSpatialReference& dst) {
	char* proj4 = nullptr;
	if (dst.exportToProj4(&proj4) != OGRERR_NONE or proj4 == nullptr) {
		CPLFree(proj4);
		throw std::runtime_error("cannot express the destination SRS as proj4");
	}
	std::string s { proj4 };
	CPLFree(proj4);

	auto i = s.find("+lon_0=");
	if (i == std::string::npos) {
		s += " +lon_0=180";
	} else {
		auto j = s.find(' ', i);
		s.replace(i, (j == std::string::npos ? s.size() : j) - i, "+lon_0=180");
	}

	OGRSpatialReference out;
	if (out.importFromProj4(s.c_str()) != OGRERR_NONE)
		throw std::runtime_error(fmt::format("cannot import shifted SRS '{}'", s));
	out.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	return out;
}

TargetGeometry computeTarget(const std::string& dataset,
		const OGRSpatialReference& src, const RowMatrix23d& srcAffine, int w, int h,
		const OGRSpatialReference& dst, bool antimeridian, std::optional<double> forcedRes) {

	if (w <= 0 or h <= 0) throw DatasetError(dataset, fmt::format("empty window {}x{}", w, h));

	// Axis-aligned source box covering the rotated window.
	Eigen::AlignedBox2d srcBox = boundsWithRotation(w, h, srcAffine);

	std::vector<double> xs, ys;

	try {
		if (!antimeridian) {
			auto ct = makeTransform(src, dst);
			samplePerimeter(srcBox, xs, ys);
			transformPoints(dataset, ct.get(), xs, ys);
			Extent e = extentOf(xs, ys);
			double res = forcedRes.has_value() ? *forcedRes : suggestedResolution(e, w, h);
			return makeGeometry(e, res, forcedRes.has_value());
		}

		// Resolution from a destination centered on the antimeridian, where the window is not split.
		double res;
		if (forcedRes.has_value()) {
			res = *forcedRes;
		} else {
			auto shifted = shiftedToAntimeridian(dst);
			auto ct = makeTransform(src, shifted);
			samplePerimeter(srcBox, xs, ys);
			transformPoints(dataset, ct.get(), xs, ys);
			res = suggestedResolution(extentOf(xs, ys), w, h);
		}

		// Extent under the real destination, with the western half moved east by one period.
		auto ct = makeTransform(src, dst);
		samplePerimeter(srcBox, xs, ys);
		transformPoints(dataset, ct.get(), xs, ys);
		double period = periodOf(dst);

		Extent e = extentOf(xs, ys);
		bool unwrapped = false;
		if (e.dx() > period * .5) {
			for (auto& x : xs) if (x < 0) x += period;
			e = extentOf(xs, ys);
			unwrapped = true;
		}

		TargetGeometry t = makeGeometry(e, res, true);
		t.unwrapped = unwrapped;
		t.period = period;
		return t;

	} catch (const DatasetError&) {
		throw;
	} catch (const std::runtime_error& e) {
		throw DatasetError(dataset, e.what());
	}
}

TargetGeometry applyGeoBound(const std::string& dataset, const TargetGeometry& t, const GeoBound& gb,
		const OGRSpatialReference& dst) {

	const double L = t.minX(), R = t.maxX(), B = t.minY(), T = t.maxY();

	CoordinateTransformPtr ct;
	try {
		ct = makeTransform(wgs84(), dst);
	} catch (const std::runtime_error& e) {
		throw DatasetError(dataset, e.what());
	}

	// Longitudes are mapped at the equator, latitudes on the prime meridian.
	auto lonToX = [&](double lon) {
		double x = lon, y = 0;
		if (!ct->Transform(1, &x, &y)) throw DatasetError(dataset, fmt::format("cannot transform geobound lon {}", lon));
		if (t.unwrapped and x < L) x += t.period;
		return x;
	};
	auto latToY = [&](double lat) {
		double x = 0, y = lat;
		if (!ct->Transform(1, &x, &y)) throw DatasetError(dataset, fmt::format("cannot transform geobound lat {}", lat));
		return y;
	};

	double newL = gb.minLon.has_value() ? lonToX(*gb.minLon) : L;
	double newR = gb.maxLon.has_value() ? lonToX(*gb.maxLon) : R;
	double newB = gb.minLat.has_value() ? latToY(*gb.minLat) : B;
	double newT = gb.maxLat.has_value() ? latToY(*gb.maxLat) : T;

	newL = std::max(newL, L);
	newR = std::min(newR, R);
	newB = std::max(newB, B);
	newT = std::min(newT, T);

	if (newL >= newR or newB >= newT)
		throw DatasetError(dataset, fmt::format("geobound leaves nothing of [{:.1f} {:.1f} {:.1f} {:.1f}]", L, B, R, T));

	int col0 = std::max(0, static_cast<int>(std::floor((newL - L) / t.res + 1e-6)));
	int col1 = std::min(t.width, static_cast<int>(std::ceil((newR - L) / t.res - 1e-6)));
	int row0 = std::max(0, static_cast<int>(std::floor((T - newT) / t.res + 1e-6)));
	int row1 = std::min(t.height, static_cast<int>(std::ceil((T - newB) / t.res - 1e-6)));

	if (col1 <= col0 or row1 <= row0)
		throw DatasetError(dataset, "geobound is thinner than one pixel");

	TargetGeometry out = t;
	out.width  = col1 - col0;
	out.height = row1 - row0;
	out.pix2dst(0,2) = L + col0 * t.res;
	out.pix2dst(1,2) = T - row0 * t.res;
	return out;
}

TargetGeometry wrapToMap(const TargetGeometry& t) {
	TargetGeometry out = t;
	if (t.unwrapped and t.minX() >= t.period * .5 - t.res) {
		out.pix2dst(0,2) -= t.period;
		out.unwrapped = false;
	}
	return out;
}

}
