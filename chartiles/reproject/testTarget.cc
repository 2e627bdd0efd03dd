#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fmt/core.h>

#include "target.h"
#include "chartiles/coordinates.h"
#include "chartiles/errors.h"

using namespace chartiles;
using Catch::Approx;

namespace {
	// 0.2 deg/px in lon, 0.1 deg/px in lat, top-left at (lon0, 70).
	RowMatrix23d lonLatAffine(double lon0) {
		RowMatrix23d A;
		A << .2, 0, lon0,
		     0, -.1, 70;
		return A;
	}
}

TEST_CASE( "bounds-with-rotation", "[target]" ) {
	// Rotated by 90 degrees: pixel x runs along +y, pixel y along -x.
	RowMatrix23d A;
	A << 0, -1, 100,
	     1,  0,  50;

	auto box = boundsWithRotation(10, 20, A);
	REQUIRE(box.min()(0) == Approx(80));
	REQUIRE(box.max()(0) == Approx(100));
	REQUIRE(box.min()(1) == Approx(50));
	REQUIRE(box.max()(1) == Approx(60));

	// Only the corners matter, not the order they are visited in.
	RowMatrix23d flipped;
	flipped << -2, 0, 0,
	            0, 3, 0;
	auto box2 = boundsWithRotation(5, 5, flipped);
	REQUIRE(box2.min()(0) == Approx(-10));
	REQUIRE(box2.max()(0) == Approx(0));
	REQUIRE(box2.min()(1) == Approx(0));
	REQUIRE(box2.max()(1) == Approx(15));
}

TEST_CASE( "antimeridian-width", "[target]" ) {
	gdalInit();
	auto src = wgs84();
	auto dst = webMercator();

	// 20 x 400 px over lon 178..182, lat 70..30.
	auto natural = computeTarget("crossing", src, lonLatAffine(178), 20, 400, dst, false);
	auto safe    = computeTarget("crossing", src, lonLatAffine(178), 20, 400, dst, true);

	// Without the split the extent wraps around the whole world.
	fmt::print(" - natural {}x{}, safe {}x{}\n", natural.width, natural.height, safe.width, safe.height);
	REQUIRE(natural.width > 10 * safe.width);

	// Same window away from the antimeridian.
	auto reference = computeTarget("reference", src, lonLatAffine(170), 20, 400, dst, false);
	REQUIRE(safe.width <= 2 * reference.width);
	REQUIRE(safe.unwrapped);
	REQUIRE(safe.maxX() > WebMercatorMapScale);
	REQUIRE(safe.minX() < WebMercatorMapScale);

	// The flag is harmless on a dataset that does not cross.
	auto flagged = computeTarget("reference", src, lonLatAffine(170), 20, 400, dst, true);
	REQUIRE(!flagged.unwrapped);
	REQUIRE(flagged.width <= 2 * reference.width);
	REQUIRE(flagged.minX() == Approx(reference.minX()).epsilon(1e-6));
}

TEST_CASE( "forced-resolution", "[target]" ) {
	gdalInit();
	double res = resolutionForZoom(6);
	auto t = computeTarget("forced", wgs84(), lonLatAffine(170), 20, 400, webMercator(), false, res);
	REQUIRE(t.res == res);

	// Covers the whole extent.
	double ext = lonToMercatorX(174) - lonToMercatorX(170);
	REQUIRE(t.width * res >= ext - 1e-6);
	REQUIRE((t.width - 1) * res < ext);
}

TEST_CASE( "geobound-idempotent", "[target]" ) {
	gdalInit();
	auto dst = webMercator();
	auto t = computeTarget("clip", wgs84(), lonLatAffine(170), 20, 400, dst, false);

	GeoBound gb { 171., std::nullopt, 173.5, 60. };
	auto once  = applyGeoBound("clip", t, gb, dst);
	auto twice = applyGeoBound("clip", once, gb, dst);

	REQUIRE(once.width < t.width);
	REQUIRE(once.height < t.height);
	REQUIRE(once.minY() == Approx(t.minY()));

	REQUIRE(twice.width == once.width);
	REQUIRE(twice.height == once.height);
	REQUIRE(twice.minX() == once.minX());
	REQUIRE(twice.maxY() == once.maxY());

	// Snapped outward: the bound lies inside the clipped grid.
	REQUIRE(once.minX() <= lonToMercatorX(171) + 1e-6);
	REQUIRE(once.maxX() >= lonToMercatorX(173.5) - 1e-6);
	REQUIRE(once.maxY() >= latToMercatorY(60) - 1e-6);

	// Fully null bound changes nothing.
	auto same = applyGeoBound("clip", t, GeoBound{}, dst);
	REQUIRE(same.width == t.width);
	REQUIRE(same.height == t.height);
	REQUIRE(same.minX() == t.minX());
}

TEST_CASE( "geobound-empty", "[target]" ) {
	gdalInit();
	auto dst = webMercator();
	auto t = computeTarget("clip", wgs84(), lonLatAffine(170), 20, 400, dst, false);

	GeoBound gb { 175., std::nullopt, std::nullopt, std::nullopt };
	REQUIRE_THROWS_AS(applyGeoBound("clip", t, gb, dst), DatasetError);
}

TEST_CASE( "antimeridian-split-pair", "[target]" ) {
	gdalInit();
	auto dst = webMercator();
	auto t = computeTarget("crossing", wgs84(), lonLatAffine(178), 20, 400, dst, true);
	REQUIRE(t.unwrapped);

	GeoBound eastGb { std::nullopt, std::nullopt, 180., std::nullopt };
	GeoBound westGb { -180., std::nullopt, std::nullopt, std::nullopt };
	auto east = wrapToMap(applyGeoBound("East", t, eastGb, dst));
	auto west = wrapToMap(applyGeoBound("West", t, westGb, dst));

	// East half stays where it was, ending at the map edge.
	REQUIRE(east.minX() == Approx(t.minX()));
	REQUIRE(east.maxX() <= WebMercatorMapScale + east.res);
	REQUIRE(east.maxX() >= WebMercatorMapScale - 1e-6);

	// West half is moved back onto the map, starting at its western edge.
	REQUIRE(!west.unwrapped);
	REQUIRE(west.maxX() <= WebMercatorMapScale);
	REQUIRE(west.minX() == Approx(-WebMercatorMapScale).margin(west.res));
	REQUIRE(west.maxX() == Approx(lonToMercatorX(-178)).margin(west.res));
	REQUIRE(west.width + east.width >= t.width);
	REQUIRE(west.width + east.width <= t.width + 1);

	// Targets already on the map are left alone.
	auto plain = computeTarget("reference", wgs84(), lonLatAffine(170), 20, 400, dst, false);
	auto same = wrapToMap(plain);
	REQUIRE(same.minX() == plain.minX());
	REQUIRE(same.width == plain.width);
}
