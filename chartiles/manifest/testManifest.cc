#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fmt/core.h>

#include "manifest.h"

using namespace chartiles;
using Catch::Approx;

namespace {
	Log quiet { true };
}

TEST_CASE( "manifest-lod-gating", "[manifest]" ) {
	// A coarse chart and a detail chart far from each other.
	std::vector<ManifestInput> inputs = {
		{ "coarse", 5,  GeoBox{-10, -10, 10, 10} },
		{ "detail", 10, GeoBox{20, 20, 25, 25} },
	};

	auto m = buildManifest(inputs, 0, 10, quiet);

	// At zoom 8 only the detail chart contributes.
	TileRange d8 = tileRangeForBox(GeoBox{20, 20, 25, 25}, 8);
	REQUIRE(m.count(8) == d8.count());
	uint32_t cx, cy;
	lonLatToTile(0, 0, 8, cx, cy);
	REQUIRE(!m.contains(8, cx, cy));
	REQUIRE(m.contains(8, d8.x0, d8.y0));

	// At zoom 3 both do.
	lonLatToTile(0, 0, 3, cx, cy);
	REQUIRE(m.contains(3, cx, cy));
	uint32_t dx, dy;
	lonLatToTile(22, 22, 3, dx, dy);
	REQUIRE(m.contains(3, dx, dy));

	// Nothing past the largest max_lod.
	auto m2 = buildManifest(inputs, 0, 12, quiet);
	REQUIRE(m2.count(11) == 0);
	REQUIRE(m2.zooms().back() == 10);
}

TEST_CASE( "manifest-sorted-unique", "[manifest]" ) {
	// Overlapping members produce each tile once.
	std::vector<ManifestInput> inputs = {
		{ "a", 4, GeoBox{-10, -10, 10, 10} },
		{ "b", 4, GeoBox{-5, -5, 15, 15} },
	};
	auto m = buildManifest(inputs, 4, 4, quiet);
	const auto& ts = m.tiles(4);
	for (size_t i=1; i<ts.size(); i++) REQUIRE(ts[i-1] < ts[i]);

	auto ra = tileRangeForBox(inputs[0].bounds.value(), 4);
	auto rb = tileRangeForBox(inputs[1].bounds.value(), 4);
	REQUIRE(m.count(4) < ra.count() + rb.count());
	REQUIRE(m.count(4) >= std::max(ra.count(), rb.count()));
}

TEST_CASE( "manifest-antimeridian-split", "[manifest]" ) {
	GeoBox box { 170, -10, -170, 10 };
	REQUIRE(box.crossesAntimeridian());

	auto ranges = tileRangesForBox(box, 2);
	REQUIRE(ranges.size() == 2);

	std::vector<ManifestInput> inputs = { { "wac", 8, box } };
	auto m = buildManifest(inputs, 2, 2, quiet);
	REQUIRE(m.count(2) == 4);
	REQUIRE(m.contains(2, 3, 1));
	REQUIRE(m.contains(2, 3, 2));
	REQUIRE(m.contains(2, 0, 1));
	REQUIRE(m.contains(2, 0, 2));
	REQUIRE(!m.contains(2, 1, 1));
	REQUIRE(!m.contains(2, 2, 1));
}

TEST_CASE( "manifest-wm-bounds", "[manifest]" ) {
	// An unwrapped extent from lon 178 to lon 182.
	GeoBox b = geoBoxOfWebMercator(lonToMercatorX(178), latToMercatorY(30), WebMercatorMapScale + lonToMercatorX(2), latToMercatorY(70));
	REQUIRE(b.minLon == Approx(178));
	REQUIRE(b.maxLon == Approx(-178));
	REQUIRE(b.crossesAntimeridian());
	REQUIRE(b.minLat == Approx(30));
	REQUIRE(b.maxLat == Approx(70));

	GeoBox c = geoBoxOfWebMercator(lonToMercatorX(-10), latToMercatorY(-10), lonToMercatorX(10), latToMercatorY(10));
	REQUIRE(!c.crossesAntimeridian());
	REQUIRE(c.minLon == Approx(-10));
}

TEST_CASE( "manifest-missing-raster", "[manifest]" ) {
	std::vector<ManifestInput> inputs = {
		{ "gone", 6, std::nullopt },
		{ "here", 6, GeoBox{-10, -10, 10, 10} },
	};
	auto m = buildManifest(inputs, 0, 3, quiet);
	REQUIRE(m.count(0) == 1);
	REQUIRE(m.count(3) == 4);

	REQUIRE(!readRasterBounds("/nonexistent/_gone.tif").has_value());
}

TEST_CASE( "manifest-summary", "[manifest]" ) {
	std::vector<ManifestInput> inputs = { { "a", 3, GeoBox{-10, -10, 10, 10} } };
	auto m = buildManifest(inputs, 0, 3, quiet);
	REQUIRE(m.total() == 13);

	auto s = manifestSummary(m);
	fmt::print("{}", s);
	REQUIRE(s.find("  zoom  0: 1 tiles\n") != std::string::npos);
	REQUIRE(s.find("  zoom  3: 4 tiles\n") != std::string::npos);
	REQUIRE(s.find("  total: 13 tiles\n") != std::string::npos);
}
