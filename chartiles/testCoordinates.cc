#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "coordinates.h"

using namespace chartiles;
using Catch::Approx;

TEST_CASE( "tile-coordinate", "[coordinates]" ) {
	TileCoordinate tc(5, 7, 9);
	REQUIRE(tc.z() == 5);
	REQUIRE(tc.y() == 7);
	REQUIRE(tc.x() == 9);
	REQUIRE(tc.yUp() == 24);

	TileCoordinate p = tc.parent();
	REQUIRE(p.z() == 4);
	REQUIRE(p.y() == 3);
	REQUIRE(p.x() == 4);

	// Packed order is (z, y, x).
	REQUIRE(TileCoordinate(3, 0, 7) < TileCoordinate(3, 1, 0));
	REQUIRE(TileCoordinate(2, 3, 3) < TileCoordinate(3, 0, 0));
}

TEST_CASE( "tile-bounds", "[coordinates]" ) {
	REQUIRE(resolutionForZoom(0) == Approx(156543.03392804097));
	REQUIRE(resolutionForZoom(3) == Approx(156543.03392804097 / 8));

	double tlbr[4];
	tileBoundsWm(tlbr, TileCoordinate(1, 0, 0));
	REQUIRE(tlbr[0] == Approx(-WebMercatorMapScale));
	REQUIRE(tlbr[1] == Approx(0).margin(1e-6));
	REQUIRE(tlbr[2] == Approx(0).margin(1e-6));
	REQUIRE(tlbr[3] == Approx(WebMercatorMapScale));

	tileBoundsWm(tlbr, TileCoordinate(2, 3, 3));
	REQUIRE(tlbr[0] == Approx(WebMercatorMapScale / 2));
	REQUIRE(tlbr[1] == Approx(-WebMercatorMapScale));
	REQUIRE(tlbr[3] == Approx(-WebMercatorMapScale / 2));
}

TEST_CASE( "lonlat-to-tile", "[coordinates]" ) {
	uint32_t x, y;
	lonLatToTile(.1, .1, 1, x, y);
	REQUIRE(x == 1);
	REQUIRE(y == 0);

	// Edges clamp onto the grid.
	lonLatToTile(180, -89, 4, x, y);
	REQUIRE(x == 15);
	REQUIRE(y == 15);
	lonLatToTile(-180, 89, 4, x, y);
	REQUIRE(x == 0);
	REQUIRE(y == 0);

	TileRange r = tileRangeForBox(GeoBox{-10, -10, 10, 10}, 3);
	REQUIRE(r.x0 == 3);
	REQUIRE(r.x1 == 4);
	REQUIRE(r.y0 == 3);
	REQUIRE(r.y1 == 4);
	REQUIRE(r.count() == 4);
	REQUIRE(tileRangeForBox(GeoBox{-10, -10, 10, 10}, 0).count() == 1);
}

TEST_CASE( "mercator", "[coordinates]" ) {
	REQUIRE(lonToMercatorX(180) == Approx(WebMercatorMapScale));
	REQUIRE(mercatorXToLon(-WebMercatorMapScale) == Approx(-180));
	REQUIRE(latToMercatorY(0) == Approx(0).margin(1e-9));
	REQUIRE(mercatorYToLat(WebMercatorMapScale) == Approx(85.0511287798).epsilon(1e-9));
	REQUIRE(mercatorYToLat(latToMercatorY(47.5)) == Approx(47.5));
}
