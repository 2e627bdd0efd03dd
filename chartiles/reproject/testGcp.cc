#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "gcp.h"
#include "chartiles/errors.h"

using namespace chartiles;
using Catch::Approx;

TEST_CASE( "gcp-fit", "[gcp]" ) {
	gdalInit();

	// lon = -123 + .01 px, lat = 48 - .02 py, read back in the native (here geographic) SRS.
	std::vector<GroundControlPoint> gcps;
	const double pxs[4][2] = { {0,0}, {100,0}, {0,50}, {100,50} };
	for (auto& p : pxs) gcps.push_back({p[0], p[1], -123 + .01*p[0], 48 - .02*p[1]});

	RowMatrix23d A = fitGcpAffine("gcp", gcps, wgs84());
	REQUIRE(A(0,0) == Approx(.01));
	REQUIRE(A(0,1) == Approx(0).margin(1e-9));
	REQUIRE(A(0,2) == Approx(-123));
	REQUIRE(A(1,0) == Approx(0).margin(1e-9));
	REQUIRE(A(1,1) == Approx(-.02));
	REQUIRE(A(1,2) == Approx(48));

	// Deterministic.
	RowMatrix23d B = fitGcpAffine("gcp", gcps, wgs84());
	REQUIRE((A.array() == B.array()).all());
}

TEST_CASE( "gcp-window-relative", "[gcp]" ) {
	std::vector<GroundControlPoint> gcps = { {110, 220, 1, 2}, {300, 400, 3, 4} };
	auto rel = windowRelative(gcps, PixelWindow{100, 200, 50, 50});
	REQUIRE(rel[0].px == 10);
	REQUIRE(rel[0].py == 20);
	REQUIRE(rel[1].px == 200);
	REQUIRE(rel[1].lon == 3);
}

TEST_CASE( "gcp-rejects", "[gcp]" ) {
	gdalInit();

	std::vector<GroundControlPoint> two = { {0, 0, -123, 48}, {10, 0, -122, 48} };
	REQUIRE_THROWS_AS(fitGcpAffine("gcp", two, wgs84()), GcpError);

	std::vector<GroundControlPoint> line = { {0, 0, -123, 48}, {10, 10, -122, 47}, {20, 20, -121, 46}, {30, 30, -120, 45} };
	REQUIRE_THROWS_AS(fitGcpAffine("gcp", line, wgs84()), GcpError);

	// Still a DatasetError to the orchestrator.
	REQUIRE_THROWS_AS(fitGcpAffine("gcp", two, wgs84()), DatasetError);
}
