#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "stack.h"
#include "chartiles/errors.h"
#include "chartiles/gdal/raster.h"

#include <filesystem>
#include <fstream>

using namespace chartiles;
namespace fs = std::filesystem;

namespace {
	// Tiny north-up 3857 raster with `nbands` Byte bands, the last marked alpha if there are 4.
	void makeRaster(const std::string& path, int nbands, double originX) {
		gdalInit();
		auto drv = GetGDALDriverManager()->GetDriverByName("GTiff");
		REQUIRE(drv != nullptr);
		RasterSource r(drv->Create(path.c_str(), 16, 16, nbands, GDT_Byte, nullptr), path);
		RowMatrix23d A;
		A << 100, 0, originX,
		     0, -100, 0;
		r.setGeoTransform(A);
		auto srs = webMercator();
		r.get()->SetSpatialRef(&srs);
		const GDALColorInterp rgba[4] = { GCI_RedBand, GCI_GreenBand, GCI_BlueBand, GCI_AlphaBand };
		if (nbands == 4 or nbands == 3)
			for (int b=0; b<nbands; b++) r.get()->GetRasterBand(b+1)->SetColorInterpretation(rgba[b]);
	}

	std::string scratch(const std::string& name) {
		auto d = fs::temp_directory_path() / fmt::format("chartiles_test_stack_{}", name);
		fs::remove_all(d);
		fs::create_directories(d);
		return d.string();
	}
}

TEST_CASE( "stack-order", "[mosaic]" ) {
	std::vector<StackMember> c = {
		{ "sec",   "a.tif", 12 },
		{ "inset", "b.tif", 8 },
		{ "tac",   "c.tif", 15 },
	};

	auto s = orderStack(c, 0);
	REQUIRE(s.size() == 3);
	REQUIRE(s[0].maxLod == 15);
	REQUIRE(s[1].maxLod == 12);
	REQUIRE(s[2].maxLod == 8);
	REQUIRE(s.back().dataset == "inset");

	// Zoom 10 leaves the max_lod 8 member out.
	auto s10 = orderStack(c, 10);
	REQUIRE(s10.size() == 2);
	REQUIRE(s10.back().dataset == "sec");

	// Ties keep tileset order.
	std::vector<StackMember> tie = { { "x", "x.tif", 9 }, { "y", "y.tif", 11 }, { "z", "z.tif", 9 } };
	auto st = orderStack(tie, 0);
	REQUIRE(st[0].dataset == "y");
	REQUIRE(st[1].dataset == "x");
	REQUIRE(st[2].dataset == "z");
}

TEST_CASE( "stack-build", "[mosaic]" ) {
	auto dir = scratch("build");
	makeRaster(dir + "/_a.tif", 4, 0);
	makeRaster(dir + "/_b.tif", 4, 1600);

	std::vector<StackMember> c = {
		{ "a", dir + "/_a.tif", 6 },
		{ "b", dir + "/_b.tif", 4 },
		{ "missing", dir + "/_missing.tif", 6 },
	};

	auto stack = buildMosaicStack("sec", 3, c, dir);
	REQUIRE(stack.members.size() == 2);
	REQUIRE(stack.vrtPath == dir + "/__sec__z3.vrt");
	REQUIRE(fs::exists(stack.vrtPath));

	RasterSource vrt(stack.vrtPath);
	REQUIRE(vrt.width() == 32);
	REQUIRE(vrt.bandCount() == 4);

	// Nothing eligible at zoom 7.
	REQUIRE_THROWS_AS(buildMosaicStack("sec", 7, c, dir), ZoomLevelError);
}

TEST_CASE( "stack-mismatch", "[mosaic]" ) {
	auto dir = scratch("mismatch");
	makeRaster(dir + "/_a.tif", 4, 0);
	makeRaster(dir + "/_b.tif", 3, 1600);

	std::vector<StackMember> c = {
		{ "a", dir + "/_a.tif", 6 },
		{ "b", dir + "/_b.tif", 6 },
	};

	REQUIRE_THROWS_AS(buildMosaicStack("sec", 2, c, dir), MosaicMismatchError);
	REQUIRE_THROWS_AS(checkStackCompatible(c, 2), ZoomLevelError);
}

TEST_CASE( "stack-unwritable", "[mosaic]" ) {
	auto dir = scratch("unwritable");
	makeRaster(dir + "/_a.tif", 4, 0);
	std::vector<StackMember> c = { { "a", dir + "/_a.tif", 6 } };

	// The stack's directory is a regular file.
	std::string blocked = dir + "/blocked";
	{ std::ofstream(blocked) << "x"; }

	REQUIRE_THROWS_AS(buildMosaicStack("sec", 2, c, blocked), ZoomLevelError);
	REQUIRE(fs::is_regular_file(blocked));

	// A leftover stack file is replaced, not trusted.
	std::string stale = stackVrtPath(dir, "sec", 2);
	{ std::ofstream(stale) << "not a vrt"; }
	auto stack = buildMosaicStack("sec", 2, c, dir);
	RasterSource vrt(stack.vrtPath);
	REQUIRE(vrt.bandCount() == 4);
}
