#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "writer.h"
#include "chartiles/gdal/raster.h"

#include <filesystem>
#include <fstream>

using namespace chartiles;
namespace fs = std::filesystem;

namespace {
	std::string scratch(const std::string& name) {
		auto d = fs::temp_directory_path() / fmt::format("chartiles_test_pyramid_{}", name);
		fs::remove_all(d);
		fs::create_directories(d);
		return d.string();
	}

	cv::Mat solid(const cv::Scalar& bgra) {
		return cv::Mat(TileSize, TileSize, CV_8UC4, bgra);
	}

	bool pixelIs(const cv::Mat& img, int row, int col, const cv::Vec4b& want) {
		return img.at<cv::Vec4b>(row, col) == want;
	}

	// 256x256 north-up 3857 raster covering exactly XYZ tile (1, 0, 0).
	void fillQuadrant(RasterSource& r, bool withAlpha) {
		RowMatrix23d A;
		A << WebMercatorMapScale / TileSize, 0, -WebMercatorMapScale,
		     0, -WebMercatorMapScale / TileSize, WebMercatorMapScale;
		r.setGeoTransform(A);
		auto srs = webMercator();
		r.get()->SetSpatialRef(&srs);

		const int rgba[4] = { 10, 20, 30, 255 };
		for (int b=1; b<=r.bandCount(); b++) REQUIRE(r.get()->GetRasterBand(b)->Fill(rgba[b-1]) == CE_None);
		if (withAlpha) REQUIRE(r.get()->GetRasterBand(4)->SetColorInterpretation(GCI_AlphaBand) == CE_None);
	}

	RasterSource memQuadrant(bool withAlpha) {
		gdalInit();
		auto drv = GetGDALDriverManager()->GetDriverByName("MEM");
		REQUIRE(drv != nullptr);
		RasterSource r(drv->Create("", TileSize, TileSize, withAlpha ? 4 : 3, GDT_Byte, nullptr), "mem");
		fillQuadrant(r, withAlpha);
		return r;
	}
}

TEST_CASE( "overview-quadrants", "[pyramid]" ) {
	auto root = scratch("quadrants");

	// XYZ children of (0,0,0): y=0 is the north row.
	writeTile(tilePath(root, TileCoordinate{1,0,0}, TileFormat::PNG), solid({0,0,255,255}),     TileFormat::PNG);
	writeTile(tilePath(root, TileCoordinate{1,0,1}, TileFormat::PNG), solid({0,255,0,255}),     TileFormat::PNG);
	writeTile(tilePath(root, TileCoordinate{1,1,0}, TileFormat::PNG), solid({255,0,0,255}),     TileFormat::PNG);
	writeTile(tilePath(root, TileCoordinate{1,1,1}, TileFormat::PNG), solid({255,255,255,255}), TileFormat::PNG);

	REQUIRE(buildOverviewTile(root, TileCoordinate{0,0,0}, TileFormat::PNG) == TileOutcome::Written);

	cv::Mat parent = readTile(tilePath(root, TileCoordinate{0,0,0}, TileFormat::PNG));
	REQUIRE(parent.rows == TileSize);
	REQUIRE(parent.cols == TileSize);
	REQUIRE(pixelIs(parent,  64,  64, {0,0,255,255}));
	REQUIRE(pixelIs(parent,  64, 192, {0,255,0,255}));
	REQUIRE(pixelIs(parent, 192,  64, {255,0,0,255}));
	REQUIRE(pixelIs(parent, 192, 192, {255,255,255,255}));

	// Second pass leaves it alone.
	REQUIRE(buildOverviewTile(root, TileCoordinate{0,0,0}, TileFormat::PNG) == TileOutcome::SkippedExisting);
}

TEST_CASE( "overview-missing-children", "[pyramid]" ) {
	auto root = scratch("missing");

	writeTile(tilePath(root, TileCoordinate{2,3,2}, TileFormat::PNG), solid({0,0,255,255}), TileFormat::PNG);

	// Only the south-west child of (1,1,1) exists.
	REQUIRE(buildOverviewTile(root, TileCoordinate{1,1,1}, TileFormat::PNG) == TileOutcome::Written);
	cv::Mat parent = readTile(tilePath(root, TileCoordinate{1,1,1}, TileFormat::PNG));
	REQUIRE(pixelIs(parent, 192,  64, {0,0,255,255}));
	REQUIRE(parent.at<cv::Vec4b>(64, 64)[3] == 0);
	REQUIRE(parent.at<cv::Vec4b>(64, 192)[3] == 0);
	REQUIRE(parent.at<cv::Vec4b>(192, 192)[3] == 0);

	// No children at all.
	REQUIRE(buildOverviewTile(root, TileCoordinate{1,0,0}, TileFormat::PNG) == TileOutcome::SkippedTransparent);
	REQUIRE(!fs::exists(tilePath(root, TileCoordinate{1,0,0}, TileFormat::PNG)));
}

TEST_CASE( "overview-transparent-skip", "[pyramid]" ) {
	auto root = scratch("transparent");

	for (uint64_t y=0; y<2; y++)
		for (uint64_t x=0; x<2; x++)
			writeTile(tilePath(root, TileCoordinate{1,y,x}, TileFormat::PNG), solid({50,60,70,0}), TileFormat::PNG);

	REQUIRE(buildOverviewTile(root, TileCoordinate{0,0,0}, TileFormat::PNG) == TileOutcome::SkippedTransparent);
	REQUIRE(!fs::exists(tilePath(root, TileCoordinate{0,0,0}, TileFormat::PNG)));
}

TEST_CASE( "overview-jpeg-opaque", "[pyramid]" ) {
	auto root = scratch("jpeg");

	writeTile(tilePath(root, TileCoordinate{1,0,0}, TileFormat::JPEG), solid({40,40,40,0}), TileFormat::JPEG);
	REQUIRE(buildOverviewTile(root, TileCoordinate{0,0,0}, TileFormat::JPEG) == TileOutcome::Written);

	cv::Mat parent = readTile(tilePath(root, TileCoordinate{0,0,0}, TileFormat::JPEG));
	REQUIRE(parent.channels() == 4);
	REQUIRE(parent.at<cv::Vec4b>(64, 64)[3] == 255);
}

TEST_CASE( "scan-zoom", "[pyramid]" ) {
	auto root = scratch("scan");

	writeTile(tilePath(root, TileCoordinate{3,5,2}, TileFormat::PNG), solid({1,2,3,255}), TileFormat::PNG);
	writeTile(tilePath(root, TileCoordinate{3,1,7}, TileFormat::PNG), solid({1,2,3,255}), TileFormat::PNG);

	// Leftovers of an interrupted write, foreign files, out-of-range indices.
	fs::create_directories(root + "/3/2");
	{ std::ofstream(root + "/3/2/6.png.partial") << "x"; }
	{ std::ofstream(root + "/3/2/notes.txt") << "x"; }
	fs::create_directories(root + "/3/9");
	{ std::ofstream(root + "/3/9/0.png") << "x"; }

	auto tiles = scanZoom(root, 3, TileFormat::PNG);
	REQUIRE(tiles.size() == 2);
	REQUIRE(tiles[0] == TileCoordinate{3,1,7});
	REQUIRE(tiles[1] == TileCoordinate{3,5,2});

	REQUIRE(scanZoom(root, 4, TileFormat::PNG).empty());
	REQUIRE(scanZoom(root, 3, TileFormat::WEBP).empty());
}

TEST_CASE( "overview-zoom", "[pyramid]" ) {
	auto root = scratch("zoom");
	Log log { true };

	for (uint64_t y=0; y<4; y++)
		for (uint64_t x=0; x<4; x++)
			writeTile(tilePath(root, TileCoordinate{2,y,x}, TileFormat::PNG), solid({9,9,9,255}), TileFormat::PNG);

	auto c1 = buildOverviewZoom(root, 1, TileFormat::PNG, log);
	REQUIRE(c1.written == 4);
	REQUIRE(c1.failed == 0);

	auto c0 = buildOverviewZoom(root, 0, TileFormat::PNG, log);
	REQUIRE(c0.written == 1);

	// A child that cannot be decoded fails its parent only.
	auto root2 = scratch("zoom_bad");
	writeTile(tilePath(root2, TileCoordinate{1,0,0}, TileFormat::PNG), solid({9,9,9,255}), TileFormat::PNG);
	fs::create_directories(root2 + "/1/1");
	{ std::ofstream(root2 + "/1/1/1.png") << "not a png"; }
	auto bad = buildOverviewZoom(root2, 0, TileFormat::PNG, log);
	REQUIRE(bad.failed == 1);
	REQUIRE(bad.written == 0);
}

TEST_CASE( "render-base-tile", "[pyramid]" ) {
	auto r = memQuadrant(false);

	// The raster is exactly tile (1, 0, 0).
	cv::Mat full = renderBaseTile(r, TileCoordinate{1,0,0}, GRIORA_NearestNeighbour);
	REQUIRE(pixelIs(full,   0,   0, {30,20,10,255}));
	REQUIRE(pixelIs(full, 255, 255, {30,20,10,255}));

	cv::Mat outside = renderBaseTile(r, TileCoordinate{1,1,1}, GRIORA_NearestNeighbour);
	REQUIRE(isTransparent(outside));

	// At zoom 0 only the north-west quarter is covered.
	cv::Mat world = renderBaseTile(r, TileCoordinate{0,0,0}, GRIORA_Bilinear);
	REQUIRE(pixelIs(world, 64, 64, {30,20,10,255}));
	REQUIRE(world.at<cv::Vec4b>(64, 192)[3] == 0);
	REQUIRE(world.at<cv::Vec4b>(192, 64)[3] == 0);
	REQUIRE(world.at<cv::Vec4b>(192, 192)[3] == 0);

	// Alpha comes from the raster when it has one.
	auto ra = memQuadrant(true);
	REQUIRE(ra.get()->GetRasterBand(4)->Fill(0) == CE_None);
	REQUIRE(isTransparent(renderBaseTile(ra, TileCoordinate{1,0,0}, GRIORA_NearestNeighbour)));
}

TEST_CASE( "render-base-tile-across-antimeridian", "[pyramid]" ) {
	// Half a world wide, starting halfway into tile (1, 0, 1) and running one quarter past the map edge.
	auto r = memQuadrant(false);
	RowMatrix23d A;
	A << WebMercatorMapScale / TileSize, 0, WebMercatorMapScale / 2,
	     0, -WebMercatorMapScale / TileSize, WebMercatorMapScale;
	r.setGeoTransform(A);

	cv::Mat east = renderBaseTile(r, TileCoordinate{1,0,1}, GRIORA_NearestNeighbour);
	REQUIRE(east.at<cv::Vec4b>(10, 10)[3] == 0);
	REQUIRE(pixelIs(east, 10, 200, {30,20,10,255}));

	// The overhang shows up on the western edge of the map.
	cv::Mat west = renderBaseTile(r, TileCoordinate{1,0,0}, GRIORA_NearestNeighbour);
	REQUIRE(pixelIs(west, 10, 10, {30,20,10,255}));
	REQUIRE(pixelIs(west, 200, 120, {30,20,10,255}));
	REQUIRE(west.at<cv::Vec4b>(10, 200)[3] == 0);

	REQUIRE(isTransparent(renderBaseTile(r, TileCoordinate{1,1,0}, GRIORA_NearestNeighbour)));
}

TEST_CASE( "base-tile-writer", "[pyramid]" ) {
	auto dir = scratch("base");
	std::string src = dir + "/_quadrant.tif";
	{
		gdalInit();
		auto drv = GetGDALDriverManager()->GetDriverByName("GTiff");
		CPLStringList opts;
		opts.SetNameValue("PHOTOMETRIC", "RGB");
		opts.SetNameValue("ALPHA", "YES");
		RasterSource r(drv->Create(src.c_str(), TileSize, TileSize, 4, GDT_Byte, opts.List()), src);
		fillQuadrant(r, true);
	}

	std::map<int, std::vector<TileCoordinate>> tiles;
	tiles[0] = { TileCoordinate{0,0,0} };
	for (uint64_t y=0; y<2; y++)
		for (uint64_t x=0; x<2; x++) tiles[1].push_back(TileCoordinate{1,y,x});
	TileManifest manifest(0, 1, std::move(tiles));

	PyramidConfig cfg;
	cfg.outRoot = dir + "/tiles";
	cfg.vrts = { { 0, src }, { 1, src } };

	Log log { true };
	std::map<int, ZoomCounters> counts;
	{
		BaseTileWriter writer(cfg, 2);
		counts = writer.run(manifest, log);
	}

	REQUIRE(counts[0].written == 1);
	REQUIRE(counts[1].written == 1);
	REQUIRE(counts[1].transparent == 3);
	REQUIRE(counts[1].failed == 0);
	REQUIRE(fs::exists(tilePath(cfg.outRoot, TileCoordinate{1,0,0}, TileFormat::PNG)));
	REQUIRE(!fs::exists(tilePath(cfg.outRoot, TileCoordinate{1,1,1}, TileFormat::PNG)));

	// Re-running touches nothing.
	{
		BaseTileWriter writer(cfg, 2);
		counts = writer.run(manifest, log);
	}
	REQUIRE(counts[0].existing == 1);
	REQUIRE(counts[1].existing == 1);
	REQUIRE(counts[1].transparent == 3);
	REQUIRE(counts[1].written == 0);
}
