#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "pipeline.h"
#include "chartiles/errors.h"
#include "chartiles/gdal/raster.h"
#include "chartiles/reproject/target.h"

#include <filesystem>

using namespace chartiles;
namespace fs = std::filesystem;

namespace {
	std::string scratch(const std::string& name) {
		auto d = fs::temp_directory_path() / fmt::format("chartiles_test_e2e_{}", name);
		fs::remove_all(d);
		fs::create_directories(d);
		return d.string();
	}

	// 200x200 RGB GeoTIFF in EPSG:4326 spanning lon/lat -10..10.
	void makeSquare(const std::string& path) {
		gdalInit();
		auto drv = GetGDALDriverManager()->GetDriverByName("GTiff");
		REQUIRE(drv != nullptr);
		CPLStringList opts;
		opts.SetNameValue("PHOTOMETRIC", "RGB");
		RasterSource r(drv->Create(path.c_str(), 200, 200, 3, GDT_Byte, opts.List()), path);

		RowMatrix23d A;
		A << .1, 0, -10,
		     0, -.1, 10;
		r.setGeoTransform(A);
		auto srs = wgs84();
		REQUIRE(r.get()->SetSpatialRef(&srs) == CE_None);

		const int rgb[3] = { 200, 100, 50 };
		for (int b=1; b<=3; b++) REQUIRE(r.get()->GetRasterBand(b)->Fill(rgb[b-1]) == CE_None);
	}

	// Replaces a reprojected RGBA raster by an RGB one over the same grid.
	void dropAlpha(const std::string& path) {
		std::string tmp = path + ".rgb.tif";
		{
			RasterSource four(path);
			auto drv = GetGDALDriverManager()->GetDriverByName("GTiff");
			RasterSource three(drv->Create(tmp.c_str(), four.width(), four.height(), 3, GDT_Byte, nullptr), tmp);
			three.setGeoTransform(four.pix2prj());
			auto srs = four.srs();
			REQUIRE(three.get()->SetSpatialRef(&srs) == CE_None);
			for (int b=1; b<=3; b++) REQUIRE(three.get()->GetRasterBand(b)->Fill(77) == CE_None);
		}
		fs::rename(tmp, path);
	}

	// 200x200 RGB GeoTIFF in a Mercator centered on lon 180, spanning about lon 178..-178 and lat -2..2.
	void makeDateline(const std::string& path) {
		gdalInit();
		auto drv = GetGDALDriverManager()->GetDriverByName("GTiff");
		REQUIRE(drv != nullptr);
		RasterSource r(drv->Create(path.c_str(), 200, 200, 3, GDT_Byte, nullptr), path);

		const double half = lonToMercatorX(2);
		RowMatrix23d A;
		A << half / 100, 0, -half,
		     0, -half / 100, half;
		r.setGeoTransform(A);
		auto srs = shiftedToAntimeridian(webMercator());
		REQUIRE(r.get()->SetSpatialRef(&srs) == CE_None);

		for (int b=1; b<=3; b++) REQUIRE(r.get()->GetRasterBand(b)->Fill(90) == CE_None);
	}

	const char* datelineYaml = R"(
datasets:
  East:
    input_file: dateline.tif
    antimeridian: true
    geobound: [null, null, 180, null]
    max_lod: 3
  West:
    input_file: dateline.tif
    antimeridian: true
    geobound: [-180, null, null, null]
    max_lod: 3
  Wide:
    input_file: square.tif
    max_lod: 3
  Narrow:
    input_file: square.tif
    max_lod: 2
tilesets:
  Dateline:
    tile_path: dateline
    zoom: [0, 3]
    datasets: [East, West]
  Mixed:
    tile_path: mixed
    zoom: [0, 3]
    datasets: [Wide, Narrow]
)";

	const char* squareYaml = R"(
datasets:
  Square:
    input_file: square.tif
    max_lod: 3
  Broken:
    input_file: square.tif
    mask:
      - [[0, 0], [10, 0], [10, 10]]
    max_lod: 3
tilesets:
  Squares:
    tile_path: squares
    zoom: [0, 3]
    datasets: [Square]
  With Broken:
    tile_path: broken
    zoom: [0, 1]
    datasets: [Square, Broken]
)";
}

TEST_CASE( "end-to-end", "[pipeline]" ) {
	fmt::print(" - Running end-to-end test.\n");

	auto dir = scratch("square");
	fs::create_directories(dir + "/src");
	makeSquare(dir + "/src/square.tif");

	auto catalog = Catalog::fromString(squareYaml);

	PipelineOptions opts;
	opts.sourceDir   = dir + "/src";
	opts.scratchDir  = dir + "/tmp";
	opts.outDir      = dir + "/out";
	opts.jobs        = 1;
	opts.tileWorkers = 2;

	Log log { true };
	Pipeline pipeline(catalog, opts, log);

	auto r = pipeline.build("Squares", 0, 3);
	REQUIRE(r.ok());
	REQUIRE(r.reprojected.size() == 1);
	REQUIRE(fs::exists(dir + "/tmp/_Square.tif"));
	REQUIRE(r.tilesPlanned == 13);

	const uint64_t expected[4] = { 1, 4, 4, 4 };
	for (int z=0; z<=3; z++) {
		REQUIRE(r.zooms[z].written == expected[z]);
		REQUIRE(r.zooms[z].transparent == 0);
		REQUIRE(r.zooms[z].failed == 0);
	}

	std::string root = dir + "/out/squares";
	REQUIRE(fs::exists(root + "/0/0/0.png"));
	REQUIRE(fs::exists(root + "/3/3/3.png"));
	REQUIRE(fs::exists(root + "/3/4/4.png"));
	REQUIRE(!fs::exists(root + "/3/2/3.png"));

	cv::Mat corner = readTile(root + "/3/4/4.png");
	REQUIRE(corner.at<cv::Vec4b>(0, 0)[3] == 255);
	REQUIRE(corner.at<cv::Vec4b>(255, 255)[3] == 0);

	// Same build again, by tile path: nothing is rewritten.
	auto again = pipeline.build("squares", 0, 3);
	REQUIRE(again.ok());
	for (int z=0; z<=3; z++) {
		REQUIRE(again.zooms[z].written == 0);
		REQUIRE(again.zooms[z].existing >= expected[z]);
	}
}

TEST_CASE( "pipeline-dataset-failure", "[pipeline]" ) {
	auto dir = scratch("broken");
	fs::create_directories(dir + "/src");
	makeSquare(dir + "/src/square.tif");

	auto catalog = Catalog::fromString(squareYaml);

	PipelineOptions opts;
	opts.sourceDir  = dir + "/src";
	opts.scratchDir = dir + "/tmp";
	opts.outDir     = dir + "/out";
	opts.jobs       = 2;

	Log log { true };
	Pipeline pipeline(catalog, opts, log);

	// The open mask ring fails one dataset, the other still gets tiled.
	auto r = pipeline.build("With Broken", 0, 1);
	REQUIRE(!r.ok());
	REQUIRE(r.failedDatasets.size() == 1);
	REQUIRE(r.failedDatasets.count("Broken") == 1);
	REQUIRE(r.reprojected.size() == 1);
	REQUIRE(r.failedZooms.empty());
	REQUIRE(r.zooms[0].written == 1);
	REQUIRE(r.zooms[1].written == 4);
}

TEST_CASE( "pipeline-queries", "[pipeline]" ) {
	auto dir = scratch("queries");
	auto catalog = Catalog::fromString(squareYaml);

	PipelineOptions opts;
	opts.scratchDir = dir + "/tmp";
	opts.zoomMax = 2;

	Log log { true };
	Pipeline pipeline(catalog, opts, log);

	auto names = pipeline.listTilesets();
	REQUIRE(names.size() == 2);
	REQUIRE(names[0] == "Squares (squares, zoom 0-3)");
	REQUIRE(names[1] == "With Broken (broken, zoom 0-1)");

	auto r = pipeline.zoomRange("Squares");
	REQUIRE(r[0] == 0);
	REQUIRE(r[1] == 2);

	// Nothing reprojected yet, so nothing planned.
	auto summary = pipeline.manifestSummary("Squares");
	REQUIRE(summary.find("  zoom  2: 0 tiles\n") != std::string::npos);
	REQUIRE(summary.find("  total: 0 tiles\n") != std::string::npos);

	REQUIRE_THROWS_AS(pipeline.build("Squares", 3, 1), ConfigError);
	REQUIRE_THROWS_AS(pipeline.build("Nope", 0, 1), ConfigError);

	PipelineOptions bad = opts;
	bad.tileResampling = "fancy";
	REQUIRE_THROWS_AS(Pipeline(catalog, bad, log), ConfigError);
}

TEST_CASE( "pipeline-antimeridian", "[pipeline]" ) {
	auto dir = scratch("dateline");
	fs::create_directories(dir + "/src");
	makeDateline(dir + "/src/dateline.tif");

	auto catalog = Catalog::fromString(datelineYaml);

	PipelineOptions opts;
	opts.sourceDir  = dir + "/src";
	opts.scratchDir = dir + "/tmp";
	opts.outDir     = dir + "/out";
	opts.jobs       = 2;

	Log log { true };
	Pipeline pipeline(catalog, opts, log);

	auto r = pipeline.build("Dateline", 0, 3);
	REQUIRE(r.ok());
	REQUIRE(r.reprojected.size() == 2);

	// The western half is on the map, at its western edge.
	RasterSource west(dir + "/tmp/_West.tif");
	REQUIRE(west.boundsPrj().max()(0) <= WebMercatorMapScale);
	REQUIRE(west.boundsPrj().max()(0) < lonToMercatorX(-170));

	// Both sides of the antimeridian get tiles.
	std::string root = dir + "/out/dateline";
	REQUIRE(fs::exists(root + "/3/7/3.png"));
	REQUIRE(fs::exists(root + "/3/0/3.png"));
	REQUIRE(fs::exists(root + "/3/0/4.png"));
	REQUIRE(fs::exists(root + "/0/0/0.png"));

	// The western tile is opaque near its western edge, at lon -179.
	cv::Mat w = readTile(root + "/3/0/3.png");
	REQUIRE(w.at<cv::Vec4b>(255, 2)[3] == 255);
	REQUIRE(w.at<cv::Vec4b>(255, 2)[0] == 90);
	REQUIRE(w.at<cv::Vec4b>(255, 200)[3] == 0);

	cv::Mat e = readTile(root + "/3/7/3.png");
	REQUIRE(e.at<cv::Vec4b>(255, 253)[3] == 255);
	REQUIRE(e.at<cv::Vec4b>(255, 50)[3] == 0);
}

TEST_CASE( "pipeline-zoom-without-mosaic", "[pipeline]" ) {
	auto dir = scratch("mixed");
	fs::create_directories(dir + "/src");
	makeSquare(dir + "/src/square.tif");

	auto catalog = Catalog::fromString(datelineYaml);
	Log log { true };

	// Reproject only.
	PipelineOptions opts;
	opts.sourceDir  = dir + "/src";
	opts.scratchDir = dir + "/tmp";
	{
		Pipeline first(catalog, opts, log);
		REQUIRE(first.build("Mixed", 0, 3).ok());
	}

	// Below zoom 3 both rasters are stacked, and they no longer agree on bands.
	dropAlpha(dir + "/tmp/_Narrow.tif");

	opts.outDir   = dir + "/out";
	opts.tileOnly = true;
	Pipeline pipeline(catalog, opts, log);
	auto r = pipeline.build("Mixed", 0, 3);

	REQUIRE(!r.ok());
	REQUIRE(r.failedDatasets.empty());
	REQUIRE(r.failedZooms.count(0) == 1);
	REQUIRE(r.failedZooms.count(1) == 1);
	REQUIRE(r.failedZooms.count(2) == 1);
	REQUIRE(r.failedZooms.count(3) == 0);
	REQUIRE(r.zooms[3].written == 4);

	// Failed zooms stay empty, overviews included.
	std::string root = dir + "/out/mixed";
	REQUIRE(fs::exists(root + "/3/3/3.png"));
	REQUIRE(!fs::exists(root + "/2"));
	REQUIRE(!fs::exists(root + "/1"));
	REQUIRE(!fs::exists(root + "/0"));
	REQUIRE(r.zooms[2].written == 0);
	REQUIRE(r.zooms[0].written == 0);
}
