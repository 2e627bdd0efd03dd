#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "reprojector.h"
#include "chartiles/errors.h"

#include <cmath>
#include <filesystem>

using namespace chartiles;
namespace fs = std::filesystem;

namespace {
	constexpr double Res = 1000;
	constexpr double Top = 100000;

	std::string scratch(const std::string& name) {
		auto d = fs::temp_directory_path() / fmt::format("chartiles_test_reproject_{}", name);
		fs::remove_all(d);
		fs::create_directories(d / "tmp");
		return d.string();
	}

	//
	// 100x100 GeoTIFF in 3857, 1 km pixels, top-left at (0, Top).
	// Paletted sources are one band of index 1 mapped to (200, 100, 50). Others are three bands of (10, 20, 30).
	//
	void makeSource(const std::string& path, bool withSrs, bool paletted) {
		gdalInit();
		auto drv = GetGDALDriverManager()->GetDriverByName("GTiff");
		REQUIRE(drv != nullptr);
		RasterSource r(drv->Create(path.c_str(), 100, 100, paletted ? 1 : 3, GDT_Byte, nullptr), path);

		RowMatrix23d A;
		A << Res, 0, 0,
		     0, -Res, Top;
		r.setGeoTransform(A);
		if (withSrs) {
			auto srs = webMercator();
			REQUIRE(r.get()->SetSpatialRef(&srs) == CE_None);
		}

		if (paletted) {
			GDALColorTable table;
			GDALColorEntry black { 0, 0, 0, 255 };
			GDALColorEntry orange { 200, 100, 50, 255 };
			table.SetColorEntry(0, &black);
			table.SetColorEntry(1, &orange);
			auto band = r.get()->GetRasterBand(1);
			REQUIRE(band->SetColorTable(&table) == CE_None);
			REQUIRE(band->Fill(1) == CE_None);
		} else {
			const int rgb[3] = { 10, 20, 30 };
			for (int b=1; b<=3; b++) REQUIRE(r.get()->GetRasterBand(b)->Fill(rgb[b-1]) == CE_None);
		}
	}

	// Value of `band` at the projected point (x, y).
	int valueAt(RasterSource& r, int band, double x, double y) {
		Eigen::Vector2d p = r.prj2pix() * Eigen::Vector3d{x, y, 1.};
		int px = static_cast<int>(std::floor(p(0)));
		int py = static_cast<int>(std::floor(p(1)));
		REQUIRE(px >= 0);
		REQUIRE(py >= 0);
		REQUIRE(px < r.width());
		REQUIRE(py < r.height());
		uint8_t v = 0;
		REQUIRE(r.get()->GetRasterBand(band)->RasterIO(GF_Read, px, py, 1, 1, &v, 1, 1, GDT_Byte, 0, 0) == CE_None);
		return v;
	}

	// Projected center of source pixel (col, row).
	double xOf(double col) { return (col + .5) * Res; }
	double yOf(double row) { return Top - (row + .5) * Res; }

	ReprojectOptions optionsFor(const std::string& dir) {
		ReprojectOptions o;
		o.sourceDir  = dir;
		o.scratchDir = dir + "/tmp";
		o.resampling = "nearest";
		o.resolution = Res;
		return o;
	}
}

TEST_CASE( "reproject-masked-window", "[reproject]" ) {
	auto dir = scratch("mask");
	makeSource(dir + "/chart.tif", true, false);

	DatasetDescriptor d;
	d.name = "Inset";
	d.inputFile = "chart.tif";
	d.window = PixelWindow { 20, 30, 40, 40 };
	// Full-source pixels: columns 30..50, rows 40..60.
	d.mask = { { {30,40}, {50,40}, {50,60}, {30,60}, {30,40} } };

	PaletteCache palettes(dir + "/tmp");
	Log log { true };
	auto r = reprojectDataset(d, optionsFor(dir), palettes, log);

	REQUIRE(r.dataset == "Inset");
	REQUIRE(r.path == d.scratchFile(dir + "/tmp"));
	REQUIRE(fs::exists(r.path));
	REQUIRE(!r.target.unwrapped);

	RasterSource out(r.path);
	REQUIRE(out.bandCount() == 4);
	REQUIRE(out.hasAlpha());

	// Only the window was warped.
	REQUIRE(out.boundsPrj().min()(0) >= xOf(20) - Res);
	REQUIRE(out.boundsPrj().max()(0) <= xOf(60) + Res);
	REQUIRE(out.boundsPrj().max()(1) <= yOf(30) + Res);

	// Inside the mask.
	REQUIRE(valueAt(out, 4, xOf(40), yOf(50)) == 255);
	REQUIRE(valueAt(out, 1, xOf(40), yOf(50)) == 10);
	REQUIRE(valueAt(out, 3, xOf(40), yOf(50)) == 30);

	// In the window but outside the mask, on both sides.
	REQUIRE(valueAt(out, 4, xOf(25), yOf(35)) == 0);
	REQUIRE(valueAt(out, 4, xOf(55), yOf(65)) == 0);

	// Same dataset without a mask is opaque everywhere.
	d.name = "Inset Full";
	d.mask.clear();
	auto full = reprojectDataset(d, optionsFor(dir), palettes, log);
	RasterSource fullOut(full.path);
	REQUIRE(valueAt(fullOut, 4, xOf(25), yOf(35)) == 255);
	REQUIRE(valueAt(fullOut, 4, xOf(55), yOf(65)) == 255);
}

TEST_CASE( "reproject-palette-expanded-once", "[reproject]" ) {
	auto dir = scratch("palette");
	makeSource(dir + "/chart.tif", true, true);

	PaletteCache palettes(dir + "/tmp");
	Log log { true };

	DatasetDescriptor a;
	a.name = "North";
	a.inputFile = "chart.tif";
	a.window = PixelWindow { 0, 0, 100, 50 };
	DatasetDescriptor b = a;
	b.name = "South";
	b.window = PixelWindow { 0, 50, 100, 50 };

	auto ra = reprojectDataset(a, optionsFor(dir), palettes, log);
	std::string artifact = palettes.artifactPath(dir + "/chart.tif");
	REQUIRE(fs::exists(artifact));
	auto stamp = fs::last_write_time(artifact);

	auto rb = reprojectDataset(b, optionsFor(dir), palettes, log);
	REQUIRE(fs::last_write_time(artifact) == stamp);
	REQUIRE(palettes.expanded(dir + "/chart.tif") == artifact);

	// Expanded colors, not indices.
	RasterSource outA(ra.path), outB(rb.path);
	REQUIRE(valueAt(outA, 1, xOf(50), yOf(25)) == 200);
	REQUIRE(valueAt(outA, 2, xOf(50), yOf(25)) == 100);
	REQUIRE(valueAt(outB, 3, xOf(50), yOf(75)) == 50);
	REQUIRE(valueAt(outB, 4, xOf(50), yOf(75)) == 255);

	// A fresh cache picks up the artifact left on disk.
	PaletteCache again(dir + "/tmp");
	REQUIRE(again.expanded(dir + "/chart.tif") == artifact);
	REQUIRE(fs::last_write_time(artifact) == stamp);
}

TEST_CASE( "reproject-failures", "[reproject]" ) {
	auto dir = scratch("failures");
	makeSource(dir + "/nosrs.tif", false, false);
	makeSource(dir + "/chart.tif", true, false);

	PaletteCache palettes(dir + "/tmp");
	Log log { true };
	auto opts = optionsFor(dir);

	DatasetDescriptor d;
	d.name = "Bad";
	d.inputFile = "nosrs.tif";
	REQUIRE_THROWS_AS(reprojectDataset(d, opts, palettes, log), DatasetError);

	d.inputFile = "missing.tif";
	REQUIRE_THROWS_AS(reprojectDataset(d, opts, palettes, log), DatasetError);

	// Runs past the right edge.
	d.inputFile = "chart.tif";
	d.window = PixelWindow { 90, 0, 20, 20 };
	REQUIRE_THROWS_AS(reprojectDataset(d, opts, palettes, log), DatasetError);

	// Open ring.
	d.window.reset();
	d.mask = { { {0,0}, {10,0}, {10,10}, {0,10} } };
	REQUIRE_THROWS_AS(reprojectDataset(d, opts, palettes, log), DatasetError);

	REQUIRE(!fs::exists(d.scratchFile(opts.scratchDir)));
}
