#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "descriptors.h"
#include "chartiles/errors.h"

using namespace chartiles;

namespace {
	const char* sectionalYaml = R"(
datasets:
  Seattle SEC:
    zip_file: Seattle
    window: [100, 200, 3000, 2000]
    mask:
      - [[0, 0], [10, 0], [10, 10], [0, 0]]
    geobound: [-125, null, -117, 49]
    max_lod: 11
  Seattle TAC:
    input_file: Seattle TAC.tif
    gcps: [[0, 0, -123, 48], [100, 0, -122, 48], [0, 100, -123, 47]]
    max_lod: 12
  Western Aleutian Islands WAC:
    antimeridian: true
    max_lod: 8
  Bare:
tilesets:
  VFR Sectional Charts:
    tile_path: sec
    zoom: [0, 11]
    datasets: [Seattle SEC]
  VFR Terminal Area Charts:
    tile_path: tac
    maxlod_zoom: 13
    datasets: [Seattle SEC, Seattle TAC, Western Aleutian Islands WAC]
)";
}

TEST_CASE( "catalog-load", "[config]" ) {
	fmt::print(" - Running catalog-load test.\n");

	auto c = Catalog::fromString(sectionalYaml);
	REQUIRE(c.datasetCount() == 4);
	REQUIRE(c.tilesetNames().size() == 2);

	const auto& sec = c.dataset("Seattle SEC");
	REQUIRE(sec.window.has_value());
	REQUIRE(sec.window->x == 100);
	REQUIRE(sec.window->h == 2000);
	REQUIRE(sec.mask.size() == 1);
	REQUIRE(sec.mask[0].size() == 4);
	REQUIRE(sec.geobound.has_value());
	REQUIRE(sec.geobound->minLon.has_value());
	REQUIRE(!sec.geobound->minLat.has_value());
	REQUIRE(*sec.geobound->maxLat == 49);
	REQUIRE(sec.maxLod == 11);
	REQUIRE(!sec.antimeridian);

	const auto& tac = c.dataset("Seattle TAC");
	REQUIRE(tac.gcps.size() == 3);
	REQUIRE(tac.gcps[1].lon == -122);
	REQUIRE(!tac.window.has_value());

	REQUIRE(c.dataset("Western Aleutian Islands WAC").antimeridian);

	// Defaults.
	const auto& bare = c.dataset("Bare");
	REQUIRE(bare.maxLod == 12);
	REQUIRE(bare.inputFile == "Bare.tif");
	REQUIRE(!bare.zipFile.has_value());
}

TEST_CASE( "catalog-paths", "[config]" ) {
	auto c = Catalog::fromString(sectionalYaml);

	REQUIRE(c.dataset("Seattle SEC").sourcePath("/charts") == "/vsizip//charts/Seattle.zip/Seattle SEC.tif");
	REQUIRE(c.dataset("Seattle TAC").sourcePath("/charts") == "/charts/Seattle TAC.tif");
	REQUIRE(c.dataset("Seattle SEC").scratchFile("/tmp/x") == "/tmp/x/_Seattle_SEC.tif");
}

TEST_CASE( "catalog-tileset-lookup", "[config]" ) {
	auto c = Catalog::fromString(sectionalYaml);

	REQUIRE(c.tileset("sec").name == "VFR Sectional Charts");
	REQUIRE(c.tileset("VFR Terminal Area Charts").tilePath == "tac");
	REQUIRE(c.haveTileset("tac"));
	REQUIRE(!c.haveTileset("hel"));
	REQUIRE_THROWS_AS(c.tileset("hel"), ConfigError);

	const auto& tac = c.tileset("tac");
	REQUIRE(c.maxLod(tac) == 12);
	REQUIRE(c.maxlodZoom(tac) == 13);
	auto zr = c.zoomRange(tac);
	REQUIRE(zr[0] == 0);
	REQUIRE(zr[1] == 12);

	const auto& sec = c.tileset("sec");
	REQUIRE(c.maxlodZoom(sec) == 11);
	zr = c.zoomRange(sec);
	REQUIRE(zr[0] == 0);
	REQUIRE(zr[1] == 11);
}

TEST_CASE( "catalog-rejects", "[config]" ) {
	// Unknown member.
	REQUIRE_THROWS_AS(Catalog::fromString(R"(
datasets:
  A: {}
tilesets:
  t:
    datasets: [A, B]
)"), ConfigError);

	// Unknown key.
	REQUIRE_THROWS_AS(Catalog::fromString(R"(
datasets:
  A:
    max_lood: 3
tilesets:
  t:
    datasets: [A]
)"), ConfigError);

	// Malformed window.
	REQUIRE_THROWS_AS(Catalog::fromString(R"(
datasets:
  A:
    window: [1, 2, 3]
tilesets:
  t:
    datasets: [A]
)"), ConfigError);

	// Deeper than the pyramid goes.
	REQUIRE_THROWS_AS(Catalog::fromString(R"(
datasets:
  A:
    max_lod: 26
tilesets:
  t:
    datasets: [A]
)"), ConfigError);
	REQUIRE_THROWS_AS(Catalog::fromString(R"(
datasets:
  A: {}
tilesets:
  t:
    zoom: [0, 26]
    datasets: [A]
)"), ConfigError);
	REQUIRE_THROWS_AS(Catalog::fromString(R"(
datasets:
  A: {}
tilesets:
  t:
    maxlod_zoom: 29
    datasets: [A]
)"), ConfigError);
	REQUIRE_NOTHROW(Catalog::fromString(R"(
datasets:
  A:
    max_lod: 25
tilesets:
  t:
    zoom: [0, 25]
    maxlod_zoom: 25
    datasets: [A]
)"));

	// Not yaml at all.
	REQUIRE_THROWS_AS(Catalog::fromString("datasets: [unclosed"), ConfigError);

	REQUIRE_THROWS_AS(Catalog::load("/nonexistent/charts.yaml"), ConfigError);
}
