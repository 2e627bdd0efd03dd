#pragma once

#include "chartiles/coordinates.h"
#include "chartiles/detail/log.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chartiles {

// What the manifest needs to know about one tileset member.
struct ManifestInput {
	std::string name;
	int maxLod = 12;
	// Absent when the reprojected raster could not be read.
	std::optional<GeoBox> bounds;
};

//
// Per-zoom sorted, duplicate-free tile sets of one tileset.
// Tiles are stored as packed TileCoordinates, so each zoom is ordered by (y, x).
//
class TileManifest {
	public:
		TileManifest(int zoomMin, int zoomMax, std::map<int, std::vector<TileCoordinate>>&& tiles);

		bool contains(int z, uint32_t x, uint32_t y) const;
		uint64_t count(int z) const;
		uint64_t total() const;

		// Empty for zooms without tiles.
		const std::vector<TileCoordinate>& tiles(int z) const;

		// Zooms holding at least one tile, ascending.
		std::vector<int> zooms() const;

		inline int zoomMin() const { return zoomMin_; }
		inline int zoomMax() const { return zoomMax_; }

	private:
		int zoomMin_, zoomMax_;
		std::map<int, std::vector<TileCoordinate>> tiles_;
};

//
// A member contributes to zoom Z iff its max_lod >= Z. Members without bounds are skipped with a warning.
// Covers [zoomMin, zoomMax].
//
TileManifest buildManifest(const std::vector<ManifestInput>& inputs, int zoomMin, int zoomMax, const Log& log);

// One range, or two when the box crosses the antimeridian.
std::vector<TileRange> tileRangesForBox(const GeoBox& box, int z);

// Geographic box of a Web Mercator extent. x beyond the map edge wraps, giving minLon > maxLon.
GeoBox geoBoxOfWebMercator(double minx, double miny, double maxx, double maxy);

// Bounds of a reprojected raster, or nothing if it cannot be opened.
std::optional<GeoBox> readRasterBounds(const std::string& path);

// "  zoom  z: N tiles" per zoom, then "  total: N tiles".
std::string manifestSummary(const TileManifest& m);

}
