#include "manifest.h"

#include "chartiles/errors.h"
#include "chartiles/gdal/raster.h"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>

namespace chartiles {

namespace {
	const std::vector<TileCoordinate> noTiles;

	double wrapLon(double lon) {
		if (lon > 180.) return lon - 360.;
		if (lon < -180.) return lon + 360.;
		return lon;
	}
}

TileManifest::TileManifest(int zoomMin, int zoomMax, std::map<int, std::vector<TileCoordinate>>&& tiles)
	: zoomMin_(zoomMin), zoomMax_(zoomMax), tiles_(std::move(tiles)) {}

bool TileManifest::contains(int z, uint32_t x, uint32_t y) const {
	const auto& ts = tiles(z);
	return std::binary_search(ts.begin(), ts.end(), TileCoordinate{(uint64_t)z, y, x});
}

uint64_t TileManifest::count(int z) const {
	return tiles(z).size();
}

uint64_t TileManifest::total() const {
	uint64_t n = 0;
	for (const auto& kv : tiles_) n += kv.second.size();
	return n;
}

const std::vector<TileCoordinate>& TileManifest::tiles(int z) const {
	auto it = tiles_.find(z);
	if (it == tiles_.end()) return noTiles;
	return it->second;
}

std::vector<int> TileManifest::zooms() const {
	std::vector<int> out;
	for (const auto& kv : tiles_) {
		if (!kv.second.empty()) out.push_back(kv.first);
	}
	return out;
}

std::vector<TileRange> tileRangesForBox(const GeoBox& box, int z) {
	if (box.crossesAntimeridian()) {
		return {
			tileRangeForBox(GeoBox{box.minLon, box.minLat, 180., box.maxLat}, z),
			tileRangeForBox(GeoBox{-180., box.minLat, box.maxLon, box.maxLat}, z) };
	}
	return { tileRangeForBox(box, z) };
}

GeoBox geoBoxOfWebMercator(double minx, double miny, double maxx, double maxy) {
	return GeoBox {
		wrapLon(mercatorXToLon(minx)),
		mercatorYToLat(miny),
		wrapLon(mercatorXToLon(maxx)),
		mercatorYToLat(maxy) };
}

std::optional<GeoBox> readRasterBounds(const std::string& path) {
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) return {};
	try {
		RasterSource r(path);
		if (!r.haveGeoTransform()) return {};
		auto box = r.boundsPrj();
		return geoBoxOfWebMercator(box.min()(0), box.min()(1), box.max()(0), box.max()(1));
	} catch (const BadFileError&) {
		return {};
	}
}

TileManifest buildManifest(const std::vector<ManifestInput>& inputs, int zoomMin, int zoomMax, const Log& log) {
	for (const auto& in : inputs) {
		if (!in.bounds.has_value())
			log.warn(" - [buildManifest()] no reprojected raster for '{}', skipping it.\n", in.name);
	}

	std::map<int, std::vector<TileCoordinate>> tiles;
	for (int z=zoomMin; z<=zoomMax; z++) {
		std::vector<TileCoordinate> lvl;

		for (const auto& in : inputs) {
			if (!in.bounds.has_value() or in.maxLod < z) continue;

			for (const auto& r : tileRangesForBox(*in.bounds, z)) {
				for (uint64_t y=r.y0; y<=r.y1; y++)
				for (uint64_t x=r.x0; x<=r.x1; x++)
					lvl.push_back(TileCoordinate{(uint64_t)z, y, x});
			}
		}

		std::sort(lvl.begin(), lvl.end());
		lvl.erase(std::unique(lvl.begin(), lvl.end()), lvl.end());
		if (!lvl.empty()) tiles[z] = std::move(lvl);
	}

	return TileManifest(zoomMin, zoomMax, std::move(tiles));
}

std::string manifestSummary(const TileManifest& m) {
	std::string out;
	for (int z=m.zoomMin(); z<=m.zoomMax(); z++)
		out += fmt::format("  zoom {:2d}: {} tiles\n", z, m.count(z));
	out += fmt::format("  total: {} tiles\n", m.total());
	return out;
}

}
