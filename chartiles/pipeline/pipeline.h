#pragma once

#include "chartiles/config/descriptors.h"
#include "chartiles/pyramid/writer.h"
#include "chartiles/detail/log.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chartiles {

struct PipelineOptions {
	// Archives and rasters named by the descriptors.
	std::string sourceDir;
	std::string scratchDir = "/tmp/chartiles";
	// Tile tree root. When empty nothing is cut, only reprojected.
	std::string outDir;

	TileFormat format = TileFormat::PNG;
	std::string reprojectResampling = "bilinear";
	std::string tileResampling = "bilinear";

	// Concurrent dataset reprojections. 0 picks min(4, cpus).
	int jobs = 0;
	// Base tile workers. 0 picks cpus.
	int tileWorkers = 0;

	// Skip reprojection and use whatever is in the scratch directory.
	bool tileOnly = false;

	std::optional<int> zoomMin, zoomMax;
};

struct BuildReport {
	std::string tileset;
	int zoomMin = 0, zoomMax = 0;

	std::vector<std::string> reprojected;
	// dataset -> error message
	std::map<std::string, std::string> failedDatasets;

	uint64_t tilesPlanned = 0;
	std::map<int, ZoomCounters> zooms;
	// zoom -> error message
	std::map<int, std::string> failedZooms;

	inline bool ok() const { return failedDatasets.empty() and failedZooms.empty(); }
};

//
// Runs the phases of a tileset build in order:
//     reproject datasets -> manifest -> per-zoom mosaics -> base tiles -> overviews.
//
// A failed dataset or zoom is recorded in the report and the rest of the build goes on.
// Only a bad catalog entry, bad options or an unwritable directory throw.
//
class Pipeline {
	public:
		Pipeline(const Catalog& catalog, const PipelineOptions& opts, const Log& log);

		BuildReport build(const std::string& tileset, int zoomMin, int zoomMax);

		// Zoom range a build of `tileset` uses: the descriptor's, with the option overrides applied.
		std::array<int,2> zoomRange(const std::string& tileset) const;

		// `name (tile_path, zoom a-b)` for every tileset, in file order.
		std::vector<std::string> listTilesets() const;

		// Tile counts of the tileset's manifest, from the reprojected rasters already in the scratch directory.
		std::string manifestSummary(const std::string& tileset) const;

		// Removes the scratch directory.
		void cleanup() const;

	private:
		const Catalog& catalog;
		PipelineOptions opts;
		Log log;

		int jobs_, tileWorkers_;

		void reprojectAll(const TilesetDescriptor& ts, BuildReport& report);
		void cutTiles(const TilesetDescriptor& ts, const TileManifest& manifest, BuildReport& report);
		TileManifest planTiles(const TilesetDescriptor& ts, int zoomMin, int zoomMax) const;
};

// Prints the per-phase summary of one build.
void printReport(const BuildReport& r, const Log& log);

}
