#pragma once

#include "codec.h"
#include "chartiles/tpool/tpool.h"
#include "chartiles/gdal/raster.h"
#include "chartiles/manifest/manifest.h"
#include "chartiles/detail/log.hpp"

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace chartiles {

enum class TileOutcome {
	Written,
	SkippedTransparent,
	SkippedExisting
};

struct ZoomCounters {
	uint64_t written = 0;
	uint64_t transparent = 0;
	uint64_t existing = 0;
	uint64_t failed = 0;

	inline void add(TileOutcome o) {
		if (o == TileOutcome::Written) written++;
		else if (o == TileOutcome::SkippedTransparent) transparent++;
		else existing++;
	}
	inline ZoomCounters& operator+=(const ZoomCounters& o) {
		written += o.written; transparent += o.transparent; existing += o.existing; failed += o.failed;
		return *this;
	}
};

struct PyramidConfig {
	// `<out>/<tile_path>`
	std::string outRoot;
	TileFormat format = TileFormat::PNG;
	GDALRIOResampleAlg resampling = GRIORA_Bilinear;

	// Mosaic declaration of each zoom. Zooms without one are not cut.
	std::map<int, std::string> vrts;
};

//
// Cuts base tiles straight from the per-zoom mosaics.
// One key per tile, over all zooms at once. Each worker opens its own handle to each zoom's VRT on first use.
//
class BaseTileWriter : public ThreadPool {
	public:
		BaseTileWriter(const PyramidConfig& cfg, int threads);
		virtual ~BaseTileWriter();

		// Cut every manifest tile whose zoom has a mosaic. Blocks until done. Call once.
		std::map<int, ZoomCounters> run(const TileManifest& manifest, const Log& log);

	public:
		virtual void process(int workerId, const Key& key) override;
		virtual void* createWorkerData(int workerId) override;
		virtual void destroyWorkerData(int workerId, void* ptr) override;

	private:
		PyramidConfig cfg;

		struct AtomicCounters {
			std::atomic<uint64_t> written { 0 };
			std::atomic<uint64_t> transparent { 0 };
			std::atomic<uint64_t> existing { 0 };
		};
		std::array<AtomicCounters, MAX_LVLS> counters;
};

//
// Sample the Web Mercator extent of `tc` from a north-up raster into a TileSize x TileSize BGRA image.
// Parts of the tile outside the raster stay transparent. Without an alpha band the covered part is opaque.
//
cv::Mat renderBaseTile(RasterSource& src, const TileCoordinate& tc, GDALRIOResampleAlg alg);

//
// Join four child tiles into a parent. Children are named by position in y-up order:
//   a: (2*yUp,   2x)    bottom-left
//   b: (2*yUp+1, 2x)    top-left
//   c: (2*yUp,   2x+1)  bottom-right
//   d: (2*yUp+1, 2x+1)  top-right
// Empty Mats are transparent. The result is area-downsampled to TileSize.
//
cv::Mat composeParent(const cv::Mat& a, const cv::Mat& b, const cv::Mat& c, const cv::Mat& d);

// Build one overview tile from the children on disk.
TileOutcome buildOverviewTile(const std::string& root, const TileCoordinate& parent, TileFormat f);

// Tiles present on disk at zoom z.
std::vector<TileCoordinate> scanZoom(const std::string& root, int z, TileFormat f);

// All parents of the tiles on disk at z+1. Failures are counted, not thrown.
ZoomCounters buildOverviewZoom(const std::string& root, int z, TileFormat f, const Log& log);

}
