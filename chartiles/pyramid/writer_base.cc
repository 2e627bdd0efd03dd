#include "writer.h"

#include <fmt/core.h>
#include <fmt/color.h>

#include <algorithm>
#include <cmath>
#include <filesystem>

namespace chartiles {

namespace {
	// Per-worker GDAL handles, one per zoom, opened on first use.
	struct WorkerVrts {
		std::map<int, std::unique_ptr<RasterSource>> byZoom;

		inline RasterSource& get(int z, const std::string& path) {
			auto& r = byZoom[z];
			if (!r) r = std::make_unique<RasterSource>(path);
			return *r;
		}
	};
}

BaseTileWriter::BaseTileWriter(const PyramidConfig& cfg, int threads)
	: ThreadPool(threads), cfg(cfg) {
}

BaseTileWriter::~BaseTileWriter() {
	stop();
}

void* BaseTileWriter::createWorkerData(int workerId) {
	return new WorkerVrts;
}
void BaseTileWriter::destroyWorkerData(int workerId, void *ptr) {
	auto vrts = static_cast<WorkerVrts*>(ptr);
	delete vrts;
}

std::map<int, ZoomCounters> BaseTileWriter::run(const TileManifest& manifest, const Log& log) {
	gdalInit();

	uint64_t total = 0;
	std::vector<int> zooms;
	for (int z : manifest.zooms()) {
		if (cfg.vrts.find(z) == cfg.vrts.end()) continue;
		zooms.push_back(z);
		total += manifest.count(z);
	}

	log.info(" - Cutting {} base tiles over {} zooms with {} workers\n", total, zooms.size(), getThreadCount());

	ThreadPool::start();
	for (int z : zooms)
		for (const auto& tc : manifest.tiles(z)) enqueue(tc.c);
	blockUntilFinished();
	stop();

	std::map<int, ZoomCounters> out;
	for (int z : zooms) {
		auto& c = out[z];
		c.written     = counters[z].written.load();
		c.transparent = counters[z].transparent.load();
		c.existing    = counters[z].existing.load();
	}

	auto failed = failedKeys();
	for (auto key : failed) out[TileCoordinate{key}.z()].failed++;

	if (!failed.empty()) {
		try {
			rethrowFirstError();
		} catch (const std::exception& e) {
			log.error(" - {} base tiles failed, first error: {}\n", failed.size(), e.what());
		}
	}

	return out;
}

void BaseTileWriter::process(int workerId, const Key& key) {
	auto vrts = static_cast<WorkerVrts*>(getWorkerData(workerId));

	TileCoordinate tc(key);
	int z = static_cast<int>(tc.z());

	std::string path = tilePath(cfg.outRoot, tc, cfg.format);
	std::error_code ec;
	if (std::filesystem::exists(path, ec)) {
		counters[z].existing++;
		return;
	}

	RasterSource& vrt = vrts->get(z, cfg.vrts.at(z));
	cv::Mat img = renderBaseTile(vrt, tc, cfg.resampling);

	if (isTransparent(img)) {
		counters[z].transparent++;
		return;
	}

	writeTile(path, img, cfg.format);
	counters[z].written++;
}

namespace {
	// Reads the part of `src` under the Web Mercator box `tlbr` into the matching part of `tile`.
	// Returns false if they do not meet.
	bool readTileBox(RasterSource& src, const double tlbr[4], cv::Mat& tile, GDALRIOResampleAlg alg) {
		// Fractional source pixels covered by the box.
		const RowMatrix23d& P = src.prj2pix();
		Eigen::Vector2d a = P * Eigen::Vector3d{tlbr[0], tlbr[3], 1.};
		Eigen::Vector2d b = P * Eigen::Vector3d{tlbr[2], tlbr[1], 1.};
		double fx0 = std::min(a(0), b(0)), fx1 = std::max(a(0), b(0));
		double fy0 = std::min(a(1), b(1)), fy1 = std::max(a(1), b(1));

		double cx0 = std::max(fx0, 0.), cx1 = std::min(fx1, (double)src.width());
		double cy0 = std::max(fy0, 0.), cy1 = std::min(fy1, (double)src.height());
		if (cx1 <= cx0 or cy1 <= cy0) return false;

		// Matching part of the canvas.
		double sx = TileSize / (fx1 - fx0);
		double sy = TileSize / (fy1 - fy0);
		int ox0 = std::clamp((int)std::lround((cx0 - fx0) * sx), 0, TileSize);
		int ox1 = std::clamp((int)std::lround((cx1 - fx0) * sx), 0, TileSize);
		int oy0 = std::clamp((int)std::lround((cy0 - fy0) * sy), 0, TileSize);
		int oy1 = std::clamp((int)std::lround((cy1 - fy0) * sy), 0, TileSize);
		if (ox1 <= ox0 or oy1 <= oy0) return false;

		cv::Mat roi = tile(cv::Rect{ox0, oy0, ox1-ox0, oy1-oy0});

		int n = src.bandCount();
		std::vector<int> bandMap;
		if (src.hasAlpha()) {
			if (n >= 4) bandMap = { 3, 2, 1, n };
			else        bandMap = { 1, 1, 1, n };
		} else {
			roi.setTo(cv::Scalar(0, 0, 0, 255));
			if (n >= 3) bandMap = { 3, 2, 1 };
			else        bandMap = { 1, 1, 1 };
		}

		src.readInto(roi, cx0, cy0, cx1 - cx0, cy1 - cy0, bandMap, alg);
		return true;
	}
}

cv::Mat renderBaseTile(RasterSource& src, const TileCoordinate& tc, GDALRIOResampleAlg alg) {
	cv::Mat tile = cv::Mat::zeros(TileSize, TileSize, CV_8UC4);

	double tlbr[4];
	tileBoundsWm(tlbr, tc);
	readTileBox(src, tlbr, tile, alg);

	// A raster unwrapped across the antimeridian continues east of the map edge.
	// That part is drawn over the tile one period to the west.
	const double period = 2 * WebMercatorMapScale;
	double east[4] = { tlbr[0] + period, tlbr[1], tlbr[2] + period, tlbr[3] };
	cv::Mat wrapped = cv::Mat::zeros(TileSize, TileSize, CV_8UC4);
	if (readTileBox(src, east, wrapped, alg)) {
		cv::Mat alpha;
		cv::extractChannel(wrapped, alpha, 3);
		wrapped.copyTo(tile, alpha);
	}

	return tile;
}

}
