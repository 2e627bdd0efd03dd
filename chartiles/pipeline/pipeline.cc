#include "pipeline.h"

#include "chartiles/errors.h"
#include "chartiles/tpool/tpool.h"
#include "chartiles/reproject/reprojector.h"
#include "chartiles/manifest/manifest.h"
#include "chartiles/mosaic/stack.h"

#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>

#include <unistd.h>

namespace fs = std::filesystem;

namespace chartiles {

namespace {

	int cpuCount() {
		return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
	}

	// Creates `dir` if needed. Throws BadFileError if it cannot be written to.
	void ensureWritableDir(const std::string& dir) {
		std::error_code ec;
		fs::create_directories(dir, ec);
		if (ec) throw BadFileError(dir, ec.value());
		if (access(dir.c_str(), W_OK) != 0) throw BadFileError(dir, errno);
	}

	//
	// One key per dataset, the index into `datasets`.
	// DatasetErrors are recorded per dataset. Anything else is left to the pool's error capture.
	//
	class ReprojectWorker : public ThreadPool {
		public:
			ReprojectWorker(int jobs, const std::vector<const DatasetDescriptor*>& datasets,
					const ReprojectOptions& ropts, PaletteCache& palettes, const Log& log)
				: ThreadPool(jobs), datasets(datasets), ropts(ropts), palettes(palettes), log(log) {}

			inline ~ReprojectWorker() {
				stop();
			}

			virtual void process(int workerId, const Key& key) override {
				const DatasetDescriptor& d = *datasets[key];
				log.info(" - [{}] reprojecting (worker {})\n", d.name, workerId);

				try {
					auto res = reprojectDataset(d, ropts, palettes, log);
					log.good(" - [{}] done: {}x{} px at {:.3f} m/px\n", d.name, res.target.width, res.target.height, res.target.res);

					std::lock_guard<std::mutex> lck(resultMtx);
					done.push_back(d.name);
				} catch (const DatasetError& e) {
					log.error(" - [{}] failed: {}\n", d.name, e.what());

					// A raster from an earlier run must not stand in for this one.
					std::error_code ec;
					fs::remove(d.scratchFile(ropts.scratchDir), ec);

					std::lock_guard<std::mutex> lck(resultMtx);
					failed[d.name] = e.what();
				}
			}

			virtual void* createWorkerData(int workerId) override { return nullptr; }
			virtual void destroyWorkerData(int workerId, void* ptr) override {}

			std::vector<std::string> done;
			std::map<std::string, std::string> failed;

		private:
			const std::vector<const DatasetDescriptor*>& datasets;
			const ReprojectOptions& ropts;
			PaletteCache& palettes;
			const Log& log;

			std::mutex resultMtx;
	};

}

Pipeline::Pipeline(const Catalog& catalog, const PipelineOptions& opts, const Log& log)
	: catalog(catalog), opts(opts), log(log) {

	if (!isResamplingName(opts.reprojectResampling))
		throw ConfigError(fmt::format("unknown reprojection resampling '{}'", opts.reprojectResampling));
	if (!isResamplingName(opts.tileResampling))
		throw ConfigError(fmt::format("unknown tile resampling '{}'", opts.tileResampling));
	if (opts.jobs < 0 or opts.tileWorkers < 0)
		throw ConfigError("jobs and tile workers must not be negative");

	int cpus = cpuCount();
	jobs_        = opts.jobs > 0 ? opts.jobs : std::min(4, cpus);
	tileWorkers_ = opts.tileWorkers > 0 ? opts.tileWorkers : cpus;
}

std::array<int,2> Pipeline::zoomRange(const std::string& name) const {
	auto r = catalog.zoomRange(catalog.tileset(name));
	if (opts.zoomMin.has_value()) r[0] = *opts.zoomMin;
	if (opts.zoomMax.has_value()) r[1] = *opts.zoomMax;
	return r;
}

std::vector<std::string> Pipeline::listTilesets() const {
	std::vector<std::string> out;
	for (const auto& name : catalog.tilesetNames()) {
		const auto& ts = catalog.tileset(name);
		auto r = catalog.zoomRange(ts);
		out.push_back(fmt::format("{} ({}, zoom {}-{})", ts.name, ts.tilePath, r[0], r[1]));
	}
	return out;
}

std::string Pipeline::manifestSummary(const std::string& name) const {
	auto r = zoomRange(name);
	return chartiles::manifestSummary(planTiles(catalog.tileset(name), r[0], r[1]));
}

void Pipeline::cleanup() const {
	std::error_code ec;
	fs::remove_all(opts.scratchDir, ec);
	if (ec) log.warn(" - Could not remove '{}': {}\n", opts.scratchDir, ec.message());
	else log.info(" - Removed '{}'\n", opts.scratchDir);
}

TileManifest Pipeline::planTiles(const TilesetDescriptor& ts, int zoomMin, int zoomMax) const {
	std::vector<ManifestInput> inputs;
	for (const auto& name : ts.datasets) {
		const auto& d = catalog.dataset(name);
		inputs.push_back(ManifestInput{d.name, d.maxLod, readRasterBounds(d.scratchFile(opts.scratchDir))});
	}
	return buildManifest(inputs, zoomMin, zoomMax, log);
}

BuildReport Pipeline::build(const std::string& name, int zoomMin, int zoomMax) {
	const TilesetDescriptor& ts = catalog.tileset(name);
	if (zoomMin < 0 or zoomMax >= MAX_LVLS or zoomMin > zoomMax)
		throw ConfigError(fmt::format("bad zoom range {}-{} for tileset '{}'", zoomMin, zoomMax, ts.name));

	BuildReport report;
	report.tileset = ts.name;
	report.zoomMin = zoomMin;
	report.zoomMax = zoomMax;

	log.header(" - Tileset '{}' -> '{}', zooms {}-{}\n", ts.name, ts.tilePath, zoomMin, zoomMax);

	ensureWritableDir(opts.scratchDir);

	if (opts.tileOnly) log.info(" - Reusing reprojected rasters in '{}'\n", opts.scratchDir);
	else reprojectAll(ts, report);

	TileManifest manifest = planTiles(ts, zoomMin, zoomMax);
	report.tilesPlanned = manifest.total();
	log.info("{}", chartiles::manifestSummary(manifest));

	if (opts.outDir.empty()) {
		log.info(" - No output path, not cutting tiles\n");
		return report;
	}

	cutTiles(ts, manifest, report);
	return report;
}

void Pipeline::reprojectAll(const TilesetDescriptor& ts, BuildReport& report) {
	std::vector<const DatasetDescriptor*> datasets;
	for (const auto& name : ts.datasets) datasets.push_back(&catalog.dataset(name));

	ReprojectOptions ropts;
	ropts.sourceDir  = opts.sourceDir;
	ropts.scratchDir = opts.scratchDir;
	ropts.resampling = opts.reprojectResampling;
	ropts.numThreads = std::max(1, cpuCount() / jobs_);
	ropts.resolution = resolutionForZoom(catalog.maxlodZoom(ts));

	log.header(" - Reprojecting {} datasets, {} at a time, {} warp threads each, {:.3f} m/px\n",
			datasets.size(), jobs_, ropts.numThreads, *ropts.resolution);

	PaletteCache palettes(opts.scratchDir);
	ReprojectWorker worker(std::min<int>(jobs_, std::max<size_t>(1, datasets.size())), datasets, ropts, palettes, log);

	worker.start();
	for (size_t i=0; i<datasets.size(); i++) worker.enqueue(i);
	worker.blockUntilFinished();
	worker.stop();

	report.reprojected = worker.done;
	report.failedDatasets = worker.failed;

	if (worker.hadErrors()) {
		std::string first;
		try {
			worker.rethrowFirstError();
		} catch (const std::exception& e) {
			first = e.what();
		}
		for (auto key : worker.failedKeys()) {
			const auto& d = *datasets[key];
			log.error(" - [{}] failed: {}\n", d.name, first);
			report.failedDatasets[d.name] = first;
		}
	}

	std::sort(report.reprojected.begin(), report.reprojected.end());
}

void Pipeline::cutTiles(const TilesetDescriptor& ts, const TileManifest& manifest, BuildReport& report) {
	std::string root = (fs::path(opts.outDir) / ts.tilePath).string();
	ensureWritableDir(root);

	PyramidConfig cfg;
	cfg.outRoot    = root;
	cfg.format     = opts.format;
	cfg.resampling = rasterIoResampling(opts.tileResampling);

	std::vector<StackMember> candidates;
	for (const auto& name : ts.datasets) {
		const auto& d = catalog.dataset(name);
		candidates.push_back(StackMember{d.name, d.scratchFile(opts.scratchDir), d.maxLod});
	}

	// Zooms without a mosaic get no tiles at all, not even overviews of the zoom below.
	std::set<int> noMosaic;

	log.header(" - Mosaics\n");
	for (int z : manifest.zooms()) {
		try {
			MosaicStack stack = buildMosaicStack(ts.name, z, candidates, opts.scratchDir);
			cfg.vrts[z] = stack.vrtPath;
			log.info(" - z{}: {} rasters, top '{}'\n", z, stack.members.size(), stack.members.back().dataset);
		} catch (const ZoomLevelError& e) {
			log.error(" - z{}: {}\n", z, e.what());
			report.failedZooms[z] = e.what();
			noMosaic.insert(z);
		}
	}

	log.header(" - Base tiles\n");
	{
		BaseTileWriter writer(cfg, tileWorkers_);
		for (const auto& kv : writer.run(manifest, log)) {
			report.zooms[kv.first] += kv.second;
			if (kv.second.failed > 0)
				report.failedZooms.emplace(kv.first, fmt::format("{} base tiles failed", kv.second.failed));
		}
	}

	log.header(" - Overviews\n");
	for (int z = manifest.zoomMax() - 1; z >= manifest.zoomMin(); z--) {
		if (noMosaic.count(z)) {
			log.warn(" - z{}: skipped, no mosaic\n", z);
			continue;
		}
		ZoomCounters c = buildOverviewZoom(root, z, opts.format, log);
		report.zooms[z] += c;
		if (c.failed > 0)
			report.failedZooms.emplace(z, fmt::format("{} overview tiles failed", c.failed));
	}
}

void printReport(const BuildReport& r, const Log& log) {
	log.header(" - Summary of '{}'\n", r.tileset);
	log.info("   datasets: {} reprojected, {} failed\n", r.reprojected.size(), r.failedDatasets.size());
	for (const auto& kv : r.failedDatasets) log.error("   dataset '{}': {}\n", kv.first, kv.second);

	log.info("   tiles planned: {}\n", r.tilesPlanned);
	for (const auto& kv : r.zooms) {
		const auto& c = kv.second;
		log.info("   zoom {:2d}: {} written, {} transparent, {} existing, {} failed\n",
				kv.first, c.written, c.transparent, c.existing, c.failed);
	}
	for (const auto& kv : r.failedZooms) log.error("   zoom {}: {}\n", kv.first, kv.second);

	if (r.ok()) log.good(" - '{}' ok\n", r.tileset);
	else log.error(" - '{}' finished with failures\n", r.tileset);
}

}
