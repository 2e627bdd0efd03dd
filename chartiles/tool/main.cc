#include "chartiles/pipeline/pipeline.h"
#include "chartiles/errors.h"
#include "chartiles/detail/argparse.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <cstdlib>
#include <sstream>

using namespace chartiles;

namespace {

	const char* usage = R"(Usage: chartiles [options]

Reprojects chart rasters to Web Mercator and cuts them into {z}/{x}/{y} tiles.

  -c, --config <yaml>             descriptor file (default charts.yaml)
  -z, --zippath <dir>             directory of source archives and rasters
  -t, --tmppath <dir>             scratch directory (default /tmp/chartiles)
  -o, --outpath <dir>             tile output directory. Without it nothing is cut
  -s, --tilesets <a,b,...>        tileset names or tile paths (default all)
  -l, --list                      list tilesets and exit
      --summary                   print tile counts of each tileset and exit
  -C, --cleanup                   remove the scratch directory when done
  -T, --tile-only                 reuse reprojected rasters from the scratch directory
      --zoom-min <z>, --zoom-max <z>
  -f, --format <png|jpeg|webp>    tile format (default png)
      --reproject-resampling <m>  nearest, bilinear, cubic, cubicspline, lanczos, average, mode
      --tile-resampling <m>       same choices, used when cutting base tiles
  -j, --jobs <n>                  datasets reprojected at once
  -w, --tile-workers <n>          base tile threads
  -q, --quiet                     only warnings and errors
  -h, --help
)";

	std::vector<std::string> splitCommas(const std::vector<std::string>& args) {
		std::vector<std::string> out;
		for (const auto& a : args) {
			std::stringstream ss(a);
			std::string item;
			while (std::getline(ss, item, ','))
				if (!item.empty()) out.push_back(item);
		}
		return out;
	}

	int run(int argc, char** argv) {
		ArgParser parser(argc, argv);

		if (parser.have2("-h", "--help")) {
			fmt::print("{}", usage);
			return 0;
		}

		Log log;
		log.quiet = parser.have2("-q", "--quiet");

		std::string configPath = parser.get2<std::string>("-c", "--config", "charts.yaml").value();
		Catalog catalog = Catalog::load(configPath);

		PipelineOptions opts;
		opts.tileOnly   = parser.have2("-T", "--tile-only");
		opts.sourceDir  = parser.get2<std::string>("-z", "--zippath", "").value();
		opts.scratchDir = parser.get2<std::string>("-t", "--tmppath", "/tmp/chartiles").value();
		opts.outDir     = parser.get2<std::string>("-o", "--outpath", "").value();
		opts.format     = parseTileFormat(parser.getChoice2("-f", "--format", "png", "jpeg", "jpg", "webp").value_or("png"));
		opts.reprojectResampling = parser.getChoice("--reproject-resampling",
				"nearest", "bilinear", "cubic", "cubicspline", "lanczos", "average", "mode").value_or("bilinear");
		opts.tileResampling      = parser.getChoice("--tile-resampling",
				"nearest", "bilinear", "cubic", "cubicspline", "lanczos", "average", "mode").value_or("bilinear");
		opts.jobs        = parser.get2<int>("-j", "--jobs", 0).value();
		opts.tileWorkers = parser.get2<int>("-w", "--tile-workers", 0).value();
		opts.zoomMin     = parser.get<int>("--zoom-min");
		opts.zoomMax     = parser.get<int>("--zoom-max");

		Pipeline pipeline(catalog, opts, log);

		std::vector<std::string> tilesets = catalog.tilesetNames();
		if (auto s = parser.get2<std::vector<std::string>>("-s", "--tilesets"); s.has_value()) {
			tilesets = splitCommas(*s);
			for (const auto& t : tilesets)
				if (!catalog.haveTileset(t)) throw ConfigError(fmt::format("no tileset named '{}'", t));
		}

		if (parser.have2("-l", "--list")) {
			for (const auto& line : pipeline.listTilesets()) fmt::print("{}\n", line);
			return 0;
		}

		if (parser.have("--summary")) {
			for (const auto& t : tilesets) {
				fmt::print("{}\n{}", catalog.tileset(t).name, pipeline.manifestSummary(t));
			}
			return 0;
		}

		if (!opts.tileOnly and opts.sourceDir.empty())
			throw ConfigError("--zippath is required unless --tile-only is given");

		bool ok = true;
		for (const auto& t : tilesets) {
			auto range = pipeline.zoomRange(t);
			BuildReport report = pipeline.build(t, range[0], range[1]);
			printReport(report, log);
			ok = ok and report.ok();
		}

		if (parser.have2("-C", "--cleanup")) pipeline.cleanup();

		return ok ? 0 : 1;
	}

}

int main(int argc, char** argv) {

	// Workers open the per-zoom mosaics themselves, so no sharing of sources between handles.
	setenv("VRT_SHARED_SOURCE", "0", false);

	try {
		return run(argc, argv);
	} catch (const ConfigError& e) {
		fmt::print(stderr, fmt::fg(fmt::color::red), " - {}\n", e.what());
	} catch (const BadFileError& e) {
		fmt::print(stderr, fmt::fg(fmt::color::red), " - {}\n", e.what());
	} catch (const std::exception& e) {
		fmt::print(stderr, fmt::fg(fmt::color::red), " - fatal: {}\n", e.what());
	}
	return 1;
}
