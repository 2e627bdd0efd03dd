#pragma once

#include "target.h"
#include "chartiles/config/descriptors.h"
#include "chartiles/detail/log.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace chartiles {

//
// Palette rasters are expanded to RGB once, into `<scratch>/rgb/`, and the expanded file is shared by every
// dataset cut from the same source. An artifact is reused while it is newer than its source.
// Concurrent requests for one source wait on that source's mutex. Different sources do not block each other.
//
class PaletteCache {
	public:
		explicit PaletteCache(const std::string& scratchDir);

		// Path of an RGB copy of `sourcePath`, creating it if needed. Throws std::runtime_error.
		std::string expanded(const std::string& sourcePath);

		// Path the artifact of `sourcePath` lives at.
		std::string artifactPath(const std::string& sourcePath) const;

	private:
		std::string dir_;

		struct Entry {
			std::mutex mtx;
			long long mtime = -1;
			std::string path;
		};

		std::mutex mapMtx_;
		std::map<std::string, std::unique_ptr<Entry>> entries_;

		Entry& entryFor(const std::string& sourcePath);
};

struct ReprojectOptions {
	std::string sourceDir;
	std::string scratchDir;
	std::string resampling = "bilinear";
	int numThreads = 1;

	// Destination pixel size. Normally that of the tileset's maxlod zoom.
	std::optional<double> resolution;
};

struct ReprojectResult {
	std::string dataset;
	std::string path;
	TargetGeometry target;
};

//
// Take one dataset from its source raster to an RGBA Web Mercator GeoTIFF in the scratch directory:
// palette expansion, window crop, mask burned into alpha, GCP georeferencing, warp, optional geobound clip.
//
// Every failure is reported as a DatasetError (GcpError for control point problems).
//
ReprojectResult reprojectDataset(const DatasetDescriptor& d, const ReprojectOptions& opts,
		PaletteCache& palettes, const Log& log);

// Checks that every mask ring is closed with at least 4 vertices. Throws DatasetError.
void validateMask(const DatasetDescriptor& d);

}
