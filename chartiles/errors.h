#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>

namespace chartiles {

	// Thrown while loading the descriptor file. Nothing can run without a valid catalog.
	struct ConfigError : public std::runtime_error {
		inline ConfigError(const std::string& msg)
			: std::runtime_error(fmt::format("ConfigError({})", msg))
		{ }
	};

	//
	// Aborts the reprojection of one dataset.
	// The orchestrator catches these, records the dataset as failed and keeps going with
	// the rest of the tileset.
	//
	struct DatasetError : public std::runtime_error {
		const std::string dataset;

		inline DatasetError(const std::string& dataset, const std::string& msg)
			: std::runtime_error(fmt::format("DatasetError(ds='{}', {})", dataset, msg)), dataset(dataset)
		{ }
	};

	// Not enough points, or points that cannot pin down an affine.
	struct GcpError : public DatasetError {
		int npoints;

		inline GcpError(const std::string& dataset, int npoints, const std::string& msg)
			: DatasetError(dataset, fmt::format("gcps n={}: {}", npoints, msg)), npoints(npoints)
		{ }
	};

	// Aborts tile generation for one zoom level of one tileset.
	struct ZoomLevelError : public std::runtime_error {
		int zoom;

		inline ZoomLevelError(int zoom, const std::string& msg)
			: std::runtime_error(fmt::format("ZoomLevelError(z={}, {})", zoom, msg)), zoom(zoom)
		{ }
	};

	// The rasters of a mosaic stack disagree on band layout.
	struct MosaicMismatchError : public ZoomLevelError {
		inline MosaicMismatchError(int zoom, const std::string& a, const std::string& b, const std::string& what)
			: ZoomLevelError(zoom, fmt::format("'{}' and '{}' differ in {}", a, b, what))
		{ }
	};

	struct BadFileError : public std::runtime_error {
		const std::string file;
		int code;

		inline BadFileError(const std::string& file, int code=0)
			: std::runtime_error(fmt::format("BadFileError(f={}, c={})", file, code)), file(file), code(code)
		{}
	};

}
