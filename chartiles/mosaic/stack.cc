#include "stack.h"

#include "chartiles/errors.h"
#include "chartiles/gdal/raster.h"

#include <gdal_utils.h>

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <memory>

namespace chartiles {

namespace {
	using BuildVrtOptionsPtr = std::unique_ptr<GDALBuildVRTOptions, decltype(&GDALBuildVRTOptionsFree)>;

	std::string fileSafe(std::string s) {
		for (auto& c : s) if (c == '/' or c == ' ' or c == '\\') c = '_';
		return s;
	}
}

std::vector<StackMember> orderStack(const std::vector<StackMember>& candidates, int zoom) {
	std::vector<StackMember> out;
	for (const auto& c : candidates) {
		if (c.maxLod >= zoom) out.push_back(c);
	}
	std::stable_sort(out.begin(), out.end(), [](const StackMember& a, const StackMember& b) { return a.maxLod > b.maxLod; });
	return out;
}

void checkStackCompatible(const std::vector<StackMember>& members, int zoom) {
	if (members.size() < 2) return;

	RasterSource first(members[0].path);
	for (size_t i=1; i<members.size(); i++) {
		RasterSource other(members[i].path);
		const auto& a = members[0].dataset;
		const auto& b = members[i].dataset;

		if (other.bandCount() != first.bandCount())
			throw MosaicMismatchError(zoom, a, b, fmt::format("band count ({} vs {})", first.bandCount(), other.bandCount()));

		for (int band=1; band<=first.bandCount(); band++) {
			if (other.dataType(band) != first.dataType(band))
				throw MosaicMismatchError(zoom, a, b, fmt::format("data type of band {} ({} vs {})", band,
							GDALGetDataTypeName(first.dataType(band)), GDALGetDataTypeName(other.dataType(band))));
			if (other.colorInterp(band) != first.colorInterp(band))
				throw MosaicMismatchError(zoom, a, b, fmt::format("color interpretation of band {} ({} vs {})", band,
							GDALGetColorInterpretationName(first.colorInterp(band)), GDALGetColorInterpretationName(other.colorInterp(band))));
		}
	}
}

std::string stackVrtPath(const std::string& scratchDir, const std::string& tileset, int zoom) {
	return fmt::format("{}/__{}__z{}.vrt", scratchDir, fileSafe(tileset), zoom);
}

MosaicStack buildMosaicStack(const std::string& tileset, int zoom, const std::vector<StackMember>& candidates,
		const std::string& scratchDir) {
	gdalInit();

	std::vector<StackMember> present;
	for (const auto& c : candidates) {
		std::error_code ec;
		if (std::filesystem::exists(c.path, ec)) present.push_back(c);
	}

	MosaicStack stack { tileset, zoom, orderStack(present, zoom), stackVrtPath(scratchDir, tileset, zoom) };
	if (stack.members.empty()) throw ZoomLevelError(zoom, fmt::format("no raster of '{}' is eligible", tileset));

	try {
		checkStackCompatible(stack.members, zoom);
	} catch (const BadFileError& e) {
		throw ZoomLevelError(zoom, e.what());
	}

	CPLStringList names;
	for (const auto& m : stack.members) names.AddString(m.path.c_str());

	CPLStringList args;
	args.AddString("-resolution");
	args.AddString("highest");
	BuildVrtOptionsPtr opts { GDALBuildVRTOptionsNew(args.List(), nullptr), &GDALBuildVRTOptionsFree };
	if (!opts) throw ZoomLevelError(zoom, "bad GDALBuildVRT options");

	// A stack left by an earlier run must not pass for this one.
	std::error_code ec;
	std::filesystem::remove(stack.vrtPath, ec);

	int usageError = 0;
	GDALDatasetH vrt = GDALBuildVRT(stack.vrtPath.c_str(), static_cast<int>(stack.members.size()), nullptr,
			names.List(), opts.get(), &usageError);
	if (vrt == nullptr or usageError) {
		if (vrt) GDALClose(vrt);
		throw ZoomLevelError(zoom, fmt::format("GDALBuildVRT failed for '{}': {}", stack.vrtPath, CPLGetLastErrorMsg()));
	}

	// The VRT is written when closed.
	GDALClose(vrt);
	if (!std::filesystem::exists(stack.vrtPath, ec))
		throw ZoomLevelError(zoom, fmt::format("could not write '{}': {}", stack.vrtPath, CPLGetLastErrorMsg()));

	return stack;
}

}
