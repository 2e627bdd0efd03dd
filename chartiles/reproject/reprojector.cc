#include "reprojector.h"
#include "gcp.h"

#include "chartiles/errors.h"

#include <gdal_alg.h>
#include <gdal_utils.h>
#include <cpl_vsi.h>
#include <ogr_geometry.h>

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chartiles {

namespace {

	using TranslateOptionsPtr = std::unique_ptr<GDALTranslateOptions, decltype(&GDALTranslateOptionsFree)>;
	using WarpOptionsPtr = std::unique_ptr<GDALWarpAppOptions, decltype(&GDALWarpAppOptionsFree)>;

	RasterSource openSource(const std::string& dataset, const std::string& path) {
		try {
			return RasterSource(path);
		} catch (const BadFileError&) {
			throw DatasetError(dataset, fmt::format("cannot open '{}': {}", path, CPLGetLastErrorMsg()));
		}
	}

	GDALDatasetH translate(const std::string& dst, GDALDataset* src, CPLStringList& args) {
		TranslateOptionsPtr opts { GDALTranslateOptionsNew(args.List(), nullptr), &GDALTranslateOptionsFree };
		if (!opts) throw std::runtime_error("bad GDALTranslate options");

		int usageError = 0;
		GDALDatasetH out = GDALTranslate(dst.c_str(), GDALDataset::ToHandle(src), opts.get(), &usageError);
		if (out == nullptr or usageError) {
			if (out) GDALClose(out);
			throw std::runtime_error(fmt::format("GDALTranslate failed: {}", CPLGetLastErrorMsg()));
		}
		return out;
	}

	// In-memory copy of the window, always three Byte bands.
	RasterSource cropWindow(const DatasetDescriptor& d, RasterSource& src, const PixelWindow& win) {
		CPLStringList args;
		args.AddString("-of");
		args.AddString("MEM");
		args.AddString("-ot");
		args.AddString("Byte");
		args.AddString("-srcwin");
		for (int v : { win.x, win.y, win.w, win.h }) args.AddString(std::to_string(v).c_str());

		// Gray sources are repeated into all three.
		const int bands[3] = { 1, src.bandCount() >= 3 ? 2 : 1, src.bandCount() >= 3 ? 3 : 1 };
		for (int b : bands) {
			args.AddString("-b");
			args.AddString(std::to_string(b).c_str());
		}

		RasterSource work(GDALDataset::FromHandle(translate("", src.get(), args)), d.name + " (window)");

		const GDALColorInterp rgb[3] = { GCI_RedBand, GCI_GreenBand, GCI_BlueBand };
		for (int b=0; b<3; b++) work.get()->GetRasterBand(b+1)->SetColorInterpretation(rgb[b]);
		return work;
	}

	//
	// Alpha is 255 inside the union of the mask polygons, or everywhere without a mask.
	// Mask vertices are full-source pixels, so the rasterizer is run under a transform taking window pixels to
	// source pixels, and the real geotransform is put back afterwards.
	//
	void burnAlpha(const DatasetDescriptor& d, RasterSource& work, const PixelWindow& win) {
		work.addAlphaBand();
		int alphaBand = work.bandCount();
		GDALRasterBand* alpha = work.get()->GetRasterBand(alphaBand);

		if (d.mask.empty()) {
			if (alpha->Fill(255) != CE_None) throw std::runtime_error("filling alpha failed");
			return;
		}
		if (alpha->Fill(0) != CE_None) throw std::runtime_error("filling alpha failed");

		bool hadGt = work.haveGeoTransform();
		RowMatrix23d saved = work.pix2prj();

		RowMatrix23d toSource;
		toSource << 1, 0, win.x,
		            0, 1, win.y;
		work.setGeoTransform(toSource);

		std::vector<std::unique_ptr<OGRPolygon>> polys;
		std::vector<OGRGeometryH> handles;
		for (const auto& ring : d.mask) {
			OGRLinearRing lr;
			for (const auto& v : ring) lr.addPoint(v[0], v[1]);
			auto poly = std::make_unique<OGRPolygon>();
			if (poly->addRing(&lr) != OGRERR_NONE) throw std::runtime_error("bad mask ring");
			handles.push_back(OGRGeometry::ToHandle(poly.get()));
			polys.push_back(std::move(poly));
		}
		std::vector<double> burn(handles.size(), 255.);

		CPLErr err = GDALRasterizeGeometries(GDALDataset::ToHandle(work.get()), 1, &alphaBand,
				static_cast<int>(handles.size()), handles.data(),
				nullptr, nullptr, burn.data(), nullptr, nullptr, nullptr);

		if (hadGt) work.setGeoTransform(saved);

		if (err != CE_None) throw std::runtime_error(fmt::format("rasterizing mask failed: {}", CPLGetLastErrorMsg()));
	}

	RasterSource warp(const DatasetDescriptor& d, RasterSource& work, const TargetGeometry& t,
			const OGRSpatialReference& dstSrs, const ReprojectOptions& opts) {
		auto mem = GetGDALDriverManager()->GetDriverByName("MEM");
		if (mem == nullptr) throw std::runtime_error("MEM driver not available");

		RasterSource dst(mem->Create("", t.width, t.height, 4, GDT_Byte, nullptr), d.name + " (warped)");
		dst.setGeoTransform(t.pix2dst);
		if (dst.get()->SetSpatialRef(&dstSrs) != CE_None) throw std::runtime_error("cannot set destination SRS");

		const GDALColorInterp rgba[4] = { GCI_RedBand, GCI_GreenBand, GCI_BlueBand, GCI_AlphaBand };
		for (int b=0; b<4; b++) dst.get()->GetRasterBand(b+1)->SetColorInterpretation(rgba[b]);

		CPLStringList args;
		args.AddString("-r");
		args.AddString(warpResampling(opts.resampling).c_str());
		args.AddString("-wo");
		args.AddString(fmt::format("NUM_THREADS={}", std::max(1, opts.numThreads)).c_str());
		args.AddString("-srcalpha");
		args.AddString("-dstalpha");
		WarpOptionsPtr wopts { GDALWarpAppOptionsNew(args.List(), nullptr), &GDALWarpAppOptionsFree };
		if (!wopts) throw std::runtime_error("bad GDALWarp options");

		GDALDatasetH srcH = GDALDataset::ToHandle(work.get());
		int usageError = 0;
		GDALDatasetH r = GDALWarp(nullptr, GDALDataset::ToHandle(dst.get()), 1, &srcH, wopts.get(), &usageError);
		if (r == nullptr or usageError)
			throw std::runtime_error(fmt::format("GDALWarp failed: {}", CPLGetLastErrorMsg()));

		return dst;
	}

	std::string sanitize(std::string s) {
		for (auto& c : s) {
			if (c == '/' or c == ' ' or c == ':' or c == '\\') c = '_';
		}
		auto i = s.find_first_not_of('_');
		return i == std::string::npos ? s : s.substr(i);
	}

}

PaletteCache::PaletteCache(const std::string& scratchDir) : dir_(scratchDir) {}

std::string PaletteCache::artifactPath(const std::string& sourcePath) const {
	std::string stem = fs::path(sanitize(sourcePath)).stem().string();
	return fmt::format("{}/rgb/{}.rgb.tif", dir_, stem);
}

PaletteCache::Entry& PaletteCache::entryFor(const std::string& sourcePath) {
	std::lock_guard<std::mutex> lck(mapMtx_);
	auto& e = entries_[sourcePath];
	if (!e) e = std::make_unique<Entry>();
	return *e;
}

std::string PaletteCache::expanded(const std::string& sourcePath) {
	Entry& e = entryFor(sourcePath);
	std::lock_guard<std::mutex> lck(e.mtx);

	VSIStatBufL st;
	if (VSIStatL(sourcePath.c_str(), &st) != 0)
		throw std::runtime_error(fmt::format("cannot stat '{}'", sourcePath));
	long long mtime = static_cast<long long>(st.st_mtime);

	if (e.mtime == mtime and !e.path.empty()) return e.path;

	std::string out = artifactPath(sourcePath);

	// Left by an earlier run.
	VSIStatBufL ost;
	if (VSIStatL(out.c_str(), &ost) == 0 and static_cast<long long>(ost.st_mtime) >= mtime) {
		e.mtime = mtime;
		e.path  = out;
		return out;
	}

	std::error_code ec;
	fs::create_directories(fs::path(out).parent_path(), ec);
	if (ec) throw BadFileError(fs::path(out).parent_path().string(), ec.value());

	RasterSource src(sourcePath);
	CPLStringList args;
	for (const char* a : { "-of", "GTiff", "-expand", "rgb", "-co", "COMPRESS=LZW", "-co", "TILED=YES" })
		args.AddString(a);
	GDALClose(translate(out + ".partial", src.get(), args));
	commitPartial(out);

	e.mtime = mtime;
	e.path  = out;
	return out;
}

void validateMask(const DatasetDescriptor& d) {
	for (size_t i=0; i<d.mask.size(); i++) {
		const auto& r = d.mask[i];
		if (r.size() < 4)
			throw DatasetError(d.name, fmt::format("mask ring {} has {} vertices, need at least 4", i, r.size()));
		if (r.front() != r.back())
			throw DatasetError(d.name, fmt::format("mask ring {} is not closed", i));
	}
}

ReprojectResult reprojectDataset(const DatasetDescriptor& d, const ReprojectOptions& opts,
		PaletteCache& palettes, const Log& log) {
	gdalInit();
	validateMask(d);

	const std::string srcPath = d.sourcePath(opts.sourceDir);
	const std::string outPath = d.scratchFile(opts.scratchDir);

	try {
		RasterSource src = openSource(d.name, srcPath);
		if (!src.haveProjection()) throw DatasetError(d.name, fmt::format("'{}' has no projection", srcPath));
		OGRSpatialReference srs = src.srs();

		PixelWindow win = d.window.value_or(PixelWindow{0, 0, src.width(), src.height()});
		if (win.x < 0 or win.y < 0 or win.x + win.w > src.width() or win.y + win.h > src.height())
			throw DatasetError(d.name, fmt::format("window [{} {} {} {}] outside raster {}x{}",
						win.x, win.y, win.w, win.h, src.width(), src.height()));

		if (src.hasPalette()) {
			log.info(" - [{}] expanding palette\n", d.name);
			src = openSource(d.name, palettes.expanded(srcPath));
		}

		RasterSource work = cropWindow(d, src, win);
		burnAlpha(d, work, win);

		RowMatrix23d affine;
		if (!d.gcps.empty()) {
			affine = fitGcpAffine(d.name, windowRelative(d.gcps, win), srs);
			work.setGeoTransform(affine);
			log.info(" - [{}] affine from {} gcps:\n{}\n", d.name, d.gcps.size(), affine);
		} else {
			if (!work.haveGeoTransform()) throw DatasetError(d.name, "no geotransform and no gcps");
			affine = work.pix2prj();
		}

		const OGRSpatialReference dst = webMercator();
		TargetGeometry target = computeTarget(d.name, srs, affine, win.w, win.h, dst, d.antimeridian, opts.resolution);
		if (d.geobound.has_value()) target = applyGeoBound(d.name, target, *d.geobound, dst);
		target = wrapToMap(target);

		log.info(" - [{}] warping {}x{} -> {}x{} at {:.2f} m/px{}\n", d.name, win.w, win.h,
				target.width, target.height, target.res, target.unwrapped ? " (unwrapped)" : "");

		RasterSource warped = warp(d, work, target, dst, opts);
		warped.writeGTiff(outPath);

		return ReprojectResult { d.name, outPath, target };

	} catch (const DatasetError&) {
		throw;
	} catch (const std::runtime_error& e) {
		throw DatasetError(d.name, e.what());
	}
}

}
