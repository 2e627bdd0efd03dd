#include "raster.h"

#include "chartiles/errors.h"

#include <Eigen/LU>

#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <map>
#include <mutex>
#include <stdexcept>

namespace chartiles {

namespace {
	std::once_flag gdalFlag__;

	struct ResamplingInfo {
		const char* warpName;
		GDALRIOResampleAlg rio;
	};

	const std::map<std::string, ResamplingInfo> resamplings = {
		{ "nearest",     { "near",        GRIORA_NearestNeighbour } },
		{ "bilinear",    { "bilinear",    GRIORA_Bilinear } },
		{ "cubic",       { "cubic",       GRIORA_Cubic } },
		{ "cubicspline", { "cubicspline", GRIORA_CubicSpline } },
		{ "lanczos",     { "lanczos",     GRIORA_Lanczos } },
		{ "average",     { "average",     GRIORA_Average } },
		{ "mode",        { "mode",        GRIORA_Mode } },
	};

	const ResamplingInfo& findResampling(const std::string& name) {
		auto it = resamplings.find(name);
		if (it == resamplings.end()) throw ConfigError(fmt::format("unknown resampling method '{}'", name));
		return it->second;
	}
}

void gdalInit() {
	std::call_once(gdalFlag__, &GDALAllRegister);
}

CoordinateTransformPtr makeTransform(const OGRSpatialReference& from, const OGRSpatialReference& to) {
	CoordinateTransformPtr ct { OGRCreateCoordinateTransformation(&from, &to) };
	if (!ct) throw std::runtime_error(fmt::format("cannot create coordinate transformation: {}", CPLGetLastErrorMsg()));
	return ct;
}

OGRSpatialReference wgs84() {
	OGRSpatialReference sr;
	sr.importFromEPSG(4326);
	sr.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	return sr;
}

OGRSpatialReference webMercator() {
	OGRSpatialReference sr;
	sr.importFromEPSG(3857);
	sr.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	return sr;
}

RowMatrix23d affineFromGeoTransform(const double g[6]) {
	RowMatrix23d A;
	A << g[1], g[2], g[0],
	     g[4], g[5], g[3];
	return A;
}

void geoTransformFromAffine(double g[6], const RowMatrix23d& A) {
	g[0] = A(0,2); g[1] = A(0,0); g[2] = A(0,1);
	g[3] = A(1,2); g[4] = A(1,0); g[5] = A(1,1);
}

RowMatrix23d invertAffine(const RowMatrix23d& A) {
	RowMatrix3d AA;
	AA.topRows<2>() = A;
	AA.row(2) << 0, 0, 1;
	RowMatrix3d inv = AA.inverse();
	return inv.topRows<2>();
}

void commitPartial(const std::string& finalPath) {
	std::string partial = finalPath + ".partial";
	if (std::rename(partial.c_str(), finalPath.c_str()) != 0)
		throw BadFileError(finalPath, errno);
}

bool isResamplingName(const std::string& name) {
	return resamplings.find(name) != resamplings.end();
}
std::string warpResampling(const std::string& name) {
	return findResampling(name).warpName;
}
GDALRIOResampleAlg rasterIoResampling(const std::string& name) {
	return findResampling(name).rio;
}

RasterSource::RasterSource(const std::string& path, bool update) : path_(path) {
	gdalInit();
	dset = GDALDataset::FromHandle(GDALOpen(path.c_str(), update ? GA_Update : GA_ReadOnly));
	if (dset == nullptr) throw BadFileError(path, static_cast<int>(CPLGetLastErrorNo()));
	loadMeta();
}

RasterSource::RasterSource(GDALDataset* dset_, const std::string& what) : dset(dset_), path_(what) {
	if (dset == nullptr) throw BadFileError(what, static_cast<int>(CPLGetLastErrorNo()));
	loadMeta();
}

RasterSource::~RasterSource() {
	if (dset) { GDALClose(GDALDataset::ToHandle(dset)); dset = nullptr; }
}

RasterSource::RasterSource(RasterSource&& o) noexcept
	: dset(o.dset), path_(std::move(o.path_)), w(o.w), h(o.h), nbands(o.nbands),
	  haveGt_(o.haveGt_), pix2prj_(o.pix2prj_), prj2pix_(o.prj2pix_) {
	o.dset = nullptr;
}

RasterSource& RasterSource::operator=(RasterSource&& o) noexcept {
	if (this != &o) {
		if (dset) GDALClose(GDALDataset::ToHandle(dset));
		dset = o.dset; o.dset = nullptr;
		path_ = std::move(o.path_);
		w = o.w; h = o.h; nbands = o.nbands;
		haveGt_ = o.haveGt_;
		pix2prj_ = o.pix2prj_;
		prj2pix_ = o.prj2pix_;
	}
	return *this;
}

void RasterSource::loadMeta() {
	w      = dset->GetRasterXSize();
	h      = dset->GetRasterYSize();
	nbands = dset->GetRasterCount();

	double g[6];
	haveGt_ = dset->GetGeoTransform(g) == CE_None;
	if (haveGt_) {
		pix2prj_ = affineFromGeoTransform(g);
		prj2pix_ = invertAffine(pix2prj_);
	} else {
		pix2prj_ << 1, 0, 0, 0, 1, 0;
		prj2pix_ = pix2prj_;
	}
}

GDALDataType RasterSource::dataType(int band) const {
	return dset->GetRasterBand(band)->GetRasterDataType();
}

GDALColorInterp RasterSource::colorInterp(int band) const {
	return dset->GetRasterBand(band)->GetColorInterpretation();
}

bool RasterSource::hasPalette() const {
	return nbands == 1 and dset->GetRasterBand(1)->GetColorTable() != nullptr;
}

bool RasterSource::hasAlpha() const {
	return nbands > 0 and colorInterp(nbands) == GCI_AlphaBand;
}

bool RasterSource::haveProjection() const {
	auto s = dset->GetSpatialRef();
	return s != nullptr and !s->IsEmpty();
}

OGRSpatialReference RasterSource::srs() const {
	auto s = dset->GetSpatialRef();
	if (s == nullptr or s->IsEmpty()) throw std::runtime_error(fmt::format("'{}' has no projection", path_));
	OGRSpatialReference out(*s);
	out.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	return out;
}

bool RasterSource::haveGeoTransform() const {
	return haveGt_;
}

void RasterSource::setGeoTransform(const RowMatrix23d& A) {
	double g[6];
	geoTransformFromAffine(g, A);
	if (dset->SetGeoTransform(g) != CE_None)
		throw std::runtime_error(fmt::format("SetGeoTransform failed on '{}'", path_));
	haveGt_  = true;
	pix2prj_ = A;
	prj2pix_ = invertAffine(A);
}

void RasterSource::addAlphaBand() {
	if (dset->AddBand(GDT_Byte, nullptr) != CE_None)
		throw std::runtime_error(fmt::format("cannot add an alpha band to '{}': {}", path_, CPLGetLastErrorMsg()));
	nbands = dset->GetRasterCount();
	dset->GetRasterBand(nbands)->SetColorInterpretation(GCI_AlphaBand);
}

Eigen::AlignedBox2d RasterSource::boundsPrj() const {
	Eigen::AlignedBox2d box;
	const double corners[4][2] = { {0,0}, {(double)w,0}, {(double)w,(double)h}, {0,(double)h} };
	for (int i=0; i<4; i++) {
		Eigen::Vector2d p = pix2prj_ * Eigen::Vector3d{corners[i][0], corners[i][1], 1.};
		box.extend(p);
	}
	return box;
}

void RasterSource::readInto(cv::Mat& dst, double xoff, double yoff, double xsize, double ysize,
		const std::vector<int>& bandMap, GDALRIOResampleAlg alg) {
	int c = static_cast<int>(bandMap.size());
	if (dst.empty() or dst.channels() < c or dst.depth() != CV_8U)
		throw std::runtime_error(fmt::format("readInto: destination needs at least {} 8 bit channels", c));

	// Integer window must contain the fractional one.
	int nx0 = std::max(0, static_cast<int>(std::floor(xoff)));
	int ny0 = std::max(0, static_cast<int>(std::floor(yoff)));
	int nx1 = std::min(w, static_cast<int>(std::ceil(xoff + xsize)));
	int ny1 = std::min(h, static_cast<int>(std::ceil(yoff + ysize)));
	if (nx1 <= nx0 or ny1 <= ny0)
		throw std::runtime_error(fmt::format("readInto: empty window on '{}'", path_));

	GDALRasterIOExtraArg arg;
	INIT_RASTERIO_EXTRA_ARG(arg);
	arg.eResampleAlg                 = alg;
	arg.bFloatingPointWindowValidity = TRUE;
	arg.dfXOff                       = std::max(xoff, (double)nx0);
	arg.dfYOff                       = std::max(yoff, (double)ny0);
	arg.dfXSize                      = std::min(xoff + xsize, (double)nx1) - arg.dfXOff;
	arg.dfYSize                      = std::min(yoff + ysize, (double)ny1) - arg.dfYOff;

	auto err = dset->RasterIO(GF_Read,
			nx0, ny0, nx1 - nx0, ny1 - ny0,
			dst.data, dst.cols, dst.rows, GDT_Byte,
			c, const_cast<int*>(bandMap.data()),
			dst.channels(), dst.step[0], 1,
			&arg);
	if (err != CE_None)
		throw std::runtime_error(fmt::format("RasterIO failed on '{}' ({:.1f} {:.1f} {:.1f} {:.1f}): {}",
					path_, xoff, yoff, xsize, ysize, CPLGetLastErrorMsg()));
}

void RasterSource::writeGTiff(const std::string& outPath) {
	auto driver = GetGDALDriverManager()->GetDriverByName("GTiff");
	if (driver == nullptr) throw std::runtime_error("GTiff driver not available");

	std::string partial = outPath + ".partial";
	CPLStringList opts;
	opts.SetNameValue("COMPRESS", "LZW");
	opts.SetNameValue("TILED", "YES");
	if (nbands == 4 or nbands == 2) opts.SetNameValue("ALPHA", "YES");

	GDALDataset* out = driver->CreateCopy(partial.c_str(), dset, FALSE, opts.List(), nullptr, nullptr);
	if (out == nullptr)
		throw BadFileError(partial, static_cast<int>(CPLGetLastErrorNo()));
	GDALClose(GDALDataset::ToHandle(out));

	commitPartial(outPath);
}

}
