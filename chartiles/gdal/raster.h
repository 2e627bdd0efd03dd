#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <opencv2/core.hpp>

#include <gdal_priv.h>
#include <cpl_string.h>
#include <ogr_spatialref.h>

#include <memory>
#include <string>
#include <vector>

namespace chartiles {

using RowMatrix3d = Eigen::Matrix<double,3,3,Eigen::RowMajor>;
using RowMatrix23d = Eigen::Matrix<double,2,3,Eigen::RowMajor>;

// Must be called before any GDAL use. Safe from many threads.
void gdalInit();

// GDAL geotransform (6 doubles) <-> 2x3 pixel-to-projection affine.
RowMatrix23d affineFromGeoTransform(const double g[6]);
void geoTransformFromAffine(double g[6], const RowMatrix23d& A);
RowMatrix23d invertAffine(const RowMatrix23d& A);

// Accepted resampling names: nearest, bilinear, cubic, cubicspline, lanczos, average, mode.
bool isResamplingName(const std::string& name);
// Value for gdalwarp's -r.
std::string warpResampling(const std::string& name);
GDALRIOResampleAlg rasterIoResampling(const std::string& name);

struct CoordinateTransformDeleter {
	inline void operator()(OGRCoordinateTransformation* ct) const { OGRCoordinateTransformation::DestroyCT(ct); }
};
using CoordinateTransformPtr = std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformDeleter>;

// Throws std::runtime_error if GDAL cannot relate the two.
CoordinateTransformPtr makeTransform(const OGRSpatialReference& from, const OGRSpatialReference& to);

// Both use lon,lat / x,y axis order.
OGRSpatialReference wgs84();
OGRSpatialReference webMercator();

// Move a finished `<path>.partial` into place. Throws BadFileError.
void commitPartial(const std::string& finalPath);

//
// Owning handle to one GDALDataset.
// A handle is used by one thread at a time.
//
class RasterSource {
	public:
		// Throws BadFileError if GDAL cannot open the path.
		explicit RasterSource(const std::string& path, bool update=false);
		// Takes ownership. Throws BadFileError on nullptr, with `what` as the file name.
		RasterSource(GDALDataset* dset, const std::string& what);
		~RasterSource();

		RasterSource(const RasterSource&) = delete;
		RasterSource& operator=(const RasterSource&) = delete;
		RasterSource(RasterSource&& o) noexcept;
		RasterSource& operator=(RasterSource&& o) noexcept;

		inline GDALDataset* get() { return dset; }
		inline const std::string& path() const { return path_; }

		inline int width() const { return w; }
		inline int height() const { return h; }
		inline int bandCount() const { return nbands; }

		GDALDataType dataType(int band=1) const;
		GDALColorInterp colorInterp(int band) const;
		bool hasPalette() const;
		bool hasAlpha() const;

		bool haveProjection() const;
		// Throws std::runtime_error if the dataset carries no projection.
		OGRSpatialReference srs() const;

		bool haveGeoTransform() const;
		inline const RowMatrix23d& pix2prj() const { return pix2prj_; }
		inline const RowMatrix23d& prj2pix() const { return prj2pix_; }
		void setGeoTransform(const RowMatrix23d& A);

		// Appends a Byte band marked as alpha. Needs a driver that supports AddBand (MEM).
		void addAlphaBand();

		// Projected bounds of the full raster, over all four corners.
		Eigen::AlignedBox2d boundsPrj() const;

		//
		// Read the (fractional) pixel window resampled into `dst`, an 8 bit Mat or ROI of one.
		// Bands are listed one-based, in output channel order. `dst` may have more channels than bands, the
		// extra ones are left untouched.
		//
		void readInto(cv::Mat& dst, double xoff, double yoff, double xsize, double ysize,
				const std::vector<int>& bandMap, GDALRIOResampleAlg alg);

		// Write a tiled, LZW compressed GeoTIFF copy. Goes through a `.partial` file.
		void writeGTiff(const std::string& outPath);

	private:
		GDALDataset* dset = nullptr;
		std::string path_;

		int w=0, h=0, nbands=0;
		bool haveGt_ = false;
		RowMatrix23d pix2prj_;
		RowMatrix23d prj2pix_;

		void loadMeta();
};

}
