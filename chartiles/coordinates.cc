#include "coordinates.h"

#include <algorithm>
#include <cmath>

namespace chartiles {

double resolutionForZoom(int z) {
	return (2 * WebMercatorMapScale) / (std::ldexp(1.0, z) * TileSize);
}

void tileBoundsWm(double tlbr[4], const TileCoordinate& tc) {
	double size = (2 * WebMercatorMapScale) / static_cast<double>(1lu << tc.z());
	tlbr[0] = -WebMercatorMapScale + size * static_cast<double>(tc.x());
	tlbr[2] = -WebMercatorMapScale + size * static_cast<double>(tc.x() + 1);
	tlbr[1] = -WebMercatorMapScale + size * static_cast<double>(tc.yUp());
	tlbr[3] = -WebMercatorMapScale + size * static_cast<double>(tc.yUp() + 1);
}

void lonLatToTile(double lon, double lat, int z, uint32_t& x, uint32_t& y) {
	int64_t n = 1l << z;
	double latRad = lat * M_PI / 180.0;
	int64_t xx = static_cast<int64_t>(std::floor((lon + 180.0) / 360.0 * n));
	int64_t yy = static_cast<int64_t>(std::floor((1.0 - std::asinh(std::tan(latRad)) / M_PI) / 2.0 * n));
	x = static_cast<uint32_t>(std::clamp<int64_t>(xx, 0, n - 1));
	y = static_cast<uint32_t>(std::clamp<int64_t>(yy, 0, n - 1));
}

TileRange tileRangeForBox(const GeoBox& box, int z) {
	double minLon = std::max(box.minLon, -180.0);
	double maxLon = std::min(box.maxLon, 180.0);
	double minLat = std::clamp(box.minLat, -MaxTileLatitude, MaxTileLatitude);
	double maxLat = std::clamp(box.maxLat, -MaxTileLatitude, MaxTileLatitude);

	// North edge gives the smallest y.
	TileRange r;
	lonLatToTile(minLon, maxLat, z, r.x0, r.y0);
	lonLatToTile(maxLon, minLat, z, r.x1, r.y1);
	return r;
}

double mercatorXToLon(double mx) {
	return mx * 180.0 / WebMercatorMapScale;
}
double mercatorYToLat(double my) {
	return std::atan(std::sinh(my * M_PI / WebMercatorMapScale)) * 180.0 / M_PI;
}
double lonToMercatorX(double lon) {
	return lon * WebMercatorMapScale / 180.0;
}
double latToMercatorY(double lat) {
	return std::asinh(std::tan(lat * M_PI / 180.0)) * WebMercatorMapScale / M_PI;
}

}
