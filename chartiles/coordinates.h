#pragma once

#include <cstdint>

namespace chartiles {

constexpr int	 MAX_LVLS = 26;
constexpr int	 TileSize = 256;

// pi * 6378137. The map spans [-WebMercatorMapScale, WebMercatorMapScale] on both axes.
constexpr double WebMercatorMapScale = 20037508.342789244;

// Latitudes are clamped to this before any tile math.
constexpr double MaxTileLatitude = 85.0;

//
// (z, y, x) packed into one uint64, usable directly as a ThreadPool key.
// x and y follow the XYZ convention: y=0 is the north edge.
//
struct TileCoordinate {
	uint64_t c;
	inline TileCoordinate(uint64_t cc) : c(cc) {}
	inline TileCoordinate(const TileCoordinate &tc) : c(tc.c) {}
	inline TileCoordinate(uint64_t z, uint64_t y, uint64_t x) : c(z << 58 | y << 29 | x) {}

	inline uint64_t z() const { return (c >> 58) & 0b111111; }
	inline uint64_t y() const { return (c >> 29) & 0b11111111111111111111111111111; }
	inline uint64_t x() const { return (c)&0b11111111111111111111111111111; }

	// Row index counted from the south edge, which is what the projection's y axis does.
	inline uint64_t yUp() const { return ((1lu << z()) - 1) - y(); }

	inline TileCoordinate parent() const { return TileCoordinate{z() - 1, y() >> 1, x() >> 1}; }

	inline TileCoordinate& operator=(const TileCoordinate &o) { c = o.c; return *this; }
	inline bool operator==(const TileCoordinate &other) const { return c == other.c; }
	inline bool operator<(const TileCoordinate &other) const { return c < other.c; }
	inline		operator uint64_t() const { return c; }
};
static_assert(sizeof(TileCoordinate) == 8);

// Geographic bounding box in degrees. minLon > maxLon means the box crosses the antimeridian.
struct GeoBox {
	double minLon, minLat, maxLon, maxLat;

	inline bool crossesAntimeridian() const { return minLon > maxLon; }
};

// Inclusive tile index range on one zoom level.
struct TileRange {
	uint32_t x0, y0, x1, y1;

	inline uint64_t count() const { return static_cast<uint64_t>(x1 - x0 + 1) * (y1 - y0 + 1); }
};

// Meters per pixel of a 256px tile at zoom z.
double resolutionForZoom(int z);

// Web Mercator bounds of an XYZ tile, as {minx, miny, maxx, maxy}.
void tileBoundsWm(double tlbr[4], const TileCoordinate& tc);

// XYZ tile containing (lon, lat) at zoom z, clamped to the grid.
void lonLatToTile(double lon, double lat, int z, uint32_t& x, uint32_t& y);

// Covering range of a non-crossing box. Applies the latitude clamp.
TileRange tileRangeForBox(const GeoBox& box, int z);

double mercatorXToLon(double mx);
double mercatorYToLat(double my);
double lonToMercatorX(double lon);
double latToMercatorY(double lat);

}
