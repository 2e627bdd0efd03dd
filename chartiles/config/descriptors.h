#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace chartiles {

// Integer pixel rectangle in full-source coordinates.
struct PixelWindow {
	int x=0, y=0, w=0, h=0;
};

struct GroundControlPoint {
	double px, py;
	double lon, lat;
};

// One closed ring of (x,y) source-pixel vertices.
using Ring = std::vector<std::array<double,2>>;

// Each component may be absent, in which case the reprojected bound is kept as computed.
struct GeoBound {
	std::optional<double> minLon, minLat, maxLon, maxLat;
};

struct DatasetDescriptor {
	std::string name;
	std::optional<std::string> zipFile;
	std::string inputFile;

	std::optional<PixelWindow> window;
	std::vector<Ring> mask;
	std::vector<GroundControlPoint> gcps;
	std::optional<GeoBound> geobound;
	bool antimeridian = false;
	int maxLod = 12;

	// Path that GDAL can open, given the directory that holds the archives.
	std::string sourcePath(const std::string& sourceDir) const;

	// The reprojected raster in the scratch directory.
	std::string scratchFile(const std::string& scratchDir) const;
};

struct TilesetDescriptor {
	std::string name;
	std::string tilePath;
	std::vector<std::string> datasets;
	std::optional<std::array<int,2>> zoom;
	std::optional<int> maxlodZoom;
};

//
// All descriptors of a run. Built once, then only read.
//
class Catalog {
	public:
		static Catalog load(const std::string& path);
		static Catalog fromString(const std::string& yaml);
		static Catalog fromYaml(const YAML::Node& root);

		const DatasetDescriptor& dataset(const std::string& name) const;
		bool haveDataset(const std::string& name) const;

		// Accepts either the tileset's name or its tile_path.
		const TilesetDescriptor& tileset(const std::string& nameOrPath) const;
		bool haveTileset(const std::string& nameOrPath) const;

		// Tileset names in file order.
		inline const std::vector<std::string>& tilesetNames() const { return tilesetOrder_; }
		inline size_t datasetCount() const { return datasets_.size(); }

		// Largest max_lod among the members of a tileset.
		int maxLod(const TilesetDescriptor& ts) const;

		// The zoom whose resolution the reprojection targets.
		int maxlodZoom(const TilesetDescriptor& ts) const;

		// [min,max] zoom a tileset is cut at, unless overridden on the command line.
		std::array<int,2> zoomRange(const TilesetDescriptor& ts) const;

	private:
		std::map<std::string, DatasetDescriptor> datasets_;
		std::map<std::string, TilesetDescriptor> tilesets_;
		std::vector<std::string> tilesetOrder_;

		const TilesetDescriptor* findTileset(const std::string& nameOrPath) const;
};

}
