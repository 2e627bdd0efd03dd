#include "descriptors.h"

#include "chartiles/errors.h"
#include "chartiles/coordinates.h"

#include <yaml-cpp/yaml.h>

#include <fmt/core.h>

#include <algorithm>
#include <set>

namespace chartiles {

namespace {

	const std::set<std::string> datasetKeys = {
		"zip_file", "input_file", "window", "mask", "gcps", "geobound", "antimeridian", "max_lod" };
	const std::set<std::string> tilesetKeys = {
		"tile_path", "zoom", "maxlod_zoom", "datasets" };

	std::string where(const YAML::Node& n) {
		auto m = n.Mark();
		if (m.is_null()) return "?";
		return fmt::format("line {}", m.line + 1);
	}

	void checkKeys(const YAML::Node& n, const std::set<std::string>& allowed, const std::string& owner) {
		for (const auto& kv : n) {
			auto k = kv.first.as<std::string>();
			if (allowed.find(k) == allowed.end())
				throw ConfigError(fmt::format("unknown key '{}' in '{}' ({})", k, owner, where(kv.first)));
		}
	}

	template <class T>
	T scalarAs(const YAML::Node& n, const std::string& what) {
		try {
			return n.as<T>();
		} catch (const YAML::Exception& e) {
			throw ConfigError(fmt::format("bad value for {} ({}): {}", what, where(n), e.what()));
		}
	}

	std::vector<double> numberList(const YAML::Node& n, size_t len, const std::string& what) {
		if (!n.IsSequence() or n.size() != len)
			throw ConfigError(fmt::format("{} must be a list of {} numbers ({})", what, len, where(n)));
		std::vector<double> out;
		for (const auto& v : n) out.push_back(scalarAs<double>(v, what));
		return out;
	}

	PixelWindow windowFromYaml(const YAML::Node& n, const std::string& ds) {
		if (!n.IsSequence() or n.size() != 4)
			throw ConfigError(fmt::format("window of '{}' must be [x, y, w, h]", ds));
		PixelWindow w;
		w.x = scalarAs<int>(n[0], "window");
		w.y = scalarAs<int>(n[1], "window");
		w.w = scalarAs<int>(n[2], "window");
		w.h = scalarAs<int>(n[3], "window");
		if (w.w <= 0 or w.h <= 0 or w.x < 0 or w.y < 0)
			throw ConfigError(fmt::format("window of '{}' has a negative offset or empty size", ds));
		return w;
	}

	// Ring closure is checked by the reprojector, which owns that failure.
	std::vector<Ring> maskFromYaml(const YAML::Node& n, const std::string& ds) {
		if (!n.IsSequence()) throw ConfigError(fmt::format("mask of '{}' must be a list of rings", ds));
		std::vector<Ring> out;
		for (const auto& ringNode : n) {
			if (!ringNode.IsSequence()) throw ConfigError(fmt::format("mask ring of '{}' must be a list of [x, y]", ds));
			Ring ring;
			for (const auto& v : ringNode) {
				auto xy = numberList(v, 2, "mask vertex");
				ring.push_back({xy[0], xy[1]});
			}
			out.push_back(std::move(ring));
		}
		return out;
	}

	std::vector<GroundControlPoint> gcpsFromYaml(const YAML::Node& n, const std::string& ds) {
		if (!n.IsSequence()) throw ConfigError(fmt::format("gcps of '{}' must be a list of [px, py, lon, lat]", ds));
		std::vector<GroundControlPoint> out;
		for (const auto& v : n) {
			auto p = numberList(v, 4, "gcp");
			out.push_back(GroundControlPoint{p[0], p[1], p[2], p[3]});
		}
		return out;
	}

	GeoBound geoboundFromYaml(const YAML::Node& n, const std::string& ds) {
		if (!n.IsSequence() or n.size() != 4)
			throw ConfigError(fmt::format("geobound of '{}' must be [min_lon, min_lat, max_lon, max_lat]", ds));
		std::optional<double> c[4];
		for (int i=0; i<4; i++) {
			if (!n[i].IsNull()) c[i] = scalarAs<double>(n[i], "geobound");
		}
		return GeoBound { c[0], c[1], c[2], c[3] };
	}

	DatasetDescriptor datasetFromYaml(const std::string& name, const YAML::Node& n) {
		DatasetDescriptor d;
		d.name = name;
		d.inputFile = name + ".tif";

		if (n.IsNull()) return d;
		if (!n.IsMap()) throw ConfigError(fmt::format("dataset '{}' must be a map", name));
		checkKeys(n, datasetKeys, name);

		if (n["zip_file"]) d.zipFile = scalarAs<std::string>(n["zip_file"], "zip_file");
		if (n["input_file"]) d.inputFile = scalarAs<std::string>(n["input_file"], "input_file");
		if (n["window"]) d.window = windowFromYaml(n["window"], name);
		if (n["mask"]) d.mask = maskFromYaml(n["mask"], name);
		if (n["gcps"]) d.gcps = gcpsFromYaml(n["gcps"], name);
		if (n["geobound"] and !n["geobound"].IsNull()) d.geobound = geoboundFromYaml(n["geobound"], name);
		if (n["antimeridian"]) d.antimeridian = scalarAs<bool>(n["antimeridian"], "antimeridian");
		if (n["max_lod"]) d.maxLod = scalarAs<int>(n["max_lod"], "max_lod");

		if (d.maxLod < 0 or d.maxLod >= MAX_LVLS)
			throw ConfigError(fmt::format("max_lod {} of '{}' must be in [0, {})", d.maxLod, name, MAX_LVLS));
		return d;
	}

	TilesetDescriptor tilesetFromYaml(const std::string& name, const YAML::Node& n) {
		if (!n.IsMap()) throw ConfigError(fmt::format("tileset '{}' must be a map", name));
		checkKeys(n, tilesetKeys, name);

		TilesetDescriptor t;
		t.name = name;
		t.tilePath = n["tile_path"] ? scalarAs<std::string>(n["tile_path"], "tile_path") : name;

		if (!n["datasets"] or !n["datasets"].IsSequence())
			throw ConfigError(fmt::format("tileset '{}' needs a 'datasets' list", name));
		for (const auto& v : n["datasets"]) t.datasets.push_back(scalarAs<std::string>(v, "datasets"));

		if (n["zoom"]) {
			auto z = numberList(n["zoom"], 2, "zoom");
			t.zoom = std::array<int,2>{ (int)z[0], (int)z[1] };
			if ((*t.zoom)[0] < 0 or (*t.zoom)[0] > (*t.zoom)[1] or (*t.zoom)[1] >= MAX_LVLS)
				throw ConfigError(fmt::format("zoom of tileset '{}' must satisfy 0 <= min <= max < {}", name, MAX_LVLS));
		}
		if (n["maxlod_zoom"]) {
			t.maxlodZoom = scalarAs<int>(n["maxlod_zoom"], "maxlod_zoom");
			if (*t.maxlodZoom < 0 or *t.maxlodZoom >= MAX_LVLS)
				throw ConfigError(fmt::format("maxlod_zoom {} of tileset '{}' must be in [0, {})", *t.maxlodZoom, name, MAX_LVLS));
		}
		return t;
	}

}

std::string DatasetDescriptor::sourcePath(const std::string& sourceDir) const {
	if (zipFile.has_value())
		return fmt::format("/vsizip/{}/{}.zip/{}", sourceDir, *zipFile, inputFile);
	return fmt::format("{}/{}", sourceDir, inputFile);
}

std::string DatasetDescriptor::scratchFile(const std::string& scratchDir) const {
	std::string s = name;
	std::replace(s.begin(), s.end(), ' ', '_');
	return fmt::format("{}/_{}.tif", scratchDir, s);
}

Catalog Catalog::load(const std::string& path) {
	YAML::Node root;
	try {
		root = YAML::LoadFile(path);
	} catch (const YAML::BadFile&) {
		throw ConfigError(fmt::format("cannot open descriptor file '{}'", path));
	} catch (const YAML::Exception& e) {
		throw ConfigError(fmt::format("parsing '{}': {}", path, e.what()));
	}
	return fromYaml(root);
}

Catalog Catalog::fromString(const std::string& yaml) {
	YAML::Node root;
	try {
		root = YAML::Load(yaml);
	} catch (const YAML::Exception& e) {
		throw ConfigError(fmt::format("parsing descriptors: {}", e.what()));
	}
	return fromYaml(root);
}

Catalog Catalog::fromYaml(const YAML::Node& root) {
	if (!root.IsMap()) throw ConfigError("top level must be a map with 'datasets' and 'tilesets'");

	Catalog c;

	auto ds = root["datasets"];
	if (!ds or !ds.IsMap()) throw ConfigError("missing 'datasets' map");
	for (const auto& kv : ds) {
		auto name = kv.first.as<std::string>();
		c.datasets_[name] = datasetFromYaml(name, kv.second);
	}

	auto ts = root["tilesets"];
	if (!ts or !ts.IsMap()) throw ConfigError("missing 'tilesets' map");
	for (const auto& kv : ts) {
		auto name = kv.first.as<std::string>();
		auto t = tilesetFromYaml(name, kv.second);
		for (const auto& member : t.datasets) {
			if (!c.haveDataset(member))
				throw ConfigError(fmt::format("tileset '{}' names unknown dataset '{}'", name, member));
		}
		c.tilesetOrder_.push_back(name);
		c.tilesets_[name] = std::move(t);
	}

	return c;
}

const DatasetDescriptor& Catalog::dataset(const std::string& name) const {
	auto it = datasets_.find(name);
	if (it == datasets_.end()) throw ConfigError(fmt::format("no dataset named '{}'", name));
	return it->second;
}
bool Catalog::haveDataset(const std::string& name) const {
	return datasets_.find(name) != datasets_.end();
}

const TilesetDescriptor* Catalog::findTileset(const std::string& nameOrPath) const {
	auto it = tilesets_.find(nameOrPath);
	if (it != tilesets_.end()) return &it->second;
	for (const auto& kv : tilesets_) {
		if (kv.second.tilePath == nameOrPath) return &kv.second;
	}
	return nullptr;
}

const TilesetDescriptor& Catalog::tileset(const std::string& nameOrPath) const {
	auto t = findTileset(nameOrPath);
	if (t == nullptr) throw ConfigError(fmt::format("no tileset named '{}'", nameOrPath));
	return *t;
}
bool Catalog::haveTileset(const std::string& nameOrPath) const {
	return findTileset(nameOrPath) != nullptr;
}

int Catalog::maxLod(const TilesetDescriptor& ts) const {
	int m = 0;
	for (const auto& name : ts.datasets) m = std::max(m, dataset(name).maxLod);
	return m;
}

int Catalog::maxlodZoom(const TilesetDescriptor& ts) const {
	if (ts.maxlodZoom.has_value()) return *ts.maxlodZoom;
	return maxLod(ts);
}

std::array<int,2> Catalog::zoomRange(const TilesetDescriptor& ts) const {
	if (ts.zoom.has_value()) return *ts.zoom;
	return { 0, maxLod(ts) };
}

}
