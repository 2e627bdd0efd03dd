#pragma once

#include <string>
#include <vector>

namespace chartiles {

struct StackMember {
	std::string dataset;
	std::string path;
	int maxLod;
};

//
// Rasters composited for one (tileset, zoom). Members paint in order, so the last one ends up on top.
//
struct MosaicStack {
	std::string tileset;
	int zoom;
	std::vector<StackMember> members;
	std::string vrtPath;
};

// Members eligible at `zoom` (max_lod >= zoom), stably sorted by max_lod descending.
std::vector<StackMember> orderStack(const std::vector<StackMember>& candidates, int zoom);

// All members must agree on band count, data type and color interpretation. Throws MosaicMismatchError.
void checkStackCompatible(const std::vector<StackMember>& members, int zoom);

// `<scratchDir>/__<tileset>__z<zoom>.vrt`
std::string stackVrtPath(const std::string& scratchDir, const std::string& tileset, int zoom);

//
// Orders and checks the candidates whose rasters exist, then writes the mosaic declaration
// at the finest member resolution.
// Throws ZoomLevelError (MosaicMismatchError on a band mismatch). An empty stack is also an error.
//
MosaicStack buildMosaicStack(const std::string& tileset, int zoom, const std::vector<StackMember>& candidates,
		const std::string& scratchDir);

}
