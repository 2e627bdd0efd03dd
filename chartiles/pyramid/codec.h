#pragma once

#include "chartiles/coordinates.h"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace chartiles {

enum class TileFormat {
	PNG  = 0,
	JPEG = 1,
	WEBP = 2
};

// png, jpeg (or jpg), webp. Throws ConfigError otherwise.
TileFormat parseTileFormat(const std::string& s);
const char* extensionOf(TileFormat f);

// `<root>/{z}/{x}/{y}.<ext>`
std::string tilePath(const std::string& root, const TileCoordinate& tc, TileFormat f);

// True iff every alpha sample of a BGRA tile is 0.
bool isTransparent(const cv::Mat& bgra);

// Encode a BGRA tile. JPEG drops alpha.
std::vector<uint8_t> encodeTile(const cv::Mat& bgra, TileFormat f);

// Decode to BGRA. Images without alpha are opaque.
cv::Mat decodeTile(const std::vector<uint8_t>& buf);

// Empty Mat if the file is missing.
cv::Mat readTile(const std::string& path);

// Creates parent directories, writes through `<path>.partial`. Throws std::runtime_error.
void writeTile(const std::string& path, const cv::Mat& bgra, TileFormat f);

}
