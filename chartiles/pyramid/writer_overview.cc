#include "writer.h"

#include <fmt/core.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chartiles {

namespace {
	bool parseIndex(const std::string& s, uint32_t& out) {
		const char* end = s.data() + s.size();
		auto res = std::from_chars(s.data(), end, out);
		return res.ec == std::errc{} and res.ptr == end;
	}
}

cv::Mat composeParent(const cv::Mat& a_, const cv::Mat& b_, const cv::Mat& c_, const cv::Mat& d_) {
	cv::Mat imga = a_, imgb = b_, imgc = c_, imgd = d_;

	for (cv::Mat* m : {&imga, &imgb, &imgc, &imgd}) {
		if (m->empty()) *m = cv::Mat::zeros(TileSize, TileSize, CV_8UC4);
		else if (m->type() != CV_8UC4 or m->rows != TileSize or m->cols != TileSize)
			throw std::runtime_error(fmt::format("composeParent: child tile is {}x{} type {}, need {}x{} BGRA",
						m->cols, m->rows, m->type(), TileSize, TileSize));
	}

	// Make joined image. Row 0 is north, so the y-up children land bottom first.
	int th = TileSize;
	int tw = TileSize;
	cv::Mat img(th*2, tw*2, CV_8UC4);

	imga.copyTo(img(cv::Rect{0,th,tw,th}));
	imgb.copyTo(img(cv::Rect{0,0,tw,th}));
	imgc.copyTo(img(cv::Rect{tw,th,tw,th}));
	imgd.copyTo(img(cv::Rect{tw,0,tw,th}));

	// Half-scale it
	cv::Mat out;
	cv::resize(img, out, cv::Size{TileSize, TileSize}, 0, 0, cv::INTER_AREA);
	return out;
}

TileOutcome buildOverviewTile(const std::string& root, const TileCoordinate& above, TileFormat f) {
	std::string path = tilePath(root, above, f);
	std::error_code ec;
	if (fs::exists(path, ec)) return TileOutcome::SkippedExisting;

	uint64_t z = above.z() + 1;
	uint64_t yUp = above.yUp();
	uint64_t n = 1lu << z;

	// Children in y-up order, flipped back to XYZ rows for the file names.
	auto child = [&](uint64_t cyUp, uint64_t cx) {
		return readTile(tilePath(root, TileCoordinate{z, n - 1 - cyUp, cx}, f));
	};
	cv::Mat imga = child((yUp<<1)+0, (above.x()<<1)+0);
	cv::Mat imgb = child((yUp<<1)+1, (above.x()<<1)+0);
	cv::Mat imgc = child((yUp<<1)+0, (above.x()<<1)+1);
	cv::Mat imgd = child((yUp<<1)+1, (above.x()<<1)+1);

	if (imga.empty() and imgb.empty() and imgc.empty() and imgd.empty())
		return TileOutcome::SkippedTransparent;

	cv::Mat img = composeParent(imga, imgb, imgc, imgd);
	if (isTransparent(img)) return TileOutcome::SkippedTransparent;

	writeTile(path, img, f);
	return TileOutcome::Written;
}

std::vector<TileCoordinate> scanZoom(const std::string& root, int z, TileFormat f) {
	std::vector<TileCoordinate> out;

	fs::path zdir = fs::path(root) / std::to_string(z);
	std::error_code ec;
	if (!fs::is_directory(zdir, ec)) return out;

	std::string ext = std::string{"."} + extensionOf(f);
	uint32_t n = 1u << z;

	for (const auto& xdir : fs::directory_iterator(zdir)) {
		uint32_t x;
		if (!xdir.is_directory() or !parseIndex(xdir.path().filename().string(), x) or x >= n) continue;

		for (const auto& file : fs::directory_iterator(xdir.path())) {
			// `.partial` leftovers have a different extension and fall out here.
			if (!file.is_regular_file() or file.path().extension() != ext) continue;
			uint32_t y;
			if (!parseIndex(file.path().stem().string(), y) or y >= n) continue;
			out.push_back(TileCoordinate{(uint64_t)z, y, x});
		}
	}

	std::sort(out.begin(), out.end());
	return out;
}

ZoomCounters buildOverviewZoom(const std::string& root, int z, TileFormat f, const Log& log) {
	ZoomCounters counts;

	std::vector<TileCoordinate> parents;
	for (const auto& tc : scanZoom(root, z+1, f)) parents.push_back(tc.parent());
	std::sort(parents.begin(), parents.end());
	parents.erase(std::unique(parents.begin(), parents.end()), parents.end());

	log.info(" - Overview zoom {}: {} parents\n", z, parents.size());

	for (const auto& parent : parents) {
		try {
			counts.add(buildOverviewTile(root, parent, f));
		} catch (const std::exception& e) {
			counts.failed++;
			log.error(" - Overview tile {}/{}/{} failed: {}\n", parent.z(), parent.x(), parent.y(), e.what());
		}
	}

	return counts;
}

}
