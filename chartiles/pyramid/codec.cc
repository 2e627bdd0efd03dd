#include "codec.h"

#include "chartiles/errors.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <fmt/core.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace chartiles {

TileFormat parseTileFormat(const std::string& s) {
	if (s == "png") return TileFormat::PNG;
	if (s == "jpeg" or s == "jpg") return TileFormat::JPEG;
	if (s == "webp") return TileFormat::WEBP;
	throw ConfigError(fmt::format("unknown tile format '{}'", s));
}

const char* extensionOf(TileFormat f) {
	switch (f) {
		case TileFormat::PNG: return "png";
		case TileFormat::JPEG: return "jpg";
		case TileFormat::WEBP: return "webp";
	}
	return "png";
}

std::string tilePath(const std::string& root, const TileCoordinate& tc, TileFormat f) {
	return fmt::format("{}/{}/{}/{}.{}", root, tc.z(), tc.x(), tc.y(), extensionOf(f));
}

bool isTransparent(const cv::Mat& bgra) {
	if (bgra.channels() != 4) return false;

	// Check a few pixels first.
	if (bgra.data[3] != 0 or bgra.at<cv::Vec4b>(bgra.rows/2, bgra.cols/2)[3] != 0) return false;

	cv::Mat alpha;
	cv::extractChannel(bgra, alpha, 3);
	return cv::countNonZero(alpha) == 0;
}

std::vector<uint8_t> encodeTile(const cv::Mat& bgra, TileFormat f) {
	std::vector<uint8_t> buf;
	bool stat = false;

	if (f == TileFormat::JPEG) {
		cv::Mat bgr;
		cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
		stat = cv::imencode(".jpg", bgr, buf, { cv::IMWRITE_JPEG_QUALITY, 90 });
	} else if (f == TileFormat::WEBP) {
		stat = cv::imencode(".webp", bgra, buf, { cv::IMWRITE_WEBP_QUALITY, 90 });
	} else {
		stat = cv::imencode(".png", bgra, buf);
	}

	if (!stat) throw std::runtime_error(fmt::format("encoding .{} tile failed", extensionOf(f)));
	return buf;
}

cv::Mat decodeTile(const std::vector<uint8_t>& buf) {
	cv::Mat img = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
	if (img.empty()) return img;

	if (img.channels() == 1) cv::cvtColor(img,img, cv::COLOR_GRAY2BGRA);
	else if (img.channels() == 3) cv::cvtColor(img,img, cv::COLOR_BGR2BGRA);
	return img;
}

cv::Mat readTile(const std::string& path) {
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) return cv::Mat{};

	std::vector<uint8_t> buf { std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>() };
	cv::Mat img = decodeTile(buf);
	if (img.empty()) throw std::runtime_error(fmt::format("cannot decode tile '{}'", path));
	return img;
}

void writeTile(const std::string& path, const cv::Mat& bgra, TileFormat f) {
	auto buf = encodeTile(bgra, f);

	std::error_code ec;
	fs::create_directories(fs::path(path).parent_path(), ec);
	if (ec) throw BadFileError(fs::path(path).parent_path().string(), ec.value());

	std::string partial = path + ".partial";
	{
		std::ofstream ofs(partial, std::ios::binary);
		if (!ofs) throw BadFileError(partial, errno);
		ofs.write(reinterpret_cast<const char*>(buf.data()), buf.size());
		if (!ofs) throw BadFileError(partial, errno);
	}

	if (std::rename(partial.c_str(), path.c_str()) != 0) throw BadFileError(path, errno);
}

}
