#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "codec.h"
#include "chartiles/errors.h"

#include <filesystem>
#include <fstream>

using namespace chartiles;
namespace fs = std::filesystem;

TEST_CASE( "tile-format", "[codec]" ) {
	REQUIRE(parseTileFormat("png") == TileFormat::PNG);
	REQUIRE(parseTileFormat("jpg") == TileFormat::JPEG);
	REQUIRE(parseTileFormat("jpeg") == TileFormat::JPEG);
	REQUIRE(parseTileFormat("webp") == TileFormat::WEBP);
	REQUIRE_THROWS_AS(parseTileFormat("gif"), ConfigError);

	REQUIRE(tilePath("/out/sec", TileCoordinate(7, 45, 20), TileFormat::PNG) == "/out/sec/7/20/45.png");
	REQUIRE(tilePath("/out/sec", TileCoordinate(7, 45, 20), TileFormat::JPEG) == "/out/sec/7/20/45.jpg");
}

TEST_CASE( "transparency", "[codec]" ) {
	cv::Mat img = cv::Mat::zeros(TileSize, TileSize, CV_8UC4);
	REQUIRE(isTransparent(img));

	// One covered pixel away from the sampled ones is enough.
	img.at<cv::Vec4b>(10, 200)[3] = 1;
	REQUIRE(!isTransparent(img));

	// Colour under zero alpha does not count.
	cv::Mat colored(TileSize, TileSize, CV_8UC4, cv::Scalar(90, 80, 70, 0));
	REQUIRE(isTransparent(colored));
}

TEST_CASE( "codec-alpha", "[codec]" ) {
	cv::Mat img(TileSize, TileSize, CV_8UC4, cv::Scalar(10, 20, 30, 255));
	img(cv::Rect{0, 0, 128, 256}).setTo(cv::Scalar(0, 0, 0, 0));

	cv::Mat png = decodeTile(encodeTile(img, TileFormat::PNG));
	REQUIRE(png.type() == CV_8UC4);
	REQUIRE(png.at<cv::Vec4b>(5, 5)[3] == 0);
	REQUIRE(png.at<cv::Vec4b>(5, 200) == cv::Vec4b(10, 20, 30, 255));

	// JPEG has no alpha and decodes opaque.
	cv::Mat jpg = decodeTile(encodeTile(img, TileFormat::JPEG));
	REQUIRE(jpg.type() == CV_8UC4);
	REQUIRE(jpg.at<cv::Vec4b>(5, 5)[3] == 255);
}

TEST_CASE( "tile-files", "[codec]" ) {
	auto root = (fs::temp_directory_path() / "chartiles_test_codec").string();
	fs::remove_all(root);

	std::string path = tilePath(root, TileCoordinate(2, 1, 3), TileFormat::PNG);
	REQUIRE(readTile(path).empty());

	cv::Mat img(TileSize, TileSize, CV_8UC4, cv::Scalar(1, 2, 3, 255));
	writeTile(path, img, TileFormat::PNG);
	REQUIRE(fs::exists(path));
	REQUIRE(!fs::exists(path + ".partial"));
	REQUIRE(readTile(path).at<cv::Vec4b>(100, 100) == cv::Vec4b(1, 2, 3, 255));

	// Writing over an existing tile is fine too, directories already being there.
	writeTile(path, img, TileFormat::PNG);

	{ std::ofstream(root + "/junk.png") << "junk"; }
	REQUIRE_THROWS(readTile(root + "/junk.png"));
}
