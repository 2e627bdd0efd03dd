#include <catch2/catch_test_macros.hpp>

#include "argparse.hpp"

#include <vector>

using namespace chartiles;

namespace {
	ArgParser parse(std::vector<const char*> args) {
		args.insert(args.begin(), "chartiles");
		return ArgParser(static_cast<int>(args.size()), const_cast<char**>(args.data()));
	}
}

TEST_CASE( "argparse-choices", "[argparse]" ) {
	auto p = parse({ "-f", "webp", "--tile-resampling", "cubic", "-q" });

	REQUIRE(p.getChoice2("-f", "--format", "png", "jpeg", "webp") == std::string("webp"));
	REQUIRE(p.getChoice("--tile-resampling", "nearest", "bilinear", "cubic") == std::string("cubic"));
	REQUIRE(p.have2("-q", "--quiet"));

	// Absent keys give nothing, so the caller's default applies.
	REQUIRE(!p.getChoice("--reproject-resampling", "nearest", "bilinear").has_value());
	REQUIRE(p.getChoice2("-x", "--xx", "a", "b").value_or("a") == "a");

	// The long spelling is found too.
	auto q = parse({ "--format", "jpeg" });
	REQUIRE(q.getChoice2("-f", "--format", "png", "jpeg", "webp") == std::string("jpeg"));

	auto bad = parse({ "--tile-resampling", "fancy", "--format=gif" });
	REQUIRE_THROWS_AS(bad.getChoice("--tile-resampling", "nearest", "bilinear"), std::runtime_error);
	REQUIRE_THROWS_AS(bad.getChoice2("-f", "--format", "png", "jpeg", "webp"), std::runtime_error);
}
