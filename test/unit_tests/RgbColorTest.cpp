#include "RgbColor.hpp"

#include "TestHeaders.hpp"

using namespace muxcore;

TEST_CASE("Colors parse from hex", "[RgbColor]") {
  REQUIRE(RgbColor::parse("#fbf1c7") == RgbColor(0xfb, 0xf1, 0xc7));
  REQUIRE(RgbColor::parse("#FBF1C7") == RgbColor(0xfb, 0xf1, 0xc7));
  REQUIRE(RgbColor::parse(" #000000 ") == RgbColor(0, 0, 0));
  REQUIRE(RgbColor::parse("#f0a") == RgbColor(0xff, 0x00, 0xaa));
  REQUIRE(RgbColor(0xfb, 0xf1, 0xc7).toHexString() == "#fbf1c7");
}

TEST_CASE("Malformed colors are rejected", "[RgbColor]") {
  REQUIRE_THROWS_AS(RgbColor::parse(""), std::runtime_error);
  REQUIRE_THROWS_AS(RgbColor::parse("fbf1c7"), std::runtime_error);
  REQUIRE_THROWS_AS(RgbColor::parse("#fbf1c"), std::runtime_error);
  REQUIRE_THROWS_AS(RgbColor::parse("#gggggg"), std::runtime_error);
  REQUIRE_THROWS_AS(RgbColor::parse("red"), std::runtime_error);
}
