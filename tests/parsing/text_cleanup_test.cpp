#include "parsing/text_cleanup.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using topocrawl::parsing::CleanText;
using topocrawl::parsing::CleanValue;

TEST_CASE("CleanText normalizes line endings", "[parsing][cleanup]") {
  REQUIRE(CleanText("a\r\nb\rc\n") == "a\nb\nc\n");
}

TEST_CASE("CleanText removes color and erase-line sequences whole", "[parsing][cleanup]") {
  REQUIRE(CleanText("\x1b[1;32mR1#\x1b[0m") == "R1#");
  REQUIRE(CleanText("--More--\x1b[K line") == "--More-- line");
}

TEST_CASE("CleanText keeps tabs and drops other control characters", "[parsing][cleanup]") {
  REQUIRE(CleanText("a\tb\x07\x08c") == "a\tbc");
  REQUIRE(CleanText(std::string("x\xc2\x85y")) == "xy");
}

TEST_CASE("CleanValue strips every control character and trims", "[parsing][cleanup]") {
  REQUIRE(CleanValue("  Gi0/1\t\n ") == "Gi0/1");
  REQUIRE(CleanValue("\x1b") == "");
  REQUIRE(CleanValue("   ") == "");
}
