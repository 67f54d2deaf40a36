#include <catch2/catch_test_macros.hpp>
#include <string>

#include <afopt/error.hpp>
#include <afopt/time_codec.hpp>

using namespace afopt;

TEST_CASE("parse_time reads MM:SS:CC as centiseconds") {
  REQUIRE(parse_time("00:00:00") == 0);
  REQUIRE(parse_time("01:02:03") == 6000 + 200 + 3);
  REQUIRE(parse_time("12:34:56") == 12 * 6000 + 34 * 100 + 56);

  SECTION("period separator and surrounding spaces accepted") {
    REQUIRE(parse_time("01:02.03") == 6203);
    REQUIRE(parse_time("  01:02:03 ") == 6203);
  }

  SECTION("no range validation on seconds or centiseconds") {
    REQUIRE(parse_time("00:75:150") == 75 * 100 + 150);
  }
}

TEST_CASE("parse_time rejects malformed text") {
  REQUIRE_THROWS_AS(parse_time("01:02"), FormatError);
  REQUIRE_THROWS_AS(parse_time("01:02:03:04"), FormatError);
  REQUIRE_THROWS_AS(parse_time("aa:02:03"), FormatError);
  REQUIRE_THROWS_AS(parse_time("01::03"), FormatError);
  REQUIRE_THROWS_AS(parse_time(""), FormatError);
  REQUIRE_THROWS_AS(parse_time("1m:02:03"), FormatError);
}

TEST_CASE("try_parse_time mirrors parse_time without throwing") {
  REQUIRE(try_parse_time("00:59:99").value() == 5999);
  REQUIRE_FALSE(try_parse_time("N/A").has_value());
  REQUIRE_FALSE(try_parse_time("01:02").has_value());
}

TEST_CASE("format_time renders MM:SS.CC") {
  REQUIRE(format_time(0) == "00:00.00");
  REQUIRE(format_time(6203) == "01:02.03");
  REQUIRE(format_time(5999) == "00:59.99");
  REQUIRE(format_time(6000) == "01:00.00");
  REQUIRE(format_time(99 * 6000 + 5999) == "99:59.99");
}

TEST_CASE("parse_time and format_time are inverse") {
  SECTION("parse(format(n)) == n") {
    for (Centis n : {0LL, 1LL, 99LL, 100LL, 5999LL, 6000LL, 6001LL, 123456LL, 599999LL}) {
      REQUIRE(parse_time(format_time(n)) == n);
    }
  }
  SECTION("format(parse(s)) == s for two-digit fields") {
    for (const char* s : {"00:00.00", "01:23.45", "09:59.99", "59:00.01"}) {
      REQUIRE(format_time(parse_time(s)) == s);
    }
  }
}
