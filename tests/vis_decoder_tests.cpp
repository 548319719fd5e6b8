#include <catch2/catch_all.hpp>

#include "logmux/vis_decoder.hpp"

using Logmux::decode_syslog;
using Logmux::is_valid_utf8;

TEST_CASE("decode_syslog leaves plain text alone", "[vis_decoder]") {
  REQUIRE(decode_syslog("").empty());
  REQUIRE(decode_syslog("flutter: hello world") == "flutter: hello world");
  REQUIRE(decode_syslog("already decoded \xc3\xa9") == "already decoded \xc3\xa9");
}

TEST_CASE("decode_syslog decodes each escape form", "[vis_decoder]") {
  SECTION("Meta-dash escapes give the high byte directly") {
    // U+00E9 is 0xC3 0xA9.
    REQUIRE(decode_syslog(R"(caf\M-C\M-))") == "caf\xc3\xa9");
  }

  SECTION("Meta-caret escapes give 0x80 to 0x9f") {
    // U+2019 is 0xE2 0x80 0x99.
    REQUIRE(decode_syslog(R"(it\M-b\M^@\M^Ys)") == "it\xe2\x80\x99s");
  }

  SECTION("Three digit octal escapes") {
    REQUIRE(decode_syslog(R"(it\342\200\231s)") == "it\xe2\x80\x99s");
    REQUIRE(decode_syslog(R"(\101\102)") == "AB");
  }

  SECTION("Forms can be mixed in one line") {
    REQUIRE(decode_syslog(R"(flutter: \M-b\200\M^Y ok)") ==
            "flutter: \xe2\x80\x99 ok");
  }
}

TEST_CASE("decode_syslog copies what it cannot decode", "[vis_decoder]") {
  SECTION("Unknown escapes are copied verbatim") {
    REQUIRE(decode_syslog(R"(path\abcd)") == R"(path\abcd)");
    REQUIRE(decode_syslog(R"(\M+x)") == R"(\M+x)");
  }

  SECTION("Octal needs three digits") {
    REQUIRE(decode_syslog(R"(\12x)") == R"(\12x)");
  }

  SECTION("Escapes cut off by the end of the line are kept") {
    REQUIRE(decode_syslog(R"(tail\M-)") == R"(tail\M-)");
    REQUIRE(decode_syslog(R"(tail\)") == R"(tail\)");
    REQUIRE(decode_syslog(R"(\34)") == R"(\34)");
  }

  SECTION("An undecodable result returns the original line") {
    // A lone lead byte is not valid UTF-8.
    REQUIRE(decode_syslog(R"(bad \M-C end)") == R"(bad \M-C end)");
    REQUIRE(decode_syslog(R"(\377)") == R"(\377)");
  }
}

TEST_CASE("is_valid_utf8", "[vis_decoder]") {
  REQUIRE(is_valid_utf8(""));
  REQUIRE(is_valid_utf8("ascii only"));
  REQUIRE(is_valid_utf8("\xc3\xa9\xe2\x80\x99\xf0\x9f\x98\x80"));

  REQUIRE_FALSE(is_valid_utf8("\xc3"));
  REQUIRE_FALSE(is_valid_utf8("\x80"));
  REQUIRE_FALSE(is_valid_utf8("\xc0\xaf"));         // overlong
  REQUIRE_FALSE(is_valid_utf8("\xed\xa0\x80"));     // surrogate
  REQUIRE_FALSE(is_valid_utf8("\xf4\x90\x80\x80")); // above U+10FFFF
  REQUIRE_FALSE(is_valid_utf8("\xff"));
}
