#include "catch.hpp"

#include <string>

#include "util/string.hh"

using envkit::util::string::Representation;
using envkit::util::string::ToLowerCase;
using envkit::util::string::ToNumber;
using envkit::util::string::ToUpperCase;
using envkit::util::string::Trim;

TEST_CASE("StringRepresentation") {
  SECTION("Numbers") {
    REQUIRE(Representation(1234) == "1234");
    REQUIRE(Representation(-1234) == "-1234");
    REQUIRE(Representation(.1234) == "0.1234");
  }

  SECTION("Strings") {
    REQUIRE(Representation("value") == "value");
    REQUIRE(Representation(std::string{"value"}) == "value");
  }
}

TEST_CASE("Trim", "Leading and trailing whitespace is removed") {
  std::string s;

  s = "  a b  ";
  REQUIRE(Trim(s) == "a b");

  s = "\t\n value\r\v\f";
  REQUIRE(Trim(s) == "value");

  s = "no_whitespace";
  REQUIRE(Trim(s) == "no_whitespace");

  s = " \t ";
  REQUIRE(Trim(s).empty());

  s = "";
  REQUIRE(Trim(s).empty());
}

TEST_CASE("ToLowerCase/ToUpperCase") {
  std::string s = "MiXeD 123";
  ToLowerCase(&s);
  REQUIRE(s == "mixed 123");
  ToUpperCase(&s);
  REQUIRE(s == "MIXED 123");
}

TEST_CASE("ToNumber") {
  SECTION("int") {
    int i;
    REQUIRE(ToNumber("0", &i));
    REQUIRE(i == 0);  // parsed and read correctly
    REQUIRE(ToNumber("900\n", &i));
    REQUIRE(i == 900);  // parsed and read correctly
    REQUIRE(ToNumber("-1234", &i));
    REQUIRE(i == -1234);  // parsed and read correctly
    REQUIRE_FALSE(ToNumber("5678abcd", &i));
    REQUIRE(i == -1234);  // failed parsing, unchanged
    REQUIRE_FALSE(ToNumber("4294967296", &i));
    REQUIRE(i == -1234);  // out of range, unchanged
  }

  SECTION("long long") {
    long long l;
    REQUIRE(ToNumber("9223372036854775807", &l));
    REQUIRE(l == 9223372036854775807LL);
    REQUIRE_FALSE(ToNumber("", &l));
    REQUIRE(l == 9223372036854775807LL);
  }

  SECTION("unsigned") {
    unsigned long long u;
    REQUIRE(ToNumber("18446744073709551615", &u));
    REQUIRE(u == 18446744073709551615ULL);
    REQUIRE_FALSE(ToNumber("-1", &u));
    REQUIRE(u == 18446744073709551615ULL);
  }

  SECTION("float") {
    float f;
    REQUIRE(ToNumber("0", &f));
    REQUIRE(f == 0);  // parsed and read correctly
    REQUIRE(ToNumber("900\n", &f));
    REQUIRE(f == 900);  // parsed and read correctly
    REQUIRE(ToNumber("1.234", &f));
    REQUIRE(f == 1.234f);  // parsed and read correctly
    REQUIRE_FALSE(ToNumber("5.678abcd", &f));
    REQUIRE(f == 1.234f);  // failed parsing, unchanged

    // Out of range values are rejected and writing to the provided pointer
    // is not attempted in such a case.
    float* nptr = nullptr;
    REQUIRE_FALSE(ToNumber("inf", nptr));
    REQUIRE_FALSE(ToNumber("infinity", nptr));
    REQUIRE_FALSE(ToNumber("nan", nptr));
    REQUIRE_FALSE(ToNumber("nan(16)", nptr));
  }

  SECTION("double") {
    double d;
    REQUIRE(ToNumber("-0.5", &d));
    REQUIRE(d == -0.5);
    REQUIRE_FALSE(ToNumber("0.5.1", &d));
    REQUIRE(d == -0.5);
  }
}
