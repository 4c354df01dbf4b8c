#include "catch.hpp"

#include "environment/errors.hh"

using envkit::environment::IsNotSetError;
using envkit::environment::IsParseError;
using envkit::environment::NotSetError;
using envkit::environment::ParseError;

TEST_CASE("NotSetError") {
  absl::Status status = NotSetError("USERNAME");
  REQUIRE(status.code() == absl::StatusCode::kNotFound);
  REQUIRE(status.message() == "Environment variable `USERNAME` is not set");
  REQUIRE(IsNotSetError(status));
  REQUIRE_FALSE(IsParseError(status));
}

TEST_CASE("ParseError") {
  absl::Status status = ParseError("PORT", "eighty");
  REQUIRE(status.code() == absl::StatusCode::kInvalidArgument);
  REQUIRE(status.message() ==
          "Failed to parse environment variable `PORT`: eighty");
  REQUIRE(IsParseError(status));
  REQUIRE_FALSE(IsNotSetError(status));
}

TEST_CASE("OkStatus", "Neither predicate matches a successful status") {
  REQUIRE_FALSE(IsNotSetError(absl::OkStatus()));
  REQUIRE_FALSE(IsParseError(absl::OkStatus()));
}
