#include "absl/strings/str_cat.h"

#include "environment/errors.hh"

namespace envkit {
namespace environment {

absl::Status NotSetError(absl::string_view name) {
  return absl::NotFoundError(
      absl::StrCat("Environment variable `", name, "` is not set"));
}

absl::Status ParseError(absl::string_view name, absl::string_view value) {
  return absl::InvalidArgumentError(absl::StrCat(
      "Failed to parse environment variable `", name, "`: ", value));
}

bool IsNotSetError(absl::Status const& status) {
  return absl::IsNotFound(status);
}

bool IsParseError(absl::Status const& status) {
  return absl::IsInvalidArgument(status);
}

}  // namespace environment
}  // namespace envkit
