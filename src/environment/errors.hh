#ifndef ENVKIT_ENVIRONMENT_ERRORS_HH
#define ENVKIT_ENVIRONMENT_ERRORS_HH

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace envkit {
namespace environment {

// A variable that has no value in the environment.
// Carries absl::StatusCode::kNotFound.
absl::Status NotSetError(absl::string_view name);

// A variable whose value cannot be converted to the requested type.
// Carries absl::StatusCode::kInvalidArgument.
absl::Status ParseError(absl::string_view name, absl::string_view value);

bool IsNotSetError(absl::Status const& status);
bool IsParseError(absl::Status const& status);

}  // namespace environment
}  // namespace envkit

#endif  // ENVKIT_ENVIRONMENT_ERRORS_HH
