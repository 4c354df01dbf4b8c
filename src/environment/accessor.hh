#ifndef ENVKIT_ENVIRONMENT_ACCESSOR_HH
#define ENVKIT_ENVIRONMENT_ACCESSOR_HH

#include <cstddef>
#include <istream>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/string_view.h"

#include "environment/errors.hh"
#include "util/string.hh"

// Typed accessors over the environment.
//
// All accessors read through environment::CurrentSource(), which is the process
// environment unless a test installed something else with SetSource(). None of
// them writes to the environment, or logs.

namespace envkit {
namespace environment {

// Parser<T>::Parse(text, &out) converts text into a T. It returns true on
// success, and false leaving out untouched otherwise.
//
// Types without a specialization are read through operator>>, and the whole
// text (except trailing whitespace) must be consumed.
template <typename T, typename Enable = void>
struct Parser {
  static bool Parse(absl::string_view text, T* out) {
    std::istringstream ss{std::string(text)};
    T value;
    if (!(ss >> value)) {
      return false;
    }
    ss >> std::ws;
    if (!ss.eof()) {
      return false;
    }
    (*out) = std::move(value);
    return true;
  }
};

// Integers of any width are read into a 64 bit integer of the same signedness,
// then range checked. Plain char is a character, not a number, and goes through
// operator>> like any other type.
template <typename T>
struct Parser<T, typename std::enable_if<std::is_integral<T>::value &&
                                         !std::is_same<T, bool>::value &&
                                         !std::is_same<T, char>::value>::type> {
  using Wide = typename std::conditional<std::is_signed<T>::value, long long,
                                         unsigned long long>::type;

  static bool Parse(absl::string_view text, T* out) {
    Wide value = 0;
    if (!util::string::ToNumber(text, &value)) {
      return false;
    }
    if (value < static_cast<Wide>(std::numeric_limits<T>::min()) ||
        value > static_cast<Wide>(std::numeric_limits<T>::max())) {
      return false;
    }
    (*out) = static_cast<T>(value);
    return true;
  }
};

template <>
struct Parser<float> {
  static bool Parse(absl::string_view text, float* out) {
    return util::string::ToNumber(text, out);
  }
};

template <>
struct Parser<double> {
  static bool Parse(absl::string_view text, double* out) {
    return util::string::ToNumber(text, out);
  }
};

// Accepts "true", "t", "yes", "y", "1" and "false", "f", "no", "n", "0",
// case-insensitively. This is stricter than GetBool(), which maps anything it
// doesn't recognize to false.
template <>
struct Parser<bool> {
  static bool Parse(absl::string_view text, bool* out) {
    return absl::SimpleAtob(text, out);
  }
};

template <>
struct Parser<std::string> {
  static bool Parse(absl::string_view text, std::string* out) {
    out->assign(text.data(), text.size());
    return true;
  }
};

template <typename T>
bool Parse(absl::string_view text, T* out) {
  return Parser<T>::Parse(text, out);
}

// Returns the value of name, verbatim. Fails with NotSetError if it's not set.
absl::StatusOr<std::string> GetRequired(std::string const& name);

// Returns the value of name, or default_value if it's not set.
std::string GetOrDefault(std::string const& name,
                         std::string const& default_value);

// Returns the value of name converted to T. Fails with NotSetError if it's not
// set, and with ParseError if the value can't be converted.
template <typename T>
absl::StatusOr<T> GetParsed(std::string const& name) {
  absl::StatusOr<std::string> value = GetRequired(name);
  if (!value.ok()) {
    return value.status();
  }

  T parsed{};
  if (!Parse(*value, &parsed)) {
    return ParseError(name, *value);
  }
  return parsed;
}

// Returns the value of name converted to T, or default_value if it's either
// not set or not convertible.
template <typename T>
T GetParsedOrDefault(std::string const& name, T const& default_value) {
  absl::StatusOr<T> parsed = GetParsed<T>(name);
  if (!parsed.ok()) {
    return default_value;
  }
  return *std::move(parsed);
}

// Returns true if name is set to one of kTruthyTokens, ignoring case. Any other
// value is false. If name is not set, default_value is returned.
extern const char* const kTruthyTokens[4];
bool GetBool(std::string const& name, bool default_value = false);

// Splits the value of name on separator, and trims leading and trailing ASCII
// whitespace from every element. Empty elements are kept. If name is not set,
// an empty vector is returned. An empty separator doesn't split.
std::vector<std::string> GetList(std::string const& name,
                                 absl::string_view separator = ",");

// Parses a size in bytes, with an optional KB, MB or GB suffix (powers of 1024,
// case-insensitive), such as "512", "512KB" or "1gb". Fails with ParseError on
// malformed input, or if the size doesn't fit in std::size_t.
absl::StatusOr<std::size_t> ParseMemorySize(absl::string_view input);

// GetRequired() followed by ParseMemorySize(). Parse failures name the
// variable.
absl::StatusOr<std::size_t> GetMemorySize(std::string const& name);

}  // namespace environment
}  // namespace envkit

#endif  // ENVKIT_ENVIRONMENT_ACCESSOR_HH
