#ifndef ENVKIT_UTIL_STRING_HH
#define ENVKIT_UTIL_STRING_HH

#include <sstream>
#include <string>

#include "absl/strings/string_view.h"

namespace envkit {
namespace util {
namespace string {

template <typename T>
std::string Representation(T const& value) {
  std::ostringstream ss;
  ss << value;
  return ss.str();
}

// Removes leading and trailing ASCII whitespace (" \f\n\r\t\v") in place.
std::string& Trim(std::string& str);

void ToLowerCase(std::string* str);
void ToUpperCase(std::string* str);

// ToNumber parses the whole of str (surrounding whitespace allowed) and stores
// the result in *ptr. On failure *ptr is left untouched and false is returned.
// Infinities and NaN are rejected for floating point types.
bool ToNumber(absl::string_view str, int* ptr);
bool ToNumber(absl::string_view str, long* ptr);
bool ToNumber(absl::string_view str, long long* ptr);
bool ToNumber(absl::string_view str, unsigned int* ptr);
bool ToNumber(absl::string_view str, unsigned long* ptr);
bool ToNumber(absl::string_view str, unsigned long long* ptr);
bool ToNumber(absl::string_view str, float* ptr);
bool ToNumber(absl::string_view str, double* ptr);

}  // namespace string
}  // namespace util
}  // namespace envkit

#endif  // ENVKIT_UTIL_STRING_HH
