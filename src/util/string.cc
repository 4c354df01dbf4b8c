#include <algorithm>
#include <cctype>
#include <cmath>

#include "absl/strings/numbers.h"

#include "util/string.hh"

namespace {

template <typename T>
bool ToInteger(absl::string_view str, T* ptr) {
  T value{};
  if (!absl::SimpleAtoi(str, &value)) {
    return false;
  }
  (*ptr) = value;
  return true;
}

template <typename T>
bool ToFloatingPoint(absl::string_view str, T* ptr,
                     bool (*parse)(absl::string_view, T*)) {
  T value{};
  if (!parse(str, &value) || !std::isfinite(value)) {
    return false;
  }
  (*ptr) = value;
  return true;
}

}  // namespace

namespace envkit {
namespace util {
namespace string {

std::string& Trim(std::string& str) {
  static char const* space_chars = " \f\n\r\t\v";

  auto first = str.find_first_not_of(space_chars);

  if (first == std::string::npos) {
    str.clear();
    return str;
  }

  auto last = str.find_last_not_of(space_chars);

  str.erase(0, first);
  str.erase(last - first + 1, std::string::npos);
  return str;
}

void ToLowerCase(std::string* str) {
  std::transform(str->begin(), str->end(), str->begin(), [](char c) -> char {
    return std::tolower(static_cast<unsigned char>(c));
  });
}

void ToUpperCase(std::string* str) {
  std::transform(str->begin(), str->end(), str->begin(), [](char c) -> char {
    return std::toupper(static_cast<unsigned char>(c));
  });
}

bool ToNumber(absl::string_view str, int* ptr) { return ToInteger(str, ptr); }

bool ToNumber(absl::string_view str, long* ptr) { return ToInteger(str, ptr); }

bool ToNumber(absl::string_view str, long long* ptr) {
  return ToInteger(str, ptr);
}

bool ToNumber(absl::string_view str, unsigned int* ptr) {
  return ToInteger(str, ptr);
}

bool ToNumber(absl::string_view str, unsigned long* ptr) {
  return ToInteger(str, ptr);
}

bool ToNumber(absl::string_view str, unsigned long long* ptr) {
  return ToInteger(str, ptr);
}

bool ToNumber(absl::string_view str, float* ptr) {
  return ToFloatingPoint<float>(str, ptr, &absl::SimpleAtof);
}

bool ToNumber(absl::string_view str, double* ptr) {
  return ToFloatingPoint<double>(str, ptr, &absl::SimpleAtod);
}

}  // namespace string
}  // namespace util
}  // namespace envkit
