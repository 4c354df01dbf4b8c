#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include "environment/accessor.hh"
#include "environment/source.hh"

namespace {

struct MemoryUnit {
  const char* suffix;
  std::size_t multiplier;
};

const MemoryUnit kMemoryUnits[] = {
    {"KB", std::size_t{1} << 10},
    {"MB", std::size_t{1} << 20},
    {"GB", std::size_t{1} << 30},
};

}  // namespace

namespace envkit {
namespace environment {

const char* const kTruthyTokens[4] = {"true", "1", "yes", "on"};

absl::StatusOr<std::string> GetRequired(std::string const& name) {
  std::string value;
  if (!CurrentSource().Lookup(name, &value)) {
    return NotSetError(name);
  }
  return value;
}

std::string GetOrDefault(std::string const& name,
                         std::string const& default_value) {
  std::string value;
  if (!CurrentSource().Lookup(name, &value)) {
    return default_value;
  }
  return value;
}

bool GetBool(std::string const& name, bool default_value) {
  std::string value;
  if (!CurrentSource().Lookup(name, &value)) {
    return default_value;
  }

  util::string::ToLowerCase(&value);
  for (const char* token : kTruthyTokens) {
    if (value == token) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> GetList(std::string const& name,
                                 absl::string_view separator) {
  std::string value;
  if (!CurrentSource().Lookup(name, &value)) {
    return {};
  }

  if (separator.empty()) {
    return {util::string::Trim(value)};
  }

  std::vector<std::string> parts =
      absl::StrSplit(value, absl::ByString(separator));
  for (auto& part : parts) {
    util::string::Trim(part);
  }
  return parts;
}

absl::StatusOr<std::size_t> ParseMemorySize(absl::string_view input) {
  std::string normalized(input.data(), input.size());
  util::string::Trim(normalized);
  util::string::ToUpperCase(&normalized);

  absl::string_view number = normalized;
  std::size_t multiplier = 1;
  for (auto const& unit : kMemoryUnits) {
    if (absl::ConsumeSuffix(&number, unit.suffix)) {
      multiplier = unit.multiplier;
      break;
    }
  }

  std::size_t size = 0;
  if (!Parse(number, &size) ||
      size > std::numeric_limits<std::size_t>::max() / multiplier) {
    return ParseError("memory_size", normalized);
  }
  return size * multiplier;
}

absl::StatusOr<std::size_t> GetMemorySize(std::string const& name) {
  absl::StatusOr<std::string> value = GetRequired(name);
  if (!value.ok()) {
    return value.status();
  }

  absl::StatusOr<std::size_t> size = ParseMemorySize(*value);
  if (!size.ok()) {
    return ParseError(name, *value);
  }
  return size;
}

}  // namespace environment
}  // namespace envkit
