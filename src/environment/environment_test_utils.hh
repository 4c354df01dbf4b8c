#ifndef ENVKIT_ENVIRONMENT_ENVIRONMENT_TEST_UTILS_HH
#define ENVKIT_ENVIRONMENT_ENVIRONMENT_TEST_UTILS_HH

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include "util/log.hh"
#include "util/string.hh"

// Writers for the process environment. The library itself only ever reads it,
// these exist so tests can arrange the state they read back.

namespace test {

bool Unset(std::string const& key);

template <typename T>
bool Set(std::string const& key, T const& value) {
  std::string value_string = envkit::util::string::Representation(value);
  if (setenv(key.c_str(), value_string.c_str(), 1) != 0) {
    envkit::util::log::Error() << "setenv(" << key
                               << "): " << std::strerror(errno) << '\n';
    return false;
  }
  return true;
}

// ScopedOverride sets a variable in the process environment, and restores its
// previous state (either the old value, or unset) when it goes out of scope.
class ScopedOverride {
 public:
  template <typename T>
  ScopedOverride(std::string const& key, T const& value)
      : key_(key), had_original_value_(false) {
    Install(envkit::util::string::Representation(value));
  }

  ScopedOverride(ScopedOverride const&) = delete;
  ScopedOverride& operator=(ScopedOverride const&) = delete;

  ~ScopedOverride();

 private:
  std::string key_;
  bool had_original_value_;
  std::string original_value_;

  void Install(std::string const& value);
};

// ScopedUnset removes a variable from the process environment, and restores
// it when it goes out of scope.
class ScopedUnset {
 public:
  explicit ScopedUnset(std::string const& key);
  ~ScopedUnset();

  ScopedUnset(ScopedUnset const&) = delete;
  ScopedUnset& operator=(ScopedUnset const&) = delete;

 private:
  std::string key_;
  bool had_original_value_;
  std::string original_value_;
};

}  // namespace test

#endif  // ENVKIT_ENVIRONMENT_ENVIRONMENT_TEST_UTILS_HH
