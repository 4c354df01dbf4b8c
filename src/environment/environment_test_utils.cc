#include "environment/environment_test_utils.hh"

namespace test {

bool Unset(std::string const& key) {
  if (unsetenv(key.c_str()) != 0) {
    envkit::util::log::Error() << "unsetenv(" << key
                               << "): " << std::strerror(errno) << '\n';
    return false;
  }
  return true;
}

void ScopedOverride::Install(std::string const& value) {
  // getenv() returns a pointer into the environment block, which setenv()
  // may invalidate: copy the original value before overwriting it.
  char const* original_value = getenv(key_.c_str());
  if (original_value != nullptr) {
    had_original_value_ = true;
    original_value_ = original_value;
  }
  Set(key_, value);
}

ScopedOverride::~ScopedOverride() {
  if (had_original_value_) {
    Set(key_, original_value_);
  } else {
    Unset(key_);
  }
}

ScopedUnset::ScopedUnset(std::string const& key)
    : key_(key), had_original_value_(false) {
  char const* original_value = getenv(key_.c_str());
  if (original_value != nullptr) {
    had_original_value_ = true;
    original_value_ = original_value;
  }
  Unset(key_);
}

ScopedUnset::~ScopedUnset() {
  if (had_original_value_) {
    Set(key_, original_value_);
  }
}

}  // namespace test
