#ifndef ENVKIT_ENVIRONMENT_SOURCE_TEST_UTILS_HH
#define ENVKIT_ENVIRONMENT_SOURCE_TEST_UTILS_HH

#include <initializer_list>
#include <string>
#include <utility>

#include "environment/source.hh"

namespace test {

// ScopedFakeEnvironment installs a MapSource for its lifetime, and restores
// the previously installed source when it goes out of scope.
class ScopedFakeEnvironment {
 public:
  ScopedFakeEnvironment(
      std::initializer_list<std::pair<const std::string, std::string>> values);
  ~ScopedFakeEnvironment();

  ScopedFakeEnvironment(ScopedFakeEnvironment const&) = delete;
  ScopedFakeEnvironment& operator=(ScopedFakeEnvironment const&) = delete;

  envkit::environment::MapSource& source() { return source_; }

 private:
  envkit::environment::MapSource source_;
  envkit::environment::Source* original_source_;
};

}  // namespace test

#endif  // ENVKIT_ENVIRONMENT_SOURCE_TEST_UTILS_HH
