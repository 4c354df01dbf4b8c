#include "environment/source_test_utils.hh"

namespace test {

ScopedFakeEnvironment::ScopedFakeEnvironment(
    std::initializer_list<std::pair<const std::string, std::string>> values)
    : source_(values),
      original_source_(envkit::environment::SetSource(&source_)) {}

ScopedFakeEnvironment::~ScopedFakeEnvironment() {
  envkit::environment::SetSource(original_source_);
}

}  // namespace test
