#include <cstdlib>

#include "environment/source.hh"

namespace envkit {
namespace environment {

bool Source::Lookup(std::string const& name, std::string* value) const {
  char const* env_value = getenv(name.c_str());
  if (env_value == nullptr) {
    return false;
  }
  value->assign(env_value);
  return true;
}

namespace {

Source default_source;
Source* source = &default_source;

}  // namespace

Source* SetSource(Source* new_source) {
  Source* old_source = source;
  source = (new_source != nullptr) ? new_source : &default_source;
  return old_source;
}

Source const& CurrentSource() { return *source; }

MapSource::MapSource(
    std::initializer_list<std::pair<const std::string, std::string>> values)
    : values_(values) {}

bool MapSource::Lookup(std::string const& name, std::string* value) const {
  auto it = values_.find(name);
  if (it == values_.end()) {
    return false;
  }
  value->assign(it->second);
  return true;
}

void MapSource::Set(std::string const& name, std::string const& value) {
  values_[name] = value;
}

void MapSource::Unset(std::string const& name) { values_.erase(name); }

}  // namespace environment
}  // namespace envkit
