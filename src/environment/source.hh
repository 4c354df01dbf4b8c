#ifndef ENVKIT_ENVIRONMENT_SOURCE_HH
#define ENVKIT_ENVIRONMENT_SOURCE_HH

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

namespace envkit {
namespace environment {

// Source is the key-value store the accessors read variables from. The
// default implementation reads the process environment.
class Source {
 public:
  virtual ~Source() = default;

  // Stores the value of name in *value and returns true if the variable is
  // set. Returns false, leaving *value untouched, otherwise.
  virtual bool Lookup(std::string const& name, std::string* value) const;
};

// Replaces the current source with the new one, and returns a pointer to the
// old one. Passing nullptr reinstates the process environment.
Source* SetSource(Source* source);
Source const& CurrentSource();

// MapSource resolves variables from an in-memory table.
class MapSource : public Source {
 public:
  MapSource() = default;
  MapSource(
      std::initializer_list<std::pair<const std::string, std::string>> values);

  bool Lookup(std::string const& name, std::string* value) const override;

  void Set(std::string const& name, std::string const& value);
  void Unset(std::string const& name);

 private:
  std::unordered_map<std::string, std::string> values_;
};

}  // namespace environment
}  // namespace envkit

#endif  // ENVKIT_ENVIRONMENT_SOURCE_HH
