#ifndef ENVKIT_UTIL_LOG_HH
#define ENVKIT_UTIL_LOG_HH

#include <ostream>

// Only linked into the test binary: the library never logs.

namespace envkit {
namespace util {
namespace log {

class Logger {
  friend Logger& Error();

 public:
  template <typename V>
  Logger& operator<<(V const& val) {
    stream_ << val;
    stream_.flush();
    return (*this);
  }

 private:
  std::ostream& stream_;

  explicit Logger(std::ostream& stream) : stream_(stream) {}
};

// Writes to std::cerr, flushing after every insertion.
Logger& Error();

}  // namespace log
}  // namespace util
}  // namespace envkit

#endif  // ENVKIT_UTIL_LOG_HH
