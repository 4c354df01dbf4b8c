#include <iostream>

#include "util/log.hh"

namespace envkit {
namespace util {
namespace log {

Logger& Error() {
  static Logger error(std::cerr);
  return error;
}

}  // namespace log
}  // namespace util
}  // namespace envkit
