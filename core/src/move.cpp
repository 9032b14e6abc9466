#include "uttt/move.hpp"
#include <sstream>

namespace uttt {

std::string Move::to_string() const {
  std::ostringstream oss;
  oss << R << ' ' << C << ' ' << r << ' ' << c;
  return oss.str();
}

} // namespace uttt
