#include "fixtures.hpp"

#include <cctype>
#include <stdexcept>

namespace tnsprobe::test {

std::vector<std::uint8_t> from_hex(std::string_view hex) {
  std::vector<std::uint8_t> out;
  int hi = -1;
  for (char ch : hex) {
    auto c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) continue;
    if (!std::isxdigit(c)) {
      throw std::invalid_argument("from_hex: non-hex character");
    }
    int v = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;
    if (hi < 0) {
      hi = v;
    } else {
      out.push_back(static_cast<std::uint8_t>((hi << 4) | v));
      hi = -1;
    }
  }
  if (hi >= 0) throw std::invalid_argument("from_hex: odd number of digits");
  return out;
}

} // namespace tnsprobe::test
