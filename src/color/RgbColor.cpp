#include "RgbColor.hpp"

namespace muxcore {
namespace {
int hexDigit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}
}  // namespace

RgbColor RgbColor::parse(const string& text) {
  string s = trim(text);
  if (s.empty() || s[0] != '#' || (s.length() != 7 && s.length() != 4)) {
    throw std::runtime_error("Invalid color: '" + text + "'");
  }
  vector<int> digits;
  for (size_t a = 1; a < s.length(); a++) {
    int digit = hexDigit(s[a]);
    if (digit < 0) {
      throw std::runtime_error("Invalid color: '" + text + "'");
    }
    digits.push_back(digit);
  }
  if (digits.size() == 3) {
    // #rgb is shorthand for #rrggbb
    return RgbColor(digits[0] * 17, digits[1] * 17, digits[2] * 17);
  }
  return RgbColor(digits[0] * 16 + digits[1], digits[2] * 16 + digits[3],
                  digits[4] * 16 + digits[5]);
}

string RgbColor::toHexString() const {
  char buffer[8];
  snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", red, green, blue);
  return string(buffer);
}

}  // namespace muxcore
