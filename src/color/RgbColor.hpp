#ifndef __MUXCORE_RGB_COLOR_HPP__
#define __MUXCORE_RGB_COLOR_HPP__

#include "Headers.hpp"

namespace muxcore {
/** @brief An 8-bit per channel sRGB color. */
struct RgbColor {
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;

  RgbColor() {}
  RgbColor(uint8_t _red, uint8_t _green, uint8_t _blue)
      : red(_red), green(_green), blue(_blue) {}

  /**
   * @brief Parses `#rrggbb` or `#rgb` (case insensitive).
   * @throws std::runtime_error on anything else.
   */
  static RgbColor parse(const string& text);

  /** @brief Formats as lower-case `#rrggbb`. */
  string toHexString() const;

  inline bool operator==(const RgbColor& other) const {
    return red == other.red && green == other.green && blue == other.blue;
  }
  inline bool operator!=(const RgbColor& other) const {
    return !(*this == other);
  }
};

inline std::ostream& operator<<(std::ostream& os, const RgbColor& color) {
  return os << color.toHexString();
}
}  // namespace muxcore

#endif  // __MUXCORE_RGB_COLOR_HPP__
