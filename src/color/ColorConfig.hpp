#ifndef __MUXCORE_COLOR_CONFIG_HPP__
#define __MUXCORE_COLOR_CONFIG_HPP__

#include "ColorSchemeRegistry.hpp"
#include "Headers.hpp"
#include "Palette.hpp"
#include "SimpleIni.h"

namespace muxcore {
/**
 * @brief Color settings read from the `[Colors]` and `[ColorScheme:<name>]`
 * sections of the config file.
 *
 * A user scheme starts as a copy of the default palette (or of the builtin
 * scheme named by `based_on`) with the listed slots replaced, so every
 * scheme in `colorSchemes` is complete:
 *
 *   [Colors]
 *   color_scheme = My Theme
 *
 *   [ColorScheme:My Theme]
 *   based_on = Gruvbox Light
 *   background = #ffffff
 *   ansi/1 = #ff0000
 */
struct ColorConfig {
  /** @brief Selected scheme; empty selects the default palette. */
  string colorScheme;
  map<string, Palette> colorSchemes;

  /**
   * @throws std::runtime_error for malformed colors or unknown slots, and
   * NotFoundError for an unknown `based_on` scheme.
   */
  static ColorConfig load(const CSimpleIniA& ini,
                          const ColorSchemeRegistry& registry);
  /** @throws std::runtime_error if the file cannot be read. */
  static ColorConfig loadFromFile(const string& path,
                                  const ColorSchemeRegistry& registry);
  static ColorConfig loadFromString(const string& text,
                                    const ColorSchemeRegistry& registry);

  /** @brief The palette to render with. */
  Palette resolvePalette(const ColorSchemeRegistry& registry) const;
};
}  // namespace muxcore

#endif  // __MUXCORE_COLOR_CONFIG_HPP__
