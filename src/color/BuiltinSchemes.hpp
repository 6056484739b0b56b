#ifndef __MUXCORE_BUILTIN_SCHEMES_HPP__
#define __MUXCORE_BUILTIN_SCHEMES_HPP__

#include "Headers.hpp"
#include "Palette.hpp"

namespace muxcore {
/** @brief The compiled-in default palette.  Every slot is defined. */
Palette buildDefaultPalette();

/**
 * @brief Parses the compiled-in scheme table.  Schemes are sparse: slots
 * they leave out fall back to the default palette when resolved.
 */
map<string, Palette> buildBuiltinSchemes();
}  // namespace muxcore

#endif  // __MUXCORE_BUILTIN_SCHEMES_HPP__
