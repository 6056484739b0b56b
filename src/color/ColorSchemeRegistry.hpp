#ifndef __MUXCORE_COLOR_SCHEME_REGISTRY_HPP__
#define __MUXCORE_COLOR_SCHEME_REGISTRY_HPP__

#include "Headers.hpp"
#include "MuxErrors.hpp"
#include "Palette.hpp"

namespace muxcore {
/**
 * @brief Holds the default palette and the named builtin schemes.
 *
 * The registry is immutable once constructed.  Every accessor returns a copy,
 * so callers may freely edit what they get back (e.g. take a builtin scheme,
 * change its background and register it as their own) without affecting
 * later calls.
 */
class ColorSchemeRegistry {
 public:
  /** @brief Builds the registry from the compiled-in palette and schemes. */
  ColorSchemeRegistry();
  /** @brief `defaultPalette` must define every slot. */
  ColorSchemeRegistry(const Palette& _defaultPalette,
                      const map<string, Palette>& _builtinSchemes);

  /** @brief Returns the process-wide registry, creating it on first use. */
  static shared_ptr<const ColorSchemeRegistry> get();

  /** @brief A fresh copy of the default palette. */
  Palette getDefaultColors() const;
  /** @brief Every builtin scheme, resolved over the default palette. */
  map<string, Palette> getBuiltinSchemes() const;
  /**
   * @brief One builtin scheme resolved over the default palette.
   * @throws NotFoundError if there is no such scheme.
   */
  Palette getBuiltinScheme(const string& name) const;
  bool hasBuiltinScheme(const string& name) const;
  vector<string> getBuiltinSchemeNames() const;

  /** @brief Fills whatever `overrides` leaves undefined from the default. */
  Palette resolve(const Palette& overrides) const;
  /**
   * @brief Resolves the scheme selected by name.  User schemes shadow
   * builtin schemes with the same name and are used as given.
   * @throws NotFoundError if neither table has the name.
   */
  Palette resolveColorScheme(
      const string& name,
      const map<string, Palette>& userSchemes = map<string, Palette>()) const;

 protected:
  Palette defaultPalette;
  /** @brief Sparse schemes exactly as declared. */
  map<string, Palette> builtinSchemes;

  static shared_ptr<const ColorSchemeRegistry> instance;
  static std::once_flag instanceOnce;
};

/** @brief Shorthand for `ColorSchemeRegistry::get()->getDefaultColors()`. */
Palette getDefaultColors();
/** @brief Shorthand for `ColorSchemeRegistry::get()->getBuiltinSchemes()`. */
map<string, Palette> getBuiltinSchemes();
}  // namespace muxcore

#endif  // __MUXCORE_COLOR_SCHEME_REGISTRY_HPP__
