#include "ColorSchemeRegistry.hpp"

#include "BuiltinSchemes.hpp"

namespace muxcore {
shared_ptr<const ColorSchemeRegistry> ColorSchemeRegistry::instance;
std::once_flag ColorSchemeRegistry::instanceOnce;

ColorSchemeRegistry::ColorSchemeRegistry()
    : ColorSchemeRegistry(buildDefaultPalette(), buildBuiltinSchemes()) {}

ColorSchemeRegistry::ColorSchemeRegistry(
    const Palette &_defaultPalette, const map<string, Palette> &_builtinSchemes)
    : defaultPalette(_defaultPalette), builtinSchemes(_builtinSchemes) {
  if (!defaultPalette.isComplete()) {
    STFATAL << "Default palette is missing slot "
            << defaultPalette.missingSlots().front();
  }
}

shared_ptr<const ColorSchemeRegistry> ColorSchemeRegistry::get() {
  std::call_once(instanceOnce, []() {
    instance = make_shared<const ColorSchemeRegistry>();
    LOG(INFO) << "Color scheme registry ready";
  });
  return instance;
}

Palette ColorSchemeRegistry::getDefaultColors() const { return defaultPalette; }

map<string, Palette> ColorSchemeRegistry::getBuiltinSchemes() const {
  map<string, Palette> resolved;
  for (auto &it : builtinSchemes) {
    resolved[it.first] = resolve(it.second);
  }
  return resolved;
}

Palette ColorSchemeRegistry::getBuiltinScheme(const string &name) const {
  auto it = builtinSchemes.find(name);
  if (it == builtinSchemes.end()) {
    throw NotFoundError("color scheme", name);
  }
  return resolve(it->second);
}

bool ColorSchemeRegistry::hasBuiltinScheme(const string &name) const {
  return builtinSchemes.find(name) != builtinSchemes.end();
}

vector<string> ColorSchemeRegistry::getBuiltinSchemeNames() const {
  vector<string> names;
  for (auto &it : builtinSchemes) {
    names.push_back(it.first);
  }
  return names;
}

Palette ColorSchemeRegistry::resolve(const Palette &overrides) const {
  return Palette::overlay(defaultPalette, overrides);
}

Palette ColorSchemeRegistry::resolveColorScheme(
    const string &name, const map<string, Palette> &userSchemes) const {
  auto userIt = userSchemes.find(name);
  if (userIt != userSchemes.end()) {
    if (userIt->second.isComplete()) {
      return userIt->second;
    }
    LOG(WARNING) << "Color scheme " << name << " does not define "
                 << userIt->second.missingSlots().size()
                 << " slots, using the default palette for those";
    return resolve(userIt->second);
  }
  return getBuiltinScheme(name);
}

Palette getDefaultColors() {
  return ColorSchemeRegistry::get()->getDefaultColors();
}

map<string, Palette> getBuiltinSchemes() {
  return ColorSchemeRegistry::get()->getBuiltinSchemes();
}

}  // namespace muxcore
