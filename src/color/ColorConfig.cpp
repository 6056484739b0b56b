#include "ColorConfig.hpp"

namespace muxcore {
namespace {
const string SCHEME_SECTION_PREFIX = "ColorScheme:";
}

ColorConfig ColorConfig::load(const CSimpleIniA &ini,
                              const ColorSchemeRegistry &registry) {
  ColorConfig config;
  const char *selected = ini.GetValue("Colors", "color_scheme", NULL);
  if (selected) {
    config.colorScheme = trim(selected);
  }

  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  for (const auto &section : sections) {
    string sectionName(section.pItem);
    if (sectionName.compare(0, SCHEME_SECTION_PREFIX.length(),
                            SCHEME_SECTION_PREFIX) != 0) {
      continue;
    }
    string schemeName = trim(sectionName.substr(SCHEME_SECTION_PREFIX.length()));
    if (schemeName.empty()) {
      throw std::runtime_error("Color scheme section without a name: [" +
                               sectionName + "]");
    }

    const char *basedOn = ini.GetValue(section.pItem, "based_on", NULL);
    Palette palette = (basedOn && !trim(basedOn).empty())
                          ? registry.getBuiltinScheme(trim(basedOn))
                          : registry.getDefaultColors();

    CSimpleIniA::TNamesDepend keys;
    ini.GetAllKeys(section.pItem, keys);
    for (const auto &key : keys) {
      string slot = trim(key.pItem);
      if (slot == "based_on") {
        continue;
      }
      const char *value = ini.GetValue(section.pItem, key.pItem, "");
      try {
        palette.setSlot(slot, RgbColor::parse(value));
      } catch (const std::runtime_error &re) {
        throw std::runtime_error("In [" + sectionName + "] " + slot + ": " +
                                 re.what());
      }
    }
    VLOG(1) << "Loaded color scheme " << schemeName;
    config.colorSchemes[schemeName] = palette;
  }
  return config;
}

ColorConfig ColorConfig::loadFromFile(const string &path,
                                      const ColorSchemeRegistry &registry) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  return load(ini, registry);
}

ColorConfig ColorConfig::loadFromString(const string &text,
                                        const ColorSchemeRegistry &registry) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(text.c_str(), text.length());
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  return load(ini, registry);
}

Palette ColorConfig::resolvePalette(const ColorSchemeRegistry &registry) const {
  if (colorScheme.empty()) {
    return registry.getDefaultColors();
  }
  return registry.resolveColorScheme(colorScheme, colorSchemes);
}

}  // namespace muxcore
