#include "BuiltinSchemes.hpp"

namespace muxcore {
namespace {
const char *BUILTIN_SCHEMES_JSON = R"JSON({
  "Builtin Dark": {
    "foreground": "#bbbbbb",
    "background": "#000000",
    "cursor_fg": "#000000",
    "cursor_bg": "#bbbbbb",
    "cursor_border": "#bbbbbb",
    "selection_fg": "#000000",
    "selection_bg": "#b5d5ff",
    "ansi": ["#000000", "#bb0000", "#00bb00", "#bbbb00",
             "#0000bb", "#bb00bb", "#00bbbb", "#bbbbbb"],
    "brights": ["#555555", "#ff5555", "#55ff55", "#ffff55",
                "#5555ff", "#ff55ff", "#55ffff", "#ffffff"]
  },
  "Builtin Light": {
    "foreground": "#000000",
    "background": "#ffffff",
    "cursor_fg": "#ffffff",
    "cursor_bg": "#000000",
    "cursor_border": "#000000",
    "selection_fg": "#000000",
    "selection_bg": "#b5d5ff",
    "ansi": ["#000000", "#bb0000", "#00bb00", "#bbbb00",
             "#0000bb", "#bb00bb", "#00bbbb", "#bbbbbb"],
    "brights": ["#555555", "#ff5555", "#55ff55", "#ffff55",
                "#5555ff", "#ff55ff", "#55ffff", "#ffffff"]
  },
  "Builtin Tango Dark": {
    "foreground": "#ffffff",
    "background": "#000000",
    "ansi": ["#000000", "#cc0000", "#4e9a06", "#c4a000",
             "#3465a4", "#75507b", "#06989a", "#d3d7cf"],
    "brights": ["#555753", "#ef2929", "#8ae234", "#fce94f",
                "#729fcf", "#ad7fa8", "#34e2e2", "#eeeeec"]
  },
  "Builtin Tango Light": {
    "foreground": "#000000",
    "background": "#ffffff",
    "ansi": ["#000000", "#cc0000", "#4e9a06", "#c4a000",
             "#3465a4", "#75507b", "#06989a", "#d3d7cf"],
    "brights": ["#555753", "#ef2929", "#8ae234", "#fce94f",
                "#729fcf", "#ad7fa8", "#34e2e2", "#eeeeec"]
  },
  "Dracula": {
    "foreground": "#f8f8f2",
    "background": "#282a36",
    "cursor_fg": "#282a36",
    "cursor_bg": "#f8f8f2",
    "cursor_border": "#f8f8f2",
    "selection_fg": "#ffffff",
    "selection_bg": "#44475a",
    "ansi": ["#21222c", "#ff5555", "#50fa7b", "#f1fa8c",
             "#bd93f9", "#ff79c6", "#8be9fd", "#f8f8f2"],
    "brights": ["#6272a4", "#ff6e6e", "#69ff94", "#ffffa5",
                "#d6acff", "#ff92df", "#a4ffff", "#ffffff"]
  },
  "Gruvbox Dark": {
    "foreground": "#ebdbb2",
    "background": "#282828",
    "cursor_fg": "#282828",
    "cursor_bg": "#ebdbb2",
    "cursor_border": "#ebdbb2",
    "selection_fg": "#282828",
    "selection_bg": "#ebdbb2",
    "ansi": ["#282828", "#cc241d", "#98971a", "#d79921",
             "#458588", "#b16286", "#689d6a", "#a89984"],
    "brights": ["#928374", "#fb4934", "#b8bb26", "#fabd2f",
                "#83a598", "#d3869b", "#8ec07c", "#ebdbb2"]
  },
  "Gruvbox Light": {
    "foreground": "#3c3836",
    "background": "#fbf1c7",
    "cursor_fg": "#fbf1c7",
    "cursor_bg": "#3c3836",
    "cursor_border": "#3c3836",
    "selection_fg": "#fbf1c7",
    "selection_bg": "#3c3836",
    "ansi": ["#fbf1c7", "#cc241d", "#98971a", "#d79921",
             "#458588", "#b16286", "#689d6a", "#7c6f64"],
    "brights": ["#928374", "#9d0006", "#79740e", "#b57614",
                "#076678", "#8f3f71", "#427b58", "#3c3836"]
  },
  "Solarized Dark": {
    "foreground": "#839496",
    "background": "#002b36",
    "cursor_fg": "#002b36",
    "cursor_bg": "#93a1a1",
    "cursor_border": "#93a1a1",
    "selection_fg": "#93a1a1",
    "selection_bg": "#073642",
    "ansi": ["#073642", "#dc322f", "#859900", "#b58900",
             "#268bd2", "#d33682", "#2aa198", "#eee8d5"],
    "brights": ["#002b36", "#cb4b16", "#586e75", "#657b83",
                "#839496", "#6c71c4", "#93a1a1", "#fdf6e3"]
  },
  "Solarized Light": {
    "foreground": "#657b83",
    "background": "#fdf6e3",
    "cursor_fg": "#fdf6e3",
    "cursor_bg": "#586e75",
    "cursor_border": "#586e75",
    "selection_fg": "#586e75",
    "selection_bg": "#eee8d5",
    "ansi": ["#073642", "#dc322f", "#859900", "#b58900",
             "#268bd2", "#d33682", "#2aa198", "#eee8d5"],
    "brights": ["#002b36", "#cb4b16", "#586e75", "#657b83",
                "#839496", "#6c71c4", "#93a1a1", "#fdf6e3"]
  },
  "Tomorrow Night": {
    "foreground": "#c5c8c6",
    "background": "#1d1f21",
    "cursor_fg": "#1d1f21",
    "cursor_bg": "#c5c8c6",
    "cursor_border": "#c5c8c6",
    "selection_fg": "#c5c8c6",
    "selection_bg": "#373b41",
    "ansi": ["#000000", "#cc6666", "#b5bd68", "#f0c674",
             "#81a2be", "#b294bb", "#8abeb7", "#ffffff"],
    "brights": ["#000000", "#cc6666", "#b5bd68", "#f0c674",
                "#81a2be", "#b294bb", "#8abeb7", "#ffffff"],
    "tab_bar": {
      "background": "#1d1f21",
      "active_tab": {"bg_color": "#373b41", "fg_color": "#c5c8c6"}
    }
  }
})JSON";
}  // namespace

Palette buildDefaultPalette() {
  Palette palette;
  palette.foreground = RgbColor(0xb2, 0xb2, 0xb2);
  palette.background = RgbColor(0x00, 0x00, 0x00);
  palette.cursorFg = RgbColor(0x00, 0x00, 0x00);
  palette.cursorBg = RgbColor(0x52, 0xad, 0x70);
  palette.cursorBorder = RgbColor(0x52, 0xad, 0x70);
  palette.selectionFg = RgbColor(0x00, 0x00, 0x00);
  palette.selectionBg = RgbColor(0xff, 0xfa, 0xcd);
  palette.scrollbarThumb = RgbColor(0x22, 0x22, 0x22);
  palette.split = RgbColor(0x44, 0x44, 0x44);
  palette.visualBell = RgbColor(0xb2, 0xb2, 0xb2);
  palette.composeCursor = RgbColor(0xff, 0xa5, 0x00);

  palette.ansi = {{
      RgbColor(0x00, 0x00, 0x00),  // black
      RgbColor(0xcc, 0x55, 0x55),  // maroon
      RgbColor(0x55, 0xcc, 0x55),  // green
      RgbColor(0xcd, 0xcd, 0x55),  // olive
      RgbColor(0x54, 0x55, 0xcb),  // navy
      RgbColor(0xcc, 0x55, 0xcc),  // purple
      RgbColor(0x7a, 0xca, 0xca),  // teal
      RgbColor(0xcc, 0xcc, 0xcc),  // silver
  }};
  palette.brights = {{
      RgbColor(0x55, 0x55, 0x55),  // grey
      RgbColor(0xff, 0x55, 0x55),  // red
      RgbColor(0x55, 0xff, 0x55),  // lime
      RgbColor(0xff, 0xff, 0x55),  // yellow
      RgbColor(0x55, 0x55, 0xff),  // blue
      RgbColor(0xff, 0x55, 0xff),  // fuchsia
      RgbColor(0x55, 0xff, 0xff),  // aqua
      RgbColor(0xff, 0xff, 0xff),  // white
  }};

  palette.tabBar.background = RgbColor(0x33, 0x33, 0x33);
  palette.tabBar.inactiveTabEdge = RgbColor(0x57, 0x57, 0x57);
  palette.tabBar.activeTab.bgColor = RgbColor(0x00, 0x00, 0x00);
  palette.tabBar.activeTab.fgColor = RgbColor(0xc0, 0xc0, 0xc0);
  palette.tabBar.inactiveTab.bgColor = RgbColor(0x33, 0x33, 0x33);
  palette.tabBar.inactiveTab.fgColor = RgbColor(0x80, 0x80, 0x80);
  palette.tabBar.inactiveTabHover.bgColor = RgbColor(0x1f, 0x1f, 0x1f);
  palette.tabBar.inactiveTabHover.fgColor = RgbColor(0x90, 0x90, 0x90);
  palette.tabBar.newTab.bgColor = RgbColor(0x1f, 0x1f, 0x1f);
  palette.tabBar.newTab.fgColor = RgbColor(0x80, 0x80, 0x80);
  palette.tabBar.newTabHover.bgColor = RgbColor(0x1f, 0x1f, 0x1f);
  palette.tabBar.newTabHover.fgColor = RgbColor(0x90, 0x90, 0x90);
  return palette;
}

map<string, Palette> buildBuiltinSchemes() {
  map<string, Palette> schemes;
  try {
    json table = parseJsonOrThrow(BUILTIN_SCHEMES_JSON, "builtin schemes");
    for (auto &it : table.items()) {
      schemes[it.key()] = it.value().get<Palette>();
    }
  } catch (const std::runtime_error &re) {
    STFATAL << "Corrupt builtin scheme table: " << re.what();
  }
  VLOG(1) << "Loaded " << schemes.size() << " builtin color schemes";
  return schemes;
}

}  // namespace muxcore
