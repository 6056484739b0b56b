#ifndef __MUXCORE_PALETTE_HPP__
#define __MUXCORE_PALETTE_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RgbColor.hpp"

namespace muxcore {
struct TabBarColor {
  optional<RgbColor> bgColor;
  optional<RgbColor> fgColor;
};

struct TabBarColors {
  optional<RgbColor> background;
  optional<RgbColor> inactiveTabEdge;
  TabBarColor activeTab;
  TabBarColor inactiveTab;
  TabBarColor inactiveTabHover;
  TabBarColor newTab;
  TabBarColor newTabHover;
};

/**
 * @brief Maps every color slot of the terminal to a color.
 *
 * Slots are optional so that a palette can also describe a sparse set of
 * overrides.  Every slot has a path-like name ("foreground", "ansi/3",
 * "tab_bar/active_tab/bg_color") which doubles as its JSON pointer and INI
 * key.  Palettes are plain values: copying one never shares state.
 */
struct Palette {
  optional<RgbColor> foreground;
  optional<RgbColor> background;
  optional<RgbColor> cursorFg;
  optional<RgbColor> cursorBg;
  optional<RgbColor> cursorBorder;
  optional<RgbColor> selectionFg;
  optional<RgbColor> selectionBg;
  optional<RgbColor> scrollbarThumb;
  optional<RgbColor> split;
  optional<RgbColor> visualBell;
  optional<RgbColor> composeCursor;
  /** @brief The 8 normal ANSI colors. */
  array<optional<RgbColor>, 8> ansi;
  /** @brief The 8 bright ANSI colors. */
  array<optional<RgbColor>, 8> brights;
  TabBarColors tabBar;

  /**
   * @brief Returns `base` with every slot defined by `top` replaced by the
   * value from `top`.
   */
  static Palette overlay(const Palette& base, const Palette& top);

  /** @brief True when every slot is defined. */
  bool isComplete() const;
  /** @brief Names of the undefined slots, in slot order. */
  vector<string> missingSlots() const;
  int definedSlotCount() const;

  /** @throws std::runtime_error if `slot` is not a slot name. */
  optional<RgbColor> getSlot(const string& slot) const;
  /** @throws std::runtime_error if `slot` is not a slot name. */
  void setSlot(const string& slot, const RgbColor& color);

  /** @brief All slot names in their canonical order. */
  static const vector<string>& slotNames();

  bool operator==(const Palette& other) const;
  inline bool operator!=(const Palette& other) const {
    return !(*this == other);
  }

  /**
   * @brief Calls `visit(name, slot)` for every slot.  Works on const and
   * non-const palettes.
   */
  template <typename PaletteType, typename Visitor>
  static void forEachSlot(PaletteType& palette, Visitor visit) {
    visit("foreground", palette.foreground);
    visit("background", palette.background);
    visit("cursor_fg", palette.cursorFg);
    visit("cursor_bg", palette.cursorBg);
    visit("cursor_border", palette.cursorBorder);
    visit("selection_fg", palette.selectionFg);
    visit("selection_bg", palette.selectionBg);
    visit("scrollbar_thumb", palette.scrollbarThumb);
    visit("split", palette.split);
    visit("visual_bell", palette.visualBell);
    visit("compose_cursor", palette.composeCursor);
    for (int a = 0; a < 8; a++) {
      visit("ansi/" + std::to_string(a), palette.ansi[a]);
    }
    for (int a = 0; a < 8; a++) {
      visit("brights/" + std::to_string(a), palette.brights[a]);
    }
    visit("tab_bar/background", palette.tabBar.background);
    visit("tab_bar/inactive_tab_edge", palette.tabBar.inactiveTabEdge);
    visit("tab_bar/active_tab/bg_color", palette.tabBar.activeTab.bgColor);
    visit("tab_bar/active_tab/fg_color", palette.tabBar.activeTab.fgColor);
    visit("tab_bar/inactive_tab/bg_color", palette.tabBar.inactiveTab.bgColor);
    visit("tab_bar/inactive_tab/fg_color", palette.tabBar.inactiveTab.fgColor);
    visit("tab_bar/inactive_tab_hover/bg_color",
          palette.tabBar.inactiveTabHover.bgColor);
    visit("tab_bar/inactive_tab_hover/fg_color",
          palette.tabBar.inactiveTabHover.fgColor);
    visit("tab_bar/new_tab/bg_color", palette.tabBar.newTab.bgColor);
    visit("tab_bar/new_tab/fg_color", palette.tabBar.newTab.fgColor);
    visit("tab_bar/new_tab_hover/bg_color", palette.tabBar.newTabHover.bgColor);
    visit("tab_bar/new_tab_hover/fg_color", palette.tabBar.newTabHover.fgColor);
  }
};

/** @brief Writes the defined slots as nested objects/arrays of `#rrggbb`. */
void to_json(json& j, const Palette& palette);
/**
 * @brief Reads any subset of slots; null entries are left undefined.
 * @throws std::runtime_error on malformed colors.
 */
void from_json(const json& j, Palette& palette);
}  // namespace muxcore

#endif  // __MUXCORE_PALETTE_HPP__
