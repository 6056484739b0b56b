#ifndef __MUXCORE_WINDOW_HPP__
#define __MUXCORE_WINDOW_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Tab.hpp"

namespace muxcore {
/**
 * @brief Snapshot of a tab's position and activity inside its window.
 *
 * Built on demand and never updated afterwards; re-query for fresh data.
 */
struct TabInfo {
  int index;
  bool isActive;
  shared_ptr<Tab> tab;

  json toJson() const;
};

/**
 * @brief A top-level container owning an ordered sequence of tabs.
 *
 * A tab's index is its position in `tabs` and is never stored anywhere else.
 * The active tab is tracked by id, so reordering cannot change which tab is
 * active.  Windows are not synchronized themselves: `Mux` serializes every
 * access under its mutex.
 */
class Window {
 public:
  explicit Window(const WindowId& _id);

  inline const WindowId& getId() const { return id; }

  /** @brief Appends a tab.  The window's first tab always becomes active. */
  void push(shared_ptr<Tab> tab, bool activate);
  /** @brief Inserts a tab at `index` (0 <= index <= size()). */
  void insert(int index, shared_ptr<Tab> tab, bool activate);
  /**
   * @brief Removes a tab.  When it was active, its left neighbour (or the
   * new leftmost tab) becomes active.
   */
  shared_ptr<Tab> remove(const TabId& tabId);
  /** @brief Moves the tab at `from` so that it ends up at index `to`. */
  void moveTab(int from, int to);

  void setActive(const TabId& tabId);
  void setActiveByIndex(int index);
  /** @brief Returns the active tab, or null when the window is empty. */
  shared_ptr<Tab> getActive() const;
  /** @brief Returns the index of the active tab, or -1 when empty. */
  int getActiveIndex() const;

  /** @brief Returns the position of `tabId`, or -1 if not owned. */
  int indexOf(const TabId& tabId) const;
  shared_ptr<Tab> getByIndex(int index) const;
  inline bool contains(const TabId& tabId) const {
    return indexOf(tabId) >= 0;
  }
  inline int size() const { return int(tabs.size()); }
  inline bool isEmpty() const { return tabs.empty(); }
  inline const vector<shared_ptr<Tab>>& getTabs() const { return tabs; }

  vector<TabInfo> tabsWithInfo() const;

  json toJson() const;

 protected:
  WindowId id;
  vector<shared_ptr<Tab>> tabs;
  TabId activeTabId;

  /** @brief Dies if the active tab id no longer matches the tab sequence. */
  void validate() const;
};
}  // namespace muxcore

#endif  // __MUXCORE_WINDOW_HPP__
