#ifndef __MUXCORE_MUX_HPP__
#define __MUXCORE_MUX_HPP__

#include "Domain.hpp"
#include "Headers.hpp"
#include "MuxErrors.hpp"
#include "Tab.hpp"
#include "Window.hpp"

namespace muxcore {
/** @brief Where a pane currently lives. */
struct PaneLocation {
  DomainId domainId;
  WindowId windowId;
  TabId tabId;
};

/** @brief Where the pane inserted by `Mux::splitPane` comes from. */
struct SplitSource {
  enum Type { SPAWN, MOVE_PANE };
  Type type = SPAWN;
  /** @brief Command for SPAWN. */
  SpawnCommand command;
  /** @brief Domain for SPAWN; empty means the domain of the split pane. */
  string domainName;
  /** @brief Pane to take out of its current tab for MOVE_PANE. */
  PaneId paneId;

  static SplitSource spawn(const SpawnCommand& command,
                           const string& domainName = "");
  static SplitSource movePane(const PaneId& paneId);
};

/**
 * @brief Owns the windows -> tabs -> panes hierarchy and the domains that
 * spawn panes.
 *
 * Every query and mutation is serialized through `muxMutex`, so callers never
 * observe a half-applied change: indices and active flags returned by
 * `tabsWithInfo` are computed under the same lock as the mutations.  Every
 * mutator validates its ids before changing anything, so a `NotFoundError`
 * leaves the hierarchy untouched.
 */
class Mux {
 public:
  /** @brief Creates a mux with a `LocalDomain` named "local" as default. */
  Mux();
  explicit Mux(shared_ptr<Domain> defaultDomain);

  void addDomain(shared_ptr<Domain> domain);
  shared_ptr<Domain> getDomain(DomainId domainId);
  shared_ptr<Domain> getDomainByName(const string& name);
  shared_ptr<Domain> getDefaultDomain();
  vector<shared_ptr<Domain>> getDomains();

  WindowId newWindow();
  /** @brief Destroys a window together with all of its tabs and panes. */
  void removeWindow(const WindowId& windowId);
  /** @brief Window ids in creation order. */
  vector<WindowId> windowIds();
  bool hasWindow(const WindowId& windowId);

  /** @brief One record per tab of the window, in display order. */
  vector<TabInfo> tabsWithInfo(const WindowId& windowId);

  /**
   * @brief Appends a tab that is not yet part of the mux to a window.  The
   * active tab only changes if `activate` is set or the window was empty.
   */
  void addTabToWindow(shared_ptr<Tab> tab, const WindowId& windowId,
                      bool activate = false);
  void insertTabInWindow(shared_ptr<Tab> tab, const WindowId& windowId,
                         int index, bool activate = false);
  /** @brief Spawns a pane in a domain and wraps it in a new tab. */
  shared_ptr<Tab> spawnTab(const WindowId& windowId, DomainId domainId,
                           const SpawnCommand& command, bool activate = true);
  /** @brief Same as above, using the default domain. */
  shared_ptr<Tab> spawnTab(const WindowId& windowId,
                           const SpawnCommand& command, bool activate = true);
  /** @brief Destroys a tab and its panes. */
  void removeTab(const TabId& tabId);
  /** @brief Reorders tabs inside a window; the active tab stays active. */
  void moveTab(const WindowId& windowId, int from, int to);
  /** @brief Moves a tab to the end of another window. */
  void moveTabToWindow(const TabId& tabId, const WindowId& destWindowId,
                       bool activate = false);

  void setActiveTab(const WindowId& windowId, const TabId& tabId);
  void setActiveTabByIndex(const WindowId& windowId, int index);
  /** @brief Returns the window's active tab, or null if it has no tabs. */
  shared_ptr<Tab> getActiveTab(const WindowId& windowId);
  shared_ptr<Tab> getTab(const TabId& tabId);
  WindowId windowForTab(const TabId& tabId);

  shared_ptr<Pane> getPane(const PaneId& paneId);
  PaneLocation resolvePaneId(const PaneId& paneId);
  vector<PaneInfo> panesWithInfo(const TabId& tabId);
  void setActivePane(const TabId& tabId, const PaneId& paneId);
  /**
   * @brief Splits `paneId` inside `tabId` with a freshly spawned pane or
   * with a pane moved out of another tab.  A tab left without panes by the
   * move is removed from its window.
   */
  shared_ptr<Pane> splitPane(const TabId& tabId, const PaneId& paneId,
                             const SplitRequest& request,
                             const SplitSource& source);
  /** @brief Removes a pane; a tab that loses its last pane is removed. */
  void closePane(const PaneId& paneId);

  /** @brief Serializes windows, tabs, panes and domains into JSON. */
  string toJsonString();

 protected:
  recursive_mutex muxMutex;
  map<WindowId, shared_ptr<Window>> windows;
  vector<WindowId> windowOrder;
  unordered_map<TabId, WindowId> tabWindows;
  unordered_map<PaneId, TabId> paneTabs;
  map<DomainId, shared_ptr<Domain>> domains;
  DomainId defaultDomainId;

  inline shared_ptr<Window> getWindow(const WindowId& windowId) {
    auto it = windows.find(windowId);
    if (it == windows.end()) {
      throw NotFoundError("window", windowId);
    }
    return it->second;
  }
  shared_ptr<Tab> getTabLocked(const TabId& tabId);
  shared_ptr<Domain> getSpawnableDomain(DomainId domainId);
  /** @brief Records the tab's panes; the tab must not already be known. */
  void registerTab(shared_ptr<Tab> tab, const WindowId& windowId);
  void unregisterTab(shared_ptr<Tab> tab);
  void removeTabLocked(const TabId& tabId);
};
}  // namespace muxcore

#endif  // __MUXCORE_MUX_HPP__
