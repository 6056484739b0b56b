#ifndef __MUXCORE_TAB_HPP__
#define __MUXCORE_TAB_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Pane.hpp"

namespace muxcore {
/** @brief How an existing pane should be divided. */
struct SplitRequest {
  /** @brief True to stack the panes top/bottom, false for side by side. */
  bool vertical = false;
  /** @brief Place the new pane after (right of/below) the source pane. */
  bool targetIsSecond = true;
  /** @brief Fraction of the source pane's space given to the new pane. */
  float size = 0.5f;
  /** @brief Make the new pane the tab's active pane. */
  bool activate = true;
};

/** @brief Snapshot of a pane's position and activity inside its tab. */
struct PaneInfo {
  int index;
  bool isActive;
  shared_ptr<Pane> pane;
};

/**
 * @brief A tab: a tree of splits whose leaves are panes, plus the id of the
 * active pane.
 *
 * The tree is stored flat: every node (pane or split) records its parent,
 * which is either this tab's id (for the root) or a split id.  All methods
 * are guarded by the tab's own mutex; `Mux` always takes its lock first.
 *
 * The tree can only be changed through `Mux`, which keeps its pane index in
 * step with the tabs.
 */
class Tab {
  friend class Mux;

 protected:
  struct Split;

 public:
  Tab(const TabId& _id, shared_ptr<Pane> rootPane);

  inline const TabId& getId() const { return id; }

  /** @brief Panes in depth-first (display) order with index/activity. */
  vector<PaneInfo> panesWithInfo();
  /** @brief Panes in depth-first (display) order. */
  vector<shared_ptr<Pane>> getPanes();
  shared_ptr<Pane> getPane(const PaneId& paneId);
  bool hasPane(const PaneId& paneId);
  /** @brief Returns the active pane, or null once the tab is dead. */
  shared_ptr<Pane> getActivePane();
  /** @brief Returns the relative sizes of the split holding `paneId`. */
  vector<float> getSiblingSizes(const PaneId& paneId);

  inline bool isDead() {
    lock_guard<recursive_mutex> guard(tabMutex);
    return panes.empty();
  }
  inline int numPanes() {
    lock_guard<recursive_mutex> guard(tabMutex);
    return int(panes.size());
  }

  json toJson();

 protected:
  /**
   * @brief Splits `sourceId`, placing `newPane` next to it.
   *
   * When the source already lives in a split with the same orientation the
   * new pane joins that split and takes its share from the source.
   * Otherwise a new split replaces the source in the tree.
   */
  void splitPane(const PaneId& sourceId, shared_ptr<Pane> newPane,
                 const SplitRequest& request);
  /**
   * @brief Detaches a pane from the tree, collapsing single-child splits.
   * @return The removed pane.  The tab is dead if it was the last one.
   */
  shared_ptr<Pane> removePane(const PaneId& paneId);

  void setActivePane(const PaneId& paneId);

  TabId id;
  /** @brief Id of the root node: a pane, a split, or empty once dead. */
  string rootId;
  PaneId activePaneId;
  map<PaneId, shared_ptr<Pane>> panes;
  /** @brief Parent node (tab id or split id) of every pane. */
  map<PaneId, string> paneParents;
  map<string, shared_ptr<Split>> splits;
  recursive_mutex tabMutex;

  void collectPanes(const string& nodeId, vector<shared_ptr<Pane>>* out);
  void reparent(const string& nodeId, const string& newParentId);
  void replaceChild(const string& parentId, const string& oldChild,
                    const string& newChild);

  inline shared_ptr<Split> getSplit(const string& splitId) {
    auto it = splits.find(splitId);
    if (it == splits.end()) {
      STFATAL << "Tried to get a split that doesn't exist: " << splitId;
    }
    return it->second;
  }
};
}  // namespace muxcore

#endif  // __MUXCORE_TAB_HPP__
