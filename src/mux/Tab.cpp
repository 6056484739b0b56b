#include "Tab.hpp"

#include <numeric>

#include "MuxErrors.hpp"

namespace muxcore {
struct Tab::Split {
  string id;
  string parentId;
  bool vertical;
  vector<string> panesOrSplits;
  vector<float> sizes;

  json toJson() {
    json split;
    split["id"] = id;
    split["vertical"] = vertical;
    split["panesOrSplits"] = panesOrSplits;
    split["sizes"] = sizes;
    return split;
  }
};

Tab::Tab(const TabId &_id, shared_ptr<Pane> rootPane) : id(_id) {
  if (rootPane.get() == NULL) {
    STFATAL << "Tried to create tab " << id << " without a pane";
  }
  rootId = rootPane->getId();
  activePaneId = rootId;
  panes.insert(make_pair(rootId, rootPane));
  paneParents[rootId] = id;
}

void Tab::splitPane(const PaneId &sourceId, shared_ptr<Pane> newPane,
                    const SplitRequest &request) {
  lock_guard<recursive_mutex> guard(tabMutex);
  if (panes.find(sourceId) == panes.end()) {
    throw NotFoundError("pane", sourceId);
  }
  if (!(request.size > 0.0f && request.size < 1.0f)) {
    throw std::runtime_error("Invalid split size: " +
                             std::to_string(request.size));
  }
  const PaneId &paneId = newPane->getId();
  if (paneId == id || panes.find(paneId) != panes.end() ||
      splits.find(paneId) != splits.end()) {
    STFATAL << "Found unexpected id in tab " << id << ": " << paneId;
  }

  panes.insert(make_pair(paneId, newPane));
  const string parentId = paneParents[sourceId];
  auto splitIt = splits.find(parentId);
  if (splitIt != splits.end() && splitIt->second->vertical == request.vertical) {
    VLOG(1) << "Continuing a split";
    // The source is already part of a split with the same orientation.  The
    // new pane takes its share out of the source pane.
    auto split = splitIt->second;
    auto pos = std::find(split->panesOrSplits.begin(),
                         split->panesOrSplits.end(), sourceId) -
               split->panesOrSplits.begin();
    if (pos == int(split->panesOrSplits.size())) {
      STFATAL << "Source pane missing from parent split";
    }
    float share = split->sizes[pos] * request.size;
    split->sizes[pos] -= share;
    auto insertAt = request.targetIsSecond ? pos + 1 : pos;
    split->panesOrSplits.insert(split->panesOrSplits.begin() + insertAt,
                                paneId);
    split->sizes.insert(split->sizes.begin() + insertAt, share);
    paneParents[paneId] = split->id;
  } else {
    if (splitIt != splits.end()) {
      VLOG(1) << "Splitting in a new direction";
    } else {
      VLOG(1) << "Splitting a root pane";
    }
    // Create a new split with the source & new pane in the requested
    // orientation and put it where the source used to be.
    auto newSplit = make_shared<Split>();
    newSplit->id = newUuid();
    newSplit->vertical = request.vertical;
    newSplit->parentId = parentId;
    if (request.targetIsSecond) {
      newSplit->panesOrSplits = {sourceId, paneId};
      newSplit->sizes = {1.0f - request.size, request.size};
    } else {
      newSplit->panesOrSplits = {paneId, sourceId};
      newSplit->sizes = {request.size, 1.0f - request.size};
    }
    splits.insert(make_pair(newSplit->id, newSplit));
    replaceChild(parentId, sourceId, newSplit->id);
    paneParents[sourceId] = newSplit->id;
    paneParents[paneId] = newSplit->id;
  }

  if (request.activate) {
    activePaneId = paneId;
  }
}

shared_ptr<Pane> Tab::removePane(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(tabMutex);
  auto it = panes.find(paneId);
  if (it == panes.end()) {
    throw NotFoundError("pane", paneId);
  }
  auto pane = it->second;

  vector<shared_ptr<Pane>> before;
  collectPanes(rootId, &before);
  int removedIndex = 0;
  for (int a = 0; a < int(before.size()); a++) {
    if (before[a]->getId() == paneId) {
      removedIndex = a;
      break;
    }
  }

  const string parentId = paneParents[paneId];
  panes.erase(it);
  paneParents.erase(paneId);

  if (parentId == id) {
    // That was the only pane
    LOG(INFO) << "Tab " << id << " has no panes left";
    rootId.clear();
    activePaneId.clear();
    return pane;
  }

  auto split = getSplit(parentId);
  auto pos = std::find(split->panesOrSplits.begin(),
                       split->panesOrSplits.end(), paneId) -
             split->panesOrSplits.begin();
  if (pos == int(split->panesOrSplits.size())) {
    STFATAL << "Parent split " << split->id << " did not contain child pane "
            << paneId;
  }
  split->panesOrSplits.erase(split->panesOrSplits.begin() + pos);
  split->sizes.erase(split->sizes.begin() + pos);

  if (split->panesOrSplits.size() > 1) {
    // Normalize the sizes array
    float total = std::accumulate(split->sizes.begin(), split->sizes.end(),
                                  0.0f);
    for (auto &size : split->sizes) {
      size /= total;
    }
  } else {
    // The split collapses into its only remaining child.
    string survivor = split->panesOrSplits[0];
    reparent(survivor, split->parentId);
    replaceChild(split->parentId, split->id, survivor);
    splits.erase(split->id);
  }

  if (activePaneId == paneId) {
    vector<shared_ptr<Pane>> after;
    collectPanes(rootId, &after);
    activePaneId = after[std::max(removedIndex - 1, 0)]->getId();
  }
  return pane;
}

vector<PaneInfo> Tab::panesWithInfo() {
  lock_guard<recursive_mutex> guard(tabMutex);
  vector<shared_ptr<Pane>> ordered;
  collectPanes(rootId, &ordered);
  vector<PaneInfo> infos;
  infos.reserve(ordered.size());
  for (int a = 0; a < int(ordered.size()); a++) {
    infos.push_back(
        PaneInfo({a, ordered[a]->getId() == activePaneId, ordered[a]}));
  }
  return infos;
}

vector<shared_ptr<Pane>> Tab::getPanes() {
  lock_guard<recursive_mutex> guard(tabMutex);
  vector<shared_ptr<Pane>> ordered;
  collectPanes(rootId, &ordered);
  return ordered;
}

shared_ptr<Pane> Tab::getPane(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(tabMutex);
  auto it = panes.find(paneId);
  if (it == panes.end()) {
    throw NotFoundError("pane", paneId);
  }
  return it->second;
}

bool Tab::hasPane(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(tabMutex);
  return panes.find(paneId) != panes.end();
}

shared_ptr<Pane> Tab::getActivePane() {
  lock_guard<recursive_mutex> guard(tabMutex);
  if (activePaneId.empty()) {
    return NULL;
  }
  return panes.at(activePaneId);
}

void Tab::setActivePane(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(tabMutex);
  if (panes.find(paneId) == panes.end()) {
    throw NotFoundError("pane", paneId);
  }
  activePaneId = paneId;
}

vector<float> Tab::getSiblingSizes(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(tabMutex);
  auto it = paneParents.find(paneId);
  if (it == paneParents.end()) {
    throw NotFoundError("pane", paneId);
  }
  if (it->second == id) {
    return {1.0f};
  }
  return getSplit(it->second)->sizes;
}

json Tab::toJson() {
  lock_guard<recursive_mutex> guard(tabMutex);
  json tab;
  tab["id"] = id;
  tab["paneOrSplit"] = rootId;
  tab["activePane"] = activePaneId;
  tab["panes"] = json::object();
  for (auto &it : panes) {
    tab["panes"][it.first] = it.second->toJson();
  }
  tab["splits"] = json::object();
  for (auto &it : splits) {
    tab["splits"][it.first] = it.second->toJson();
  }
  return tab;
}

void Tab::collectPanes(const string &nodeId, vector<shared_ptr<Pane>> *out) {
  if (nodeId.empty()) {
    return;
  }
  auto paneIt = panes.find(nodeId);
  if (paneIt != panes.end()) {
    out->push_back(paneIt->second);
    return;
  }
  for (const auto &child : getSplit(nodeId)->panesOrSplits) {
    collectPanes(child, out);
  }
}

void Tab::reparent(const string &nodeId, const string &newParentId) {
  if (panes.find(nodeId) != panes.end()) {
    paneParents[nodeId] = newParentId;
  } else {
    getSplit(nodeId)->parentId = newParentId;
  }
}

void Tab::replaceChild(const string &parentId, const string &oldChild,
                       const string &newChild) {
  if (parentId == id) {
    if (rootId != oldChild) {
      STFATAL << "Tab " << id << " root is " << rootId << ", expected "
              << oldChild;
    }
    rootId = newChild;
    return;
  }
  auto parentSplit = getSplit(parentId);
  for (auto &child : parentSplit->panesOrSplits) {
    if (child == oldChild) {
      child = newChild;
      return;
    }
  }
  STFATAL << "Split " << parentId << " did not contain child " << oldChild;
}

}  // namespace muxcore
