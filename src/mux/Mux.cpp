#include "Mux.hpp"

namespace muxcore {
SplitSource SplitSource::spawn(const SpawnCommand &command,
                               const string &domainName) {
  SplitSource source;
  source.type = SPAWN;
  source.command = command;
  source.domainName = domainName;
  return source;
}

SplitSource SplitSource::movePane(const PaneId &paneId) {
  SplitSource source;
  source.type = MOVE_PANE;
  source.paneId = paneId;
  return source;
}

Mux::Mux() : Mux(make_shared<LocalDomain>("local")) {}

Mux::Mux(shared_ptr<Domain> defaultDomain)
    : defaultDomainId(defaultDomain->domainId()) {
  addDomain(defaultDomain);
}

void Mux::addDomain(shared_ptr<Domain> domain) {
  lock_guard<recursive_mutex> guard(muxMutex);
  if (domains.find(domain->domainId()) != domains.end()) {
    STFATAL << "Domain id registered twice: " << domain->domainId();
  }
  for (auto &it : domains) {
    if (it.second->domainName() == domain->domainName()) {
      throw std::runtime_error("Domain name already registered: " +
                               domain->domainName());
    }
  }
  LOG(INFO) << "Adding domain " << domain->domainName() << " ("
            << domain->domainId() << ")";
  domains.insert(make_pair(domain->domainId(), domain));
}

shared_ptr<Domain> Mux::getDomain(DomainId domainId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto it = domains.find(domainId);
  if (it == domains.end()) {
    throw NotFoundError("domain", std::to_string(domainId));
  }
  return it->second;
}

shared_ptr<Domain> Mux::getDomainByName(const string &name) {
  lock_guard<recursive_mutex> guard(muxMutex);
  for (auto &it : domains) {
    if (it.second->domainName() == name) {
      return it.second;
    }
  }
  throw NotFoundError("domain", name);
}

shared_ptr<Domain> Mux::getDefaultDomain() { return getDomain(defaultDomainId); }

vector<shared_ptr<Domain>> Mux::getDomains() {
  lock_guard<recursive_mutex> guard(muxMutex);
  vector<shared_ptr<Domain>> retval;
  for (auto &it : domains) {
    retval.push_back(it.second);
  }
  return retval;
}

WindowId Mux::newWindow() {
  lock_guard<recursive_mutex> guard(muxMutex);
  WindowId windowId = newUuid();
  windows.insert(make_pair(windowId, make_shared<Window>(windowId)));
  windowOrder.push_back(windowId);
  LOG(INFO) << "Created window " << windowId;
  return windowId;
}

void Mux::removeWindow(const WindowId &windowId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto window = getWindow(windowId);
  for (auto &it : domains) {
    it.second->localWindowIsClosing(windowId);
  }
  for (auto &tab : window->getTabs()) {
    unregisterTab(tab);
  }
  windows.erase(windowId);
  windowOrder.erase(
      std::remove(windowOrder.begin(), windowOrder.end(), windowId),
      windowOrder.end());
  LOG(INFO) << "Removed window " << windowId << " with " << window->size()
            << " tabs";
}

vector<WindowId> Mux::windowIds() {
  lock_guard<recursive_mutex> guard(muxMutex);
  return windowOrder;
}

bool Mux::hasWindow(const WindowId &windowId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  return windows.find(windowId) != windows.end();
}

vector<TabInfo> Mux::tabsWithInfo(const WindowId &windowId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  return getWindow(windowId)->tabsWithInfo();
}

void Mux::addTabToWindow(shared_ptr<Tab> tab, const WindowId &windowId,
                         bool activate) {
  lock_guard<recursive_mutex> guard(muxMutex);
  insertTabInWindow(tab, windowId, getWindow(windowId)->size(), activate);
}

void Mux::insertTabInWindow(shared_ptr<Tab> tab, const WindowId &windowId,
                            int index, bool activate) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto window = getWindow(windowId);
  if (tabWindows.find(tab->getId()) != tabWindows.end()) {
    throw std::runtime_error("Tab " + tab->getId() +
                             " already belongs to window " +
                             tabWindows[tab->getId()]);
  }
  for (auto &pane : tab->getPanes()) {
    if (paneTabs.find(pane->getId()) != paneTabs.end()) {
      throw std::runtime_error("Pane " + pane->getId() +
                               " already belongs to tab " +
                               paneTabs[pane->getId()]);
    }
  }
  window->insert(index, tab, activate);
  registerTab(tab, windowId);
  VLOG(1) << "Added tab " << tab->getId() << " to window " << windowId
          << " at " << index;
}

shared_ptr<Tab> Mux::spawnTab(const WindowId &windowId, DomainId domainId,
                              const SpawnCommand &command, bool activate) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto window = getWindow(windowId);
  auto domain = getSpawnableDomain(domainId);
  auto pane = domain->spawnPane(command);
  auto tab = make_shared<Tab>(newUuid(), pane);
  window->push(tab, activate);
  registerTab(tab, windowId);
  LOG(INFO) << "Spawned tab " << tab->getId() << " in window " << windowId
            << ": " << pane->getDescription();
  return tab;
}

shared_ptr<Tab> Mux::spawnTab(const WindowId &windowId,
                              const SpawnCommand &command, bool activate) {
  return spawnTab(windowId, defaultDomainId, command, activate);
}

void Mux::removeTab(const TabId &tabId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  removeTabLocked(tabId);
}

void Mux::moveTab(const WindowId &windowId, int from, int to) {
  lock_guard<recursive_mutex> guard(muxMutex);
  getWindow(windowId)->moveTab(from, to);
}

void Mux::moveTabToWindow(const TabId &tabId, const WindowId &destWindowId,
                          bool activate) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto it = tabWindows.find(tabId);
  if (it == tabWindows.end()) {
    throw NotFoundError("tab", tabId);
  }
  auto sourceWindow = getWindow(it->second);
  auto destWindow = getWindow(destWindowId);
  if (sourceWindow == destWindow) {
    sourceWindow->moveTab(sourceWindow->indexOf(tabId),
                          sourceWindow->size() - 1);
    if (activate) {
      sourceWindow->setActive(tabId);
    }
    return;
  }
  auto tab = sourceWindow->remove(tabId);
  destWindow->push(tab, activate);
  it->second = destWindowId;
  LOG(INFO) << "Moved tab " << tabId << " from window "
            << sourceWindow->getId() << " to window " << destWindowId;
}

void Mux::setActiveTab(const WindowId &windowId, const TabId &tabId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  getWindow(windowId)->setActive(tabId);
}

void Mux::setActiveTabByIndex(const WindowId &windowId, int index) {
  lock_guard<recursive_mutex> guard(muxMutex);
  getWindow(windowId)->setActiveByIndex(index);
}

shared_ptr<Tab> Mux::getActiveTab(const WindowId &windowId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  return getWindow(windowId)->getActive();
}

shared_ptr<Tab> Mux::getTab(const TabId &tabId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  return getTabLocked(tabId);
}

WindowId Mux::windowForTab(const TabId &tabId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto it = tabWindows.find(tabId);
  if (it == tabWindows.end()) {
    throw NotFoundError("tab", tabId);
  }
  return it->second;
}

shared_ptr<Pane> Mux::getPane(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto it = paneTabs.find(paneId);
  if (it == paneTabs.end()) {
    throw NotFoundError("pane", paneId);
  }
  return getTabLocked(it->second)->getPane(paneId);
}

PaneLocation Mux::resolvePaneId(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto pane = getPane(paneId);
  const TabId &tabId = paneTabs[paneId];
  return PaneLocation({pane->getDomainId(), tabWindows[tabId], tabId});
}

vector<PaneInfo> Mux::panesWithInfo(const TabId &tabId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  return getTabLocked(tabId)->panesWithInfo();
}

void Mux::setActivePane(const TabId &tabId, const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  getTabLocked(tabId)->setActivePane(paneId);
}

shared_ptr<Pane> Mux::splitPane(const TabId &tabId, const PaneId &paneId,
                                const SplitRequest &request,
                                const SplitSource &source) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto tab = getTabLocked(tabId);
  auto target = tab->getPane(paneId);
  if (!(request.size > 0.0f && request.size < 1.0f)) {
    throw std::runtime_error("Invalid split size: " +
                             std::to_string(request.size));
  }

  shared_ptr<Pane> pane;
  if (source.type == SplitSource::SPAWN) {
    auto domain = source.domainName.empty()
                      ? getSpawnableDomain(target->getDomainId())
                      : getSpawnableDomain(
                            getDomainByName(source.domainName)->domainId());
    pane = domain->spawnPane(source.command);
  } else {
    if (source.paneId == paneId) {
      throw std::runtime_error("Cannot split pane " + paneId +
                               " with itself");
    }
    auto it = paneTabs.find(source.paneId);
    if (it == paneTabs.end()) {
      throw NotFoundError("pane", source.paneId);
    }
    const TabId sourceTabId = it->second;
    auto sourceTab = getTabLocked(sourceTabId);
    pane = sourceTab->removePane(source.paneId);
    paneTabs.erase(it);
    if (sourceTab->isDead()) {
      LOG(INFO) << "Removing tab " << sourceTabId
                << " after moving its last pane";
      removeTabLocked(sourceTabId);
    }
  }

  tab->splitPane(paneId, pane, request);
  paneTabs[pane->getId()] = tabId;
  return pane;
}

void Mux::closePane(const PaneId &paneId) {
  lock_guard<recursive_mutex> guard(muxMutex);
  auto it = paneTabs.find(paneId);
  if (it == paneTabs.end()) {
    throw NotFoundError("pane", paneId);
  }
  const TabId tabId = it->second;
  auto tab = getTabLocked(tabId);
  tab->removePane(paneId);
  paneTabs.erase(it);
  if (tab->isDead()) {
    removeTabLocked(tabId);
  }
}

string Mux::toJsonString() {
  lock_guard<recursive_mutex> guard(muxMutex);
  json state;
  state["windows"] = json::array();
  for (auto &windowId : windowOrder) {
    state["windows"].push_back(windows[windowId]->toJson());
  }
  state["domains"] = json::array();
  for (auto &it : domains) {
    state["domains"].push_back(it.second->toJson());
  }
  state["defaultDomain"] = defaultDomainId;
  return state.dump();
}

shared_ptr<Tab> Mux::getTabLocked(const TabId &tabId) {
  auto it = tabWindows.find(tabId);
  if (it == tabWindows.end()) {
    throw NotFoundError("tab", tabId);
  }
  auto window = getWindow(it->second);
  int index = window->indexOf(tabId);
  if (index < 0) {
    STFATAL << "Tab " << tabId << " is registered to window " << it->second
            << " but the window does not own it";
  }
  return window->getByIndex(index);
}

shared_ptr<Domain> Mux::getSpawnableDomain(DomainId domainId) {
  auto domain = getDomain(domainId);
  if (!domain->spawnable()) {
    throw std::runtime_error("Domain " + domain->domainName() +
                             " cannot spawn panes");
  }
  return domain;
}

void Mux::registerTab(shared_ptr<Tab> tab, const WindowId &windowId) {
  tabWindows[tab->getId()] = windowId;
  for (auto &pane : tab->getPanes()) {
    paneTabs[pane->getId()] = tab->getId();
  }
}

void Mux::unregisterTab(shared_ptr<Tab> tab) {
  tabWindows.erase(tab->getId());
  for (auto &pane : tab->getPanes()) {
    paneTabs.erase(pane->getId());
  }
}

void Mux::removeTabLocked(const TabId &tabId) {
  auto it = tabWindows.find(tabId);
  if (it == tabWindows.end()) {
    throw NotFoundError("tab", tabId);
  }
  auto tab = getWindow(it->second)->remove(tabId);
  unregisterTab(tab);
  VLOG(1) << "Removed tab " << tabId;
}

}  // namespace muxcore
