#include "Window.hpp"

#include "MuxErrors.hpp"

namespace muxcore {
json TabInfo::toJson() const {
  json info;
  info["index"] = index;
  info["is_active"] = isActive;
  info["tab"] = tab->getId();
  return info;
}

Window::Window(const WindowId &_id) : id(_id) {}

void Window::push(shared_ptr<Tab> tab, bool activate) {
  insert(int(tabs.size()), tab, activate);
}

void Window::insert(int index, shared_ptr<Tab> tab, bool activate) {
  if (index < 0 || index > int(tabs.size())) {
    throw NotFoundError("tab index", std::to_string(index));
  }
  if (contains(tab->getId())) {
    STFATAL << "Tab " << tab->getId() << " is already in window " << id;
  }
  tabs.insert(tabs.begin() + index, tab);
  if (activate || activeTabId.empty()) {
    activeTabId = tab->getId();
  }
  validate();
}

shared_ptr<Tab> Window::remove(const TabId &tabId) {
  int index = indexOf(tabId);
  if (index < 0) {
    throw NotFoundError("tab", tabId);
  }
  auto tab = tabs[index];
  tabs.erase(tabs.begin() + index);
  if (activeTabId == tabId) {
    if (tabs.empty()) {
      activeTabId.clear();
    } else {
      activeTabId = tabs[std::max(index - 1, 0)]->getId();
    }
  }
  validate();
  return tab;
}

void Window::moveTab(int from, int to) {
  if (from < 0 || from >= int(tabs.size())) {
    throw NotFoundError("tab index", std::to_string(from));
  }
  if (to < 0 || to >= int(tabs.size())) {
    throw NotFoundError("tab index", std::to_string(to));
  }
  auto tab = tabs[from];
  tabs.erase(tabs.begin() + from);
  tabs.insert(tabs.begin() + to, tab);
  validate();
}

void Window::setActive(const TabId &tabId) {
  if (!contains(tabId)) {
    throw NotFoundError("tab", tabId);
  }
  activeTabId = tabId;
}

void Window::setActiveByIndex(int index) {
  activeTabId = getByIndex(index)->getId();
}

shared_ptr<Tab> Window::getActive() const {
  int index = getActiveIndex();
  if (index < 0) {
    return NULL;
  }
  return tabs[index];
}

int Window::getActiveIndex() const {
  if (activeTabId.empty()) {
    return -1;
  }
  return indexOf(activeTabId);
}

int Window::indexOf(const TabId &tabId) const {
  for (int a = 0; a < int(tabs.size()); a++) {
    if (tabs[a]->getId() == tabId) {
      return a;
    }
  }
  return -1;
}

shared_ptr<Tab> Window::getByIndex(int index) const {
  if (index < 0 || index >= int(tabs.size())) {
    throw NotFoundError("tab index", std::to_string(index));
  }
  return tabs[index];
}

vector<TabInfo> Window::tabsWithInfo() const {
  vector<TabInfo> infos;
  infos.reserve(tabs.size());
  for (int a = 0; a < int(tabs.size()); a++) {
    infos.push_back(TabInfo({a, tabs[a]->getId() == activeTabId, tabs[a]}));
  }
  return infos;
}

json Window::toJson() const {
  json window;
  window["id"] = id;
  window["activeTab"] = activeTabId;
  window["tabs"] = json::array();
  for (const auto &info : tabsWithInfo()) {
    json tab = info.tab->toJson();
    tab["index"] = info.index;
    tab["is_active"] = info.isActive;
    window["tabs"].push_back(tab);
  }
  return window;
}

void Window::validate() const {
  if (tabs.empty()) {
    if (!activeTabId.empty()) {
      STFATAL << "Window " << id << " is empty but has active tab "
              << activeTabId;
    }
    return;
  }
  if (indexOf(activeTabId) < 0) {
    STFATAL << "Window " << id << " active tab " << activeTabId
            << " is not one of its tabs";
  }
}

}  // namespace muxcore
