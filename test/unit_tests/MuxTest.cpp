#include "Mux.hpp"

#include <type_traits>

#include "TestHeaders.hpp"

using namespace muxcore;

namespace {
template <typename T, typename = void>
struct CanSplitPane : std::false_type {};
template <typename T>
struct CanSplitPane<T, std::void_t<decltype(std::declval<T&>().splitPane(
                           PaneId(), shared_ptr<Pane>(), SplitRequest()))>>
    : std::true_type {};

template <typename T, typename = void>
struct CanRemovePane : std::false_type {};
template <typename T>
struct CanRemovePane<
    T, std::void_t<decltype(std::declval<T&>().removePane(PaneId()))>>
    : std::true_type {};

template <typename T, typename = void>
struct CanSetActivePane : std::false_type {};
template <typename T>
struct CanSetActivePane<
    T, std::void_t<decltype(std::declval<T&>().setActivePane(PaneId()))>>
    : std::true_type {};

vector<TabId> spawnTabs(Mux& mux, const WindowId& windowId, int count) {
  vector<TabId> ids;
  for (int a = 0; a < count; a++) {
    ids.push_back(mux.spawnTab(windowId, SpawnCommand(), false)->getId());
  }
  return ids;
}

void checkSnapshot(const vector<TabInfo>& infos) {
  int activeCount = 0;
  for (int a = 0; a < int(infos.size()); a++) {
    REQUIRE(infos[a].index == a);
    if (infos[a].isActive) {
      activeCount++;
    }
  }
  if (infos.empty()) {
    REQUIRE(activeCount == 0);
  } else {
    REQUIRE(activeCount == 1);
  }
}
}  // namespace

TEST_CASE("tabsWithInfo follows display order", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  REQUIRE(mux.tabsWithInfo(windowId).empty());

  auto ids = spawnTabs(mux, windowId, 4);
  auto infos = mux.tabsWithInfo(windowId);
  REQUIRE(infos.size() == 4);
  checkSnapshot(infos);
  for (int a = 0; a < 4; a++) {
    REQUIRE(infos[a].tab->getId() == ids[a]);
  }
  // The first tab became active because the window was empty
  REQUIRE(infos[0].isActive);
}

TEST_CASE("Removing the leftmost active tab activates the next one",
          "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 3);
  REQUIRE(mux.getActiveTab(windowId)->getId() == ids[0]);

  mux.removeTab(ids[0]);
  auto infos = mux.tabsWithInfo(windowId);
  REQUIRE(infos.size() == 2);
  REQUIRE(infos[0].tab->getId() == ids[1]);
  REQUIRE(infos[0].index == 0);
  REQUIRE(infos[0].isActive);
  REQUIRE(infos[1].tab->getId() == ids[2]);
  REQUIRE(infos[1].index == 1);
  REQUIRE_FALSE(infos[1].isActive);
  REQUIRE_THROWS_AS(mux.getTab(ids[0]), NotFoundError);
}

TEST_CASE("Reordering tabs only changes the active tab's index", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 3);
  mux.setActiveTab(windowId, ids[1]);

  mux.moveTab(windowId, 1, 0);
  auto infos = mux.tabsWithInfo(windowId);
  REQUIRE(infos[0].tab->getId() == ids[1]);
  REQUIRE(infos[0].isActive);
  checkSnapshot(infos);

  mux.setActiveTabByIndex(windowId, 2);
  REQUIRE(mux.getActiveTab(windowId)->getId() == ids[2]);
}

TEST_CASE("Stale ids fail with NotFoundError", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 2);
  PaneId paneId = mux.getTab(ids[0])->getActivePane()->getId();

  mux.removeWindow(windowId);
  REQUIRE_FALSE(mux.hasWindow(windowId));
  REQUIRE(mux.windowIds().empty());
  REQUIRE_THROWS_AS(mux.tabsWithInfo(windowId), NotFoundError);
  REQUIRE_THROWS_AS(mux.getTab(ids[1]), NotFoundError);
  REQUIRE_THROWS_AS(mux.getPane(paneId), NotFoundError);
  REQUIRE_THROWS_AS(mux.spawnTab(windowId, SpawnCommand()), NotFoundError);

  try {
    mux.tabsWithInfo("no-such-window");
    FAIL("Expected NotFoundError");
  } catch (const NotFoundError& nfe) {
    REQUIRE(nfe.getKind() == "window");
    REQUIRE(nfe.getId() == "no-such-window");
  }
}

TEST_CASE("Moving a tab to another window re-parents it", "[Mux]") {
  Mux mux;
  WindowId first = mux.newWindow();
  WindowId second = mux.newWindow();
  REQUIRE(mux.windowIds() == vector<WindowId>({first, second}));
  auto firstIds = spawnTabs(mux, first, 2);
  auto secondIds = spawnTabs(mux, second, 1);

  mux.moveTabToWindow(firstIds[0], second);
  REQUIRE(mux.windowForTab(firstIds[0]) == second);

  auto firstInfos = mux.tabsWithInfo(first);
  REQUIRE(firstInfos.size() == 1);
  REQUIRE(firstInfos[0].tab->getId() == firstIds[1]);
  REQUIRE(firstInfos[0].isActive);

  auto secondInfos = mux.tabsWithInfo(second);
  REQUIRE(secondInfos.size() == 2);
  REQUIRE(secondInfos[1].tab->getId() == firstIds[0]);
  REQUIRE_FALSE(secondInfos[1].isActive);
  REQUIRE(mux.getActiveTab(second)->getId() == secondIds[0]);

  PaneId movedPane = mux.getTab(firstIds[0])->getActivePane()->getId();
  REQUIRE(mux.resolvePaneId(movedPane).windowId == second);

  REQUIRE_THROWS_AS(mux.moveTabToWindow(firstIds[1], "gone"), NotFoundError);
  REQUIRE(mux.windowForTab(firstIds[1]) == first);
}

TEST_CASE("Tabs added by hand keep the active tab unless asked", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 1);

  auto tab = make_shared<Tab>(newUuid(), make_shared<Pane>(newUuid(), 0, "x"));
  mux.insertTabInWindow(tab, windowId, 0);
  REQUIRE(mux.getActiveTab(windowId)->getId() == ids[0]);
  REQUIRE(mux.tabsWithInfo(windowId)[0].tab == tab);

  REQUIRE_THROWS_AS(mux.addTabToWindow(tab, windowId), std::runtime_error);

  auto other = make_shared<Tab>(newUuid(), make_shared<Pane>(newUuid(), 0, "y"));
  mux.addTabToWindow(other, windowId, true);
  REQUIRE(mux.getActiveTab(windowId) == other);
}

TEST_CASE("Splitting and closing panes through the mux", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 2);
  auto tab = mux.getTab(ids[0]);
  PaneId rootPane = tab->getActivePane()->getId();

  SplitRequest request;
  auto newPane = mux.splitPane(ids[0], rootPane, request,
                               SplitSource::spawn(SpawnCommand()));
  REQUIRE(tab->numPanes() == 2);
  auto location = mux.resolvePaneId(newPane->getId());
  REQUIRE(location.tabId == ids[0]);
  REQUIRE(location.windowId == windowId);
  REQUIRE(location.domainId == mux.getDefaultDomain()->domainId());

  auto paneInfos = mux.panesWithInfo(ids[0]);
  REQUIRE(paneInfos.size() == 2);
  REQUIRE(paneInfos[1].isActive);
  mux.setActivePane(ids[0], rootPane);
  REQUIRE(mux.panesWithInfo(ids[0])[0].isActive);

  SECTION("Closing the last pane removes the tab") {
    mux.closePane(newPane->getId());
    mux.closePane(rootPane);
    REQUIRE_THROWS_AS(mux.getTab(ids[0]), NotFoundError);
    auto infos = mux.tabsWithInfo(windowId);
    REQUIRE(infos.size() == 1);
    REQUIRE(infos[0].isActive);
  }

  SECTION("Moving the only pane of a tab removes that tab") {
    PaneId otherPane = mux.getTab(ids[1])->getActivePane()->getId();
    mux.splitPane(ids[0], rootPane, request,
                  SplitSource::movePane(otherPane));
    REQUIRE(tab->numPanes() == 3);
    REQUIRE(mux.resolvePaneId(otherPane).tabId == ids[0]);
    REQUIRE_THROWS_AS(mux.getTab(ids[1]), NotFoundError);
    REQUIRE(mux.tabsWithInfo(windowId).size() == 1);
  }

  SECTION("A pane cannot be split with itself") {
    REQUIRE_THROWS_AS(mux.splitPane(ids[0], rootPane, request,
                                    SplitSource::movePane(rootPane)),
                      std::runtime_error);
    REQUIRE(tab->numPanes() == 2);
  }

  SECTION("Unknown panes are reported") {
    REQUIRE_THROWS_AS(mux.closePane("nope"), NotFoundError);
    REQUIRE_THROWS_AS(mux.splitPane(ids[0], "nope", request,
                                    SplitSource::spawn(SpawnCommand())),
                      NotFoundError);
    REQUIRE_THROWS_AS(mux.splitPane(ids[0], rootPane, request,
                                    SplitSource::movePane("nope")),
                      NotFoundError);
    REQUIRE(tab->numPanes() == 2);
  }
}

TEST_CASE("Tabs handed out by the mux cannot be restructured", "[Mux]") {
  STATIC_REQUIRE_FALSE(CanSplitPane<Tab>::value);
  STATIC_REQUIRE_FALSE(CanRemovePane<Tab>::value);
  STATIC_REQUIRE_FALSE(CanSetActivePane<Tab>::value);

  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 2);
  PaneId rootPane = mux.getTab(ids[0])->getActivePane()->getId();
  PaneId otherPane = mux.getTab(ids[1])->getActivePane()->getId();
  mux.splitPane(ids[0], rootPane, SplitRequest(),
                SplitSource::spawn(SpawnCommand()));
  mux.splitPane(ids[0], rootPane, SplitRequest(),
                SplitSource::movePane(otherPane));

  // Every pane a tab reports is also known to the mux, and vice versa
  for (const auto& info : mux.tabsWithInfo(windowId)) {
    REQUIRE_FALSE(info.tab->isDead());
    for (const auto& pane : info.tab->getPanes()) {
      REQUIRE(mux.getPane(pane->getId()) == pane);
      REQUIRE(mux.resolvePaneId(pane->getId()).tabId == info.tab->getId());
    }
  }
  REQUIRE(mux.tabsWithInfo(windowId).size() == 1);
}

TEST_CASE("Moving a tab within its own window", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 3);
  mux.setActiveTab(windowId, ids[2]);

  mux.moveTabToWindow(ids[0], windowId);
  auto infos = mux.tabsWithInfo(windowId);
  REQUIRE(infos.size() == 3);
  REQUIRE(infos[0].tab->getId() == ids[1]);
  REQUIRE(infos[1].tab->getId() == ids[2]);
  REQUIRE(infos[2].tab->getId() == ids[0]);
  REQUIRE(infos[1].isActive);
  REQUIRE(mux.windowForTab(ids[0]) == windowId);
  checkSnapshot(infos);

  mux.moveTabToWindow(ids[1], windowId, true);
  infos = mux.tabsWithInfo(windowId);
  REQUIRE(infos[2].tab->getId() == ids[1]);
  REQUIRE(infos[2].isActive);
  REQUIRE(mux.getActiveTab(windowId)->getId() == ids[1]);
  checkSnapshot(infos);
}

TEST_CASE("Split panes can be spawned in a named domain", "[Mux]") {
  Mux mux;
  auto remote = make_shared<LocalDomain>("remote");
  mux.addDomain(remote);
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 1);
  auto tab = mux.getTab(ids[0]);
  PaneId rootPane = tab->getActivePane()->getId();
  REQUIRE(tab->getActivePane()->getDomainId() ==
          mux.getDefaultDomain()->domainId());

  SpawnCommand command;
  command.args = {"top"};
  auto pane = mux.splitPane(ids[0], rootPane, SplitRequest(),
                            SplitSource::spawn(command, "remote"));
  REQUIRE(pane->getDomainId() == remote->domainId());
  REQUIRE(pane->getDescription() == "\"top\" in domain \"remote\"");
  REQUIRE(mux.resolvePaneId(pane->getId()).domainId == remote->domainId());

  try {
    mux.splitPane(ids[0], rootPane, SplitRequest(),
                  SplitSource::spawn(command, "nowhere"));
    FAIL("Expected NotFoundError");
  } catch (const NotFoundError& nfe) {
    REQUIRE(nfe.getKind() == "domain");
    REQUIRE(nfe.getId() == "nowhere");
  }
  REQUIRE(tab->numPanes() == 2);
}

TEST_CASE("Mux state serializes to JSON", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  auto ids = spawnTabs(mux, windowId, 2);
  mux.setActiveTab(windowId, ids[1]);

  json state = json::parse(mux.toJsonString());
  REQUIRE(state["windows"].size() == 1);
  REQUIRE(state["windows"][0]["id"] == windowId);
  REQUIRE(state["windows"][0]["activeTab"] == ids[1]);
  REQUIRE(state["windows"][0]["tabs"][1]["is_active"] == true);
  REQUIRE(state["windows"][0]["tabs"][1]["index"] == 1);
  REQUIRE(state["domains"][0]["name"] == "local");
  REQUIRE(state["domains"][0]["state"] == "attached");
}

TEST_CASE("Concurrent mutation never exposes a broken snapshot", "[Mux]") {
  Mux mux;
  WindowId windowId = mux.newWindow();
  spawnTabs(mux, windowId, 3);

  std::atomic<bool> done(false);
  std::thread mutator([&]() {
    for (int a = 0; a < 300; a++) {
      auto tab = mux.spawnTab(windowId, SpawnCommand(), a % 2 == 0);
      mux.moveTab(windowId, mux.tabsWithInfo(windowId).size() - 1, 0);
      if (a % 3 == 0) {
        mux.removeTab(mux.getActiveTab(windowId)->getId());
      } else if (a % 5 == 0) {
        mux.removeTab(tab->getId());
      }
    }
    done = true;
  });

  int snapshots = 0;
  while (!done) {
    auto infos = mux.tabsWithInfo(windowId);
    int activeCount = 0;
    bool indicesOk = true;
    for (int a = 0; a < int(infos.size()); a++) {
      indicesOk = indicesOk && infos[a].index == a;
      activeCount += infos[a].isActive ? 1 : 0;
    }
    REQUIRE(indicesOk);
    REQUIRE(activeCount == (infos.empty() ? 0 : 1));
    snapshots++;
  }
  mutator.join();
  checkSnapshot(mux.tabsWithInfo(windowId));
  REQUIRE(snapshots > 0);
}
