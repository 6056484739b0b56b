#include "Window.hpp"

#include "MuxErrors.hpp"
#include "TestHeaders.hpp"

using namespace muxcore;

namespace {
shared_ptr<Tab> makeTab(const string& name) {
  return make_shared<Tab>(name, make_shared<Pane>(name + "-pane", 0, name));
}

vector<string> tabOrder(const Window& window) {
  vector<string> ids;
  for (const auto& info : window.tabsWithInfo()) {
    ids.push_back(info.tab->getId());
  }
  return ids;
}
}  // namespace

TEST_CASE("Empty window has no tabs and no active tab", "[Window]") {
  Window window("w");
  REQUIRE(window.isEmpty());
  REQUIRE(window.tabsWithInfo().empty());
  REQUIRE(window.getActive() == nullptr);
  REQUIRE(window.getActiveIndex() == -1);
}

TEST_CASE("Single tab window reports index 0 and active", "[Window]") {
  Window window("w");
  window.push(makeTab("A"), false);

  auto infos = window.tabsWithInfo();
  REQUIRE(infos.size() == 1);
  REQUIRE(infos[0].index == 0);
  REQUIRE(infos[0].isActive == true);
  REQUIRE(infos[0].tab->getId() == "A");
}

TEST_CASE("Adding tabs does not move the active tab", "[Window]") {
  Window window("w");
  window.push(makeTab("A"), false);
  window.push(makeTab("B"), false);
  window.push(makeTab("C"), false);
  REQUIRE(window.getActive()->getId() == "A");

  SECTION("Unless asked to") {
    window.push(makeTab("D"), true);
    REQUIRE(window.getActive()->getId() == "D");
    REQUIRE(window.getActiveIndex() == 3);
  }

  SECTION("Inserting before the active tab shifts its index") {
    window.insert(0, makeTab("Z"), false);
    REQUIRE(window.getActive()->getId() == "A");
    REQUIRE(window.getActiveIndex() == 1);
    REQUIRE(tabOrder(window) == vector<string>({"Z", "A", "B", "C"}));
  }
}

TEST_CASE("tabsWithInfo indices and active flags are consistent",
          "[Window]") {
  Window window("w");
  for (int a = 0; a < 6; a++) {
    window.push(makeTab("T" + std::to_string(a)), a == 4);
  }
  window.moveTab(5, 0);
  window.remove("T2");

  auto infos = window.tabsWithInfo();
  REQUIRE(infos.size() == 5);
  int activeCount = 0;
  for (int a = 0; a < int(infos.size()); a++) {
    REQUIRE(infos[a].index == a);
    if (infos[a].isActive) {
      activeCount++;
      REQUIRE(infos[a].tab->getId() == "T4");
    }
  }
  REQUIRE(activeCount == 1);
}

TEST_CASE("Removing the active tab selects its left neighbour",
          "[Window]") {
  Window window("w");
  window.push(makeTab("A"), false);
  window.push(makeTab("B"), false);
  window.push(makeTab("C"), false);

  SECTION("Leftmost active tab hands over to the new leftmost") {
    window.remove("A");
    REQUIRE(tabOrder(window) == vector<string>({"B", "C"}));
    auto infos = window.tabsWithInfo();
    REQUIRE(infos[0].isActive == true);
    REQUIRE(infos[0].index == 0);
    REQUIRE(infos[1].isActive == false);
    REQUIRE(infos[1].index == 1);
  }

  SECTION("Middle active tab hands over to the tab on its left") {
    window.setActive("B");
    window.remove("B");
    REQUIRE(window.getActive()->getId() == "A");
  }

  SECTION("Rightmost active tab hands over to the tab on its left") {
    window.setActive("C");
    window.remove("C");
    REQUIRE(window.getActive()->getId() == "B");
  }

  SECTION("Removing an inactive tab keeps the active tab") {
    window.setActive("C");
    window.remove("A");
    REQUIRE(window.getActive()->getId() == "C");
    REQUIRE(window.getActiveIndex() == 1);
  }

  SECTION("Removing every tab leaves no active tab") {
    window.remove("A");
    window.remove("B");
    window.remove("C");
    REQUIRE(window.isEmpty());
    REQUIRE(window.getActive() == nullptr);
    REQUIRE(window.tabsWithInfo().empty());
  }
}

TEST_CASE("Reordering keeps the active tab", "[Window]") {
  Window window("w");
  window.push(makeTab("A"), false);
  window.push(makeTab("B"), true);
  window.push(makeTab("C"), false);

  window.moveTab(1, 2);
  REQUIRE(tabOrder(window) == vector<string>({"A", "C", "B"}));
  REQUIRE(window.getActive()->getId() == "B");
  REQUIRE(window.getActiveIndex() == 2);

  window.moveTab(2, 0);
  REQUIRE(tabOrder(window) == vector<string>({"B", "A", "C"}));
  REQUIRE(window.getActiveIndex() == 0);
}

TEST_CASE("Window rejects unknown tabs and indices", "[Window]") {
  Window window("w");
  window.push(makeTab("A"), false);

  REQUIRE_THROWS_AS(window.remove("nope"), NotFoundError);
  REQUIRE_THROWS_AS(window.setActive("nope"), NotFoundError);
  REQUIRE_THROWS_AS(window.setActiveByIndex(1), NotFoundError);
  REQUIRE_THROWS_AS(window.moveTab(0, 3), NotFoundError);
  REQUIRE_THROWS_AS(window.insert(5, makeTab("B"), false), NotFoundError);
  REQUIRE(tabOrder(window) == vector<string>({"A"}));
}

TEST_CASE("TabInfo serializes index, activity and tab id", "[Window]") {
  Window window("w");
  window.push(makeTab("A"), false);
  window.push(makeTab("B"), false);

  json second = window.tabsWithInfo()[1].toJson();
  REQUIRE(second["index"] == 1);
  REQUIRE(second["is_active"] == false);
  REQUIRE(second["tab"] == "B");
}
