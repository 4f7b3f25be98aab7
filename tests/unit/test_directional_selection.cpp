/**
 * @file test_directional_selection.cpp
 * @brief Unit tests for directional nearest-neighbor selection
 */

#include <catch2/catch_test_macros.hpp>

#include "Plotline/graph/directional_selection.hpp"
#include "Plotline/graph/graph_model.hpp"

using namespace Plotline;
using namespace Plotline::graph;

namespace {

GraphNode node(const std::string &id, f64 x, f64 y) {
  GraphNode n;
  n.id = id;
  n.position = {x, y};
  return n;
}

} // namespace

TEST_CASE("Directional selection: basic directions", "[unit][graph][selection]") {
  GraphModel model;
  model.addNode(node("A", 0, 0));
  model.addNode(node("B", 0, -100));
  model.addNode(node("C", 100, 0));
  model.selectNode(std::string("A"));

  SECTION("Up from A selects B") {
    REQUIRE(model.selectDirectional(Direction::Up));
    CHECK(model.selectedNodeId() == std::optional<std::string>("B"));
  }

  SECTION("Right from A selects C") {
    REQUIRE(model.selectDirectional(Direction::Right));
    CHECK(model.selectedNodeId() == std::optional<std::string>("C"));
  }

  SECTION("No candidate leaves the selection unchanged") {
    CHECK_FALSE(model.selectDirectional(Direction::Left));
    CHECK_FALSE(model.selectDirectional(Direction::Down));
    CHECK(model.selectedNodeId() == std::optional<std::string>("A"));
  }
}

TEST_CASE("Directional selection: no selection picks the first node",
          "[unit][graph][selection]") {
  GraphModel model;
  CHECK_FALSE(model.selectDirectional(Direction::Down));

  model.addNode(node("first", 500, 500));
  model.addNode(node("second", 0, 0));

  REQUIRE(model.selectDirectional(Direction::Left));
  CHECK(model.selectedNodeId() == std::optional<std::string>("first"));
}

TEST_CASE("Directional selection: threshold and cone", "[unit][graph][selection]") {
  std::vector<GraphNode> nodes = {node("origin", 0, 0), node("near", 50, 0),
                                  node("diagonal", 120, 130), node("far", 300, 0)};

  SECTION("Offsets at the threshold do not qualify") {
    auto next = findDirectionalNeighbor(nodes, "origin", Direction::Right);
    REQUIRE(next.has_value());
    CHECK(*next == "far");
  }

  SECTION("Secondary offset must be smaller than the primary one") {
    // diagonal (dx=120, dy=130) is outside the Right cone but inside the Down one
    auto down = findDirectionalNeighbor(nodes, "origin", Direction::Down);
    REQUIRE(down.has_value());
    CHECK(*down == "diagonal");
  }

  SECTION("Custom threshold") {
    DirectionalSelectionParams params;
    params.threshold = 10.0;
    auto next = findDirectionalNeighbor(nodes, "origin", Direction::Right, params);
    REQUIRE(next.has_value());
    CHECK(*next == "near");
  }

  SECTION("Unknown current id") {
    CHECK_FALSE(findDirectionalNeighbor(nodes, "ghost", Direction::Right).has_value());
  }
}

TEST_CASE("Directional selection: score weighs the secondary axis",
          "[unit][graph][selection]") {
  // straight: score 200; offset: 150 + 0.5 * 100 = 200 -> tie keeps the earlier node
  // closer: 120 + 0.5 * 60 = 150 -> best
  std::vector<GraphNode> nodes = {node("start", 0, 0), node("straight", 200, 0),
                                  node("offset", 150, 100), node("closer", 120, -60)};

  auto next = findDirectionalNeighbor(nodes, "start", Direction::Right);
  REQUIRE(next.has_value());
  CHECK(*next == "closer");

  nodes.pop_back();
  next = findDirectionalNeighbor(nodes, "start", Direction::Right);
  REQUIRE(next.has_value());
  CHECK(*next == "straight");
}

TEST_CASE("Directional selection: injected selection accessors",
          "[unit][graph][selection]") {
  std::vector<GraphNode> nodes = {node("a", 0, 0), node("b", 0, 200)};
  std::optional<std::string> selection;
  int setterCalls = 0;

  auto getter = [&selection]() { return selection; };
  auto setter = [&](const std::string &id) {
    selection = id;
    ++setterCalls;
  };

  CHECK(navigateSelection(nodes, Direction::Down, getter, setter));
  CHECK(selection == std::optional<std::string>("a"));

  CHECK(navigateSelection(nodes, Direction::Down, getter, setter));
  CHECK(selection == std::optional<std::string>("b"));

  CHECK_FALSE(navigateSelection(nodes, Direction::Down, getter, setter));
  CHECK(setterCalls == 2);

  CHECK_FALSE(navigateSelection({}, Direction::Up, getter, setter));
  CHECK(setterCalls == 2);
}
