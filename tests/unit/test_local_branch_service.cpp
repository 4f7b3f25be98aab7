/**
 * @file test_local_branch_service.cpp
 * @brief Unit tests for the in-process branch service
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "Plotline/branch/branch_manager.hpp"
#include "Plotline/branch/local_branch_service.hpp"
#include "Plotline/graph/graph_model.hpp"

using namespace Plotline;
using namespace Plotline::branch;
using namespace Plotline::graph;
using Catch::Matchers::WithinAbs;

namespace {

GraphNode makeNode(const std::string &id, f64 importance = 0.5) {
  GraphNode node;
  node.id = id;
  node.importance = importance;
  return node;
}

} // namespace

TEST_CASE("LocalBranchService: ids derive from the parent", "[unit][branch][local]") {
  GraphModel graph;
  LocalBranchService service(graph);

  auto first = service.create("n1", "First", "main");
  REQUIRE(first.isOk());
  CHECK(first.value().branchId == "main.u001");
  CHECK(first.value().lineage == std::vector<std::string>{"main", "main.u001"});

  auto nested = service.create("n2", "Nested", "main.u001");
  REQUIRE(nested.isOk());
  CHECK(nested.value().branchId == "main.u001.u002");
  CHECK(nested.value().lineage ==
        std::vector<std::string>{"main", "main.u001", "main.u001.u002"});

  auto listed = service.list();
  REQUIRE(listed.isOk());
  CHECK(listed.value().size() == 3);
}

TEST_CASE("LocalBranchService: parent must exist and be active", "[unit][branch][local]") {
  GraphModel graph;
  LocalBranchService service(graph);

  CHECK(service.create("n1", "Orphan", "nowhere").isError());

  auto created = service.create("n1", "A", "main");
  REQUIRE(created.isOk());
  REQUIRE(service.archive(created.value().branchId, "done").isOk());
  CHECK(service.create("n2", "B", created.value().branchId).isError());
}

TEST_CASE("LocalBranchService: archive and merge transitions", "[unit][branch][local]") {
  GraphModel graph;
  LocalBranchService service(graph);
  const std::string id = service.create("n1", "A", "main").value().branchId;

  CHECK(service.archive("ghost", "x").isError());
  CHECK(service.merge(id, "ghost").isError());
  REQUIRE(service.merge(id, "main").isOk());
  CHECK(service.merge(id, "main").isError());
  CHECK(service.archive(id, "late").isError());

  auto listed = service.list().value();
  auto it = std::find_if(listed.begin(), listed.end(),
                         [&id](const Branch &b) { return b.branchId == id; });
  REQUIRE(it != listed.end());
  CHECK(it->status == BranchStatus::Merged);
  CHECK(it->mergedInto == std::optional<std::string>("main"));
}

TEST_CASE("LocalBranchService: impact from downstream nodes", "[unit][branch][local][impact]") {
  GraphModel graph;
  graph.addNode(makeNode("a", 1.0));
  graph.addNode(makeNode("b"));
  graph.addNode(makeNode("c"));
  graph.addNode(makeNode("d"));
  graph.addEdge("a", "b");
  graph.addEdge("b", "c");
  graph.addEdge("a", "d");

  LocalBranchService service(graph);

  SECTION("Reachable nodes and importance feed the score") {
    auto estimate = service.impactPreview("a");
    REQUIRE(estimate.isOk());
    CHECK(estimate.value().nodeId == "a");
    CHECK(estimate.value().descendantCount == 3);
    // 3 * 0.08 + 1.0 * 0.42
    CHECK_THAT(estimate.value().divergenceScore, WithinAbs(0.66, 1e-9));
    CHECK(estimate.value().summary ==
          "Branching at a affects 3 downstream node(s) with impact score 0.66.");
  }

  SECTION("Leaf node") {
    auto estimate = service.impactPreview("c");
    REQUIRE(estimate.isOk());
    CHECK(estimate.value().descendantCount == 0);
    CHECK_THAT(estimate.value().divergenceScore, WithinAbs(0.21, 1e-9));
  }

  SECTION("Unknown node uses the default importance") {
    auto estimate = service.impactPreview("ghost");
    REQUIRE(estimate.isOk());
    CHECK(estimate.value().descendantCount == 0);
    CHECK_THAT(estimate.value().divergenceScore,
               WithinAbs(LocalBranchService::DEFAULT_IMPORTANCE *
                             LocalBranchService::IMPORTANCE_WEIGHT,
                         1e-9));
  }
}

TEST_CASE("LocalBranchService: score is capped at one", "[unit][branch][local][impact]") {
  GraphModel graph;
  graph.addNode(makeNode("start", 1.0));
  for (int i = 0; i < 20; ++i) {
    const std::string id = "n" + std::to_string(i);
    graph.addNode(makeNode(id));
    graph.addEdge("start", id);
  }

  LocalBranchService service(graph);
  auto estimate = service.impactPreview("start");
  REQUIRE(estimate.isOk());
  CHECK(estimate.value().descendantCount == 20);
  CHECK(estimate.value().divergenceScore == 1.0);
  CHECK(estimate.value().summary.find("impact score 1.00.") != std::string::npos);
}

TEST_CASE("LocalBranchService: drives a BranchManager", "[unit][branch][local]") {
  GraphModel graph;
  graph.addNode(makeNode("n1"));
  LocalBranchService service(graph);
  BranchManager manager(service);

  auto created = manager.createBranch("n1", "Alt Ending", "main");
  REQUIRE(created.has_value());
  CHECK(created->branchId == "main.u001");
  CHECK(created->lineage == std::vector<std::string>{"main", "main.u001"});

  REQUIRE(manager.archiveBranch("main.u001", "unused"));
  CHECK(manager.findBranch("main.u001")->status == BranchStatus::Archived);

  REQUIRE(manager.refresh().isOk());
  CHECK(manager.branches().size() == 2);
  CHECK(manager.findBranch("main.u001")->status == BranchStatus::Archived);
}
