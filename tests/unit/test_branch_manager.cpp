/**
 * @file test_branch_manager.cpp
 * @brief Unit tests for BranchManager using the mock branch service
 */

#include <catch2/catch_test_macros.hpp>

#include "Plotline/branch/MockBranchService.hpp"
#include "Plotline/branch/branch_manager.hpp"

#include <vector>

using namespace Plotline;
using namespace Plotline::branch;

TEST_CASE("BranchManager: root branch exists from the start", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  const Branch *root = manager.findBranch("main");
  REQUIRE(root != nullptr);
  CHECK(root->label == "Main Timeline");
  CHECK(root->status == BranchStatus::Active);
  CHECK(root->lineage == std::vector<std::string>{"main"});
  CHECK(root->sourceNodeId == "root");
  CHECK_FALSE(root->parentBranchId.has_value());
  CHECK(manager.rootBranchId() == "main");
  CHECK(service.getListCount() == 0);
}

TEST_CASE("BranchManager: create, archive lifecycle", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  auto created = manager.createBranch("node-1", "Alt Ending", "main");
  REQUIRE(created.has_value());
  CHECK(created->status == BranchStatus::Active);
  CHECK(created->syncState == BranchSyncState::Confirmed);
  CHECK(created->sourceNodeId == "node-1");
  CHECK(created->label == "Alt Ending");
  CHECK(created->parentBranchId == std::optional<std::string>("main"));
  CHECK(created->lineage == std::vector<std::string>{"main", created->branchId});
  CHECK_FALSE(created->createdAt.empty());

  CHECK(service.getLastCreateSource() == "node-1");
  CHECK(service.getLastCreateLabel() == "Alt Ending");
  CHECK(service.getLastCreateParent() == "main");

  REQUIRE(manager.archiveBranch(created->branchId, "dead end"));
  const Branch *archived = manager.findBranch(created->branchId);
  REQUIRE(archived != nullptr);
  CHECK(archived->status == BranchStatus::Archived);
  CHECK(archived->syncState == BranchSyncState::Confirmed);
  CHECK(archived->archiveReason == std::optional<std::string>("dead end"));
  CHECK(service.getLastArchiveReason() == "dead end");

  SECTION("An archived branch never becomes Active again") {
    CHECK_FALSE(manager.archiveBranch(created->branchId, "again"));
    CHECK_FALSE(manager.mergeBranch(created->branchId, "main"));
    CHECK(service.getArchiveCount() == 1);
    CHECK(service.getMergeCount() == 0);
    CHECK(manager.findBranch(created->branchId)->status == BranchStatus::Archived);
  }

  SECTION("An archived parent cannot be forked") {
    CHECK_FALSE(manager.createBranch("node-2", "Child", created->branchId).has_value());
    CHECK(service.getCreateCount() == 1);
  }
}

TEST_CASE("BranchManager: two-argument create forks from the root", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  auto created = manager.createBranch("node-7", "Detour");
  REQUIRE(created.has_value());
  CHECK(service.getLastCreateParent() == "main");
  CHECK(created->lineage.front() == "main");
}

TEST_CASE("BranchManager: nested lineage", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  auto child = manager.createBranch("n1", "Child", "main");
  REQUIRE(child.has_value());
  auto grandchild = manager.createBranch("n2", "Grandchild", child->branchId);
  REQUIRE(grandchild.has_value());

  CHECK(grandchild->lineage ==
        std::vector<std::string>{"main", child->branchId, grandchild->branchId});
  CHECK(manager.lineageOf(grandchild->branchId) == grandchild->lineage);
  CHECK(manager.lineageOf("unknown").empty());
}

TEST_CASE("BranchManager: creation rejections record nothing", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  std::vector<Branch> changes;
  manager.setOnBranchChanged([&changes](const Branch &b) { changes.push_back(b); });

  SECTION("Empty source node never reaches the service") {
    CHECK_FALSE(manager.createBranch("", "Nothing", "main").has_value());
    CHECK(service.getCreateCount() == 0);
  }

  SECTION("Service failure") {
    service.setFailCreate(true);
    CHECK_FALSE(manager.createBranch("n1", "Fails", "main").has_value());
    CHECK(service.getCreateCount() == 1);
  }

  SECTION("Lineage not rooted at the root branch") {
    service.setLineageOverride(std::vector<std::string>{"other", "branch-1"});
    CHECK_FALSE(manager.createBranch("n1", "Bad", "main").has_value());
  }

  SECTION("Lineage not ending with the new id") {
    service.setLineageOverride(std::vector<std::string>{"main", "elsewhere"});
    CHECK_FALSE(manager.createBranch("n1", "Bad", "main").has_value());
  }

  SECTION("Lineage that skips the parent") {
    auto child = manager.createBranch("n1", "Child", "main");
    REQUIRE(child.has_value());
    changes.clear();

    // the next id will be branch-2
    service.setLineageOverride(std::vector<std::string>{"main", "branch-2"});
    CHECK_FALSE(manager.createBranch("n2", "Skips", child->branchId).has_value());
    CHECK(manager.branches().size() == 2);
  }

  CHECK(changes.empty());
  CHECK(manager.branches().size() <= 2);
}

TEST_CASE("BranchManager: unknown parent accepts a rooted lineage", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  // Parent unknown locally and to the mock: lineage is [main, id]
  auto created = manager.createBranch("n1", "Orphan", "remote-only");
  REQUIRE(created.has_value());
  CHECK(created->parentBranchId == std::optional<std::string>("remote-only"));
  CHECK(created->lineage == std::vector<std::string>{"main", created->branchId});
}

TEST_CASE("BranchManager: merge changes only the source", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  auto a = manager.createBranch("n1", "A", "main");
  auto b = manager.createBranch("n2", "B", "main");
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());

  REQUIRE(manager.mergeBranch(a->branchId, b->branchId));
  CHECK(service.getLastMergeSource() == a->branchId);
  CHECK(service.getLastMergeTarget() == b->branchId);

  const Branch *source = manager.findBranch(a->branchId);
  CHECK(source->status == BranchStatus::Merged);
  CHECK(source->mergedInto == b->branchId);
  CHECK(source->syncState == BranchSyncState::Confirmed);

  const Branch *target = manager.findBranch(b->branchId);
  CHECK(target->status == BranchStatus::Active);
  CHECK_FALSE(target->mergedInto.has_value());

  CHECK(manager.branchesWithStatus(BranchStatus::Merged).size() == 1);
  CHECK(manager.branchesWithStatus(BranchStatus::Active).size() == 2);
}

TEST_CASE("BranchManager: invalid lifecycle requests", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);

  CHECK_FALSE(manager.archiveBranch("ghost", "x"));
  CHECK_FALSE(manager.mergeBranch("ghost", "main"));
  CHECK_FALSE(manager.mergeBranch("main", "main"));
  CHECK(service.getArchiveCount() == 0);
  CHECK(service.getMergeCount() == 0);
}

TEST_CASE("BranchManager: failed mutations follow the policy", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);
  auto created = manager.createBranch("n1", "A", "main");
  REQUIRE(created.has_value());

  std::vector<Branch> changes;
  manager.setOnBranchChanged([&changes](const Branch &b) { changes.push_back(b); });

  SECTION("KeepOptimistic leaves the new status marked Failed") {
    service.setFailArchive(true);
    CHECK_FALSE(manager.archiveBranch(created->branchId, "why"));

    const Branch *branch = manager.findBranch(created->branchId);
    CHECK(branch->status == BranchStatus::Archived);
    CHECK(branch->syncState == BranchSyncState::Failed);

    REQUIRE(changes.size() == 2);
    CHECK(changes[0].syncState == BranchSyncState::Pending);
    CHECK(changes[1].syncState == BranchSyncState::Failed);
  }

  SECTION("RollbackOnFailure restores the previous status") {
    manager.setMutationPolicy(MutationPolicy::RollbackOnFailure);
    service.setFailMerge(true);
    CHECK_FALSE(manager.mergeBranch(created->branchId, "main"));

    const Branch *branch = manager.findBranch(created->branchId);
    CHECK(branch->status == BranchStatus::Active);
    CHECK_FALSE(branch->mergedInto.has_value());
    CHECK(branch->syncState == BranchSyncState::Failed);

    // Active again, so a retry is allowed
    service.setFailMerge(false);
    CHECK(manager.mergeBranch(created->branchId, "main"));
    CHECK(manager.findBranch(created->branchId)->syncState == BranchSyncState::Confirmed);
  }

  SECTION("A throwing service is treated as a failure") {
    manager.setMutationPolicy(MutationPolicy::RollbackOnFailure);
    service.setThrowOnArchive(true);
    CHECK_FALSE(manager.archiveBranch(created->branchId, "boom"));

    const Branch *branch = manager.findBranch(created->branchId);
    CHECK(branch->status == BranchStatus::Active);
    CHECK_FALSE(branch->archiveReason.has_value());
    CHECK(branch->syncState == BranchSyncState::Failed);
  }
}

TEST_CASE("BranchManager: impact preview", "[unit][branch][impact]") {
  MockBranchService service;
  BranchManager manager(service);

  SECTION("Every request reaches the service") {
    auto first = manager.previewImpact("n1");
    auto second = manager.previewImpact("n1");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(service.getImpactCount() == 2);
    CHECK(first->descendantCount == 1);
    CHECK(second->descendantCount == 2);
    CHECK(manager.lastImpact()->descendantCount == 2);
  }

  SECTION("A failed request clears the last estimate") {
    REQUIRE(manager.previewImpact("n1").has_value());
    REQUIRE(manager.lastImpact().has_value());

    service.setFailImpact(true);
    CHECK_FALSE(manager.previewImpact("n2").has_value());
    CHECK_FALSE(manager.lastImpact().has_value());
    CHECK(service.getLastImpactNode() == "n2");
  }

  SECTION("Empty node id clears without a request") {
    REQUIRE(manager.previewImpact("n1").has_value());
    CHECK_FALSE(manager.previewImpact("").has_value());
    CHECK_FALSE(manager.lastImpact().has_value());
    CHECK(service.getImpactCount() == 1);
  }

  SECTION("Scores are clamped and the node id filled in") {
    ImpactEstimate scripted;
    scripted.descendantCount = 40;
    scripted.divergenceScore = 3.5;
    scripted.summary = "huge";
    service.setImpact("n9", scripted);

    auto estimate = manager.previewImpact("n9");
    REQUIRE(estimate.has_value());
    CHECK(estimate->nodeId == "n9");
    CHECK(estimate->divergenceScore == 1.0);
    CHECK(estimate->summary == "huge");
  }
}

TEST_CASE("BranchManager: refresh replaces local records", "[unit][branch]") {
  MockBranchService service;
  BranchManager manager(service);
  REQUIRE(manager.createBranch("n1", "Local", "main").has_value());

  Branch remote;
  remote.branchId = "remote-1";
  remote.label = "Remote";
  remote.lineage = {"main", "remote-1"};
  service.setListedBranches({remote});

  SECTION("Success") {
    REQUIRE(manager.refresh().isOk());
    CHECK(service.getListCount() == 1);
    REQUIRE(manager.branches().size() == 2);
    CHECK(manager.branches()[0].branchId == "main");
    CHECK(manager.findBranch("remote-1") != nullptr);
    CHECK(manager.findBranch("branch-1") == nullptr);
  }

  SECTION("Failure keeps the current records") {
    service.setFailList(true);
    auto result = manager.refresh();
    REQUIRE(result.isError());
    CHECK(result.error() == "list unavailable");
    CHECK(manager.findBranch("branch-1") != nullptr);
  }
}

TEST_CASE("BranchManager: custom root settings", "[unit][branch]") {
  MockBranchService service("trunk");
  BranchManagerSettings settings;
  settings.rootBranchId = "trunk";
  settings.rootLabel = "Trunk";
  BranchManager manager(service, settings);

  REQUIRE(manager.findBranch("trunk") != nullptr);
  CHECK(manager.findBranch("main") == nullptr);

  auto created = manager.createBranch("n1", "Side");
  REQUIRE(created.has_value());
  CHECK(created->lineage.front() == "trunk");
}
