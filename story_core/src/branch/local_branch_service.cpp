#include "Plotline/branch/local_branch_service.hpp"
#include "Plotline/core/logger.hpp"

#include <algorithm>
#include <cstdio>

namespace Plotline::branch {

LocalBranchService::LocalBranchService(const graph::GraphModel& graph, std::string rootBranchId,
                                       std::string rootLabel)
    : m_graph(graph) {
  Branch root;
  root.branchId = rootBranchId;
  root.sourceNodeId = "root";
  root.label = std::move(rootLabel);
  root.status = BranchStatus::Active;
  root.lineage = {rootBranchId};
  root.createdAt = formatIsoTimestamp(std::chrono::system_clock::now());
  m_branches.push_back(std::move(root));
}

Branch* LocalBranchService::find(const std::string& branchId) {
  auto it = std::find_if(m_branches.begin(), m_branches.end(),
                         [&branchId](const Branch& b) { return b.branchId == branchId; });
  return it != m_branches.end() ? &(*it) : nullptr;
}

Result<BranchCreation> LocalBranchService::create(const std::string& sourceNodeId,
                                                  const std::string& label,
                                                  const std::string& parentBranchId) {
  Branch* parent = find(parentBranchId);
  if (!parent) {
    return Result<BranchCreation>::error("Unknown parent branch: " + parentBranchId);
  }
  if (parent->status != BranchStatus::Active) {
    return Result<BranchCreation>::error("Parent branch is not active: " + parentBranchId);
  }

  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), ".u%03u", ++m_counter);

  BranchCreation creation;
  creation.branchId = parentBranchId + suffix;
  creation.lineage = parent->lineage;
  creation.lineage.push_back(creation.branchId);

  Branch branch;
  branch.branchId = creation.branchId;
  branch.parentBranchId = parentBranchId;
  branch.sourceNodeId = sourceNodeId;
  branch.label = label;
  branch.status = BranchStatus::Active;
  branch.lineage = creation.lineage;
  branch.createdAt = formatIsoTimestamp(std::chrono::system_clock::now());
  m_branches.push_back(std::move(branch));

  PLOTLINE_LOG_DEBUG("LocalBranchService: created '" + creation.branchId + "'");
  return Result<BranchCreation>::ok(creation);
}

Result<void> LocalBranchService::archive(const std::string& branchId, const std::string& reason) {
  Branch* branch = find(branchId);
  if (!branch) {
    return Result<void>::error("Unknown branch: " + branchId);
  }
  if (branch->status != BranchStatus::Active) {
    return Result<void>::error("Branch is not active: " + branchId);
  }

  branch->status = BranchStatus::Archived;
  branch->archiveReason = reason;
  return Result<void>::ok();
}

Result<void> LocalBranchService::merge(const std::string& sourceBranchId,
                                       const std::string& targetBranchId) {
  Branch* source = find(sourceBranchId);
  if (!source || !find(targetBranchId)) {
    return Result<void>::error("Unknown branch in merge: " + sourceBranchId + " -> " +
                               targetBranchId);
  }
  if (source->status != BranchStatus::Active) {
    return Result<void>::error("Branch is not active: " + sourceBranchId);
  }

  source->status = BranchStatus::Merged;
  source->mergedInto = targetBranchId;
  return Result<void>::ok();
}

Result<ImpactEstimate> LocalBranchService::impactPreview(const std::string& nodeId) {
  const auto downstream = m_graph.descendants(nodeId);
  const graph::GraphNode* node = m_graph.findNode(nodeId);
  const f64 importance = node ? node->importance : DEFAULT_IMPORTANCE;

  ImpactEstimate estimate;
  estimate.nodeId = nodeId;
  estimate.descendantCount = static_cast<i32>(downstream.size());
  estimate.divergenceScore =
      std::clamp(estimate.descendantCount * DESCENDANT_WEIGHT + importance * IMPORTANCE_WEIGHT,
                 0.0, 1.0);

  char score[16];
  std::snprintf(score, sizeof(score), "%.2f", estimate.divergenceScore);
  estimate.summary = "Branching at " + nodeId + " affects " +
                     std::to_string(estimate.descendantCount) +
                     " downstream node(s) with impact score " + score + ".";
  return Result<ImpactEstimate>::ok(estimate);
}

Result<std::vector<Branch>> LocalBranchService::list() {
  return Result<std::vector<Branch>>::ok(m_branches);
}

} // namespace Plotline::branch
