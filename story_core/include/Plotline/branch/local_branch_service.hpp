#pragma once

/**
 * @file local_branch_service.hpp
 * @brief In-process IBranchService backed by a GraphModel
 *
 * Used when no remote branch backend is configured. Branch ids are derived
 * from the parent ("main.u001", "main.u001.u002", ...) and impact estimates
 * are computed from the reachable part of the graph.
 */

#include "Plotline/branch/IBranchService.hpp"
#include "Plotline/graph/graph_model.hpp"

#include <string>
#include <vector>

namespace Plotline::branch {

class LocalBranchService : public IBranchService {
public:
  /// Weight of each downstream node in the divergence score
  static constexpr f64 DESCENDANT_WEIGHT = 0.08;
  /// Weight of the node's importance in the divergence score
  static constexpr f64 IMPORTANCE_WEIGHT = 0.42;
  /// Importance assumed for nodes the graph does not contain
  static constexpr f64 DEFAULT_IMPORTANCE = 0.5;

  explicit LocalBranchService(const graph::GraphModel& graph, std::string rootBranchId = "main",
                              std::string rootLabel = "Main Timeline");

  Result<BranchCreation> create(const std::string& sourceNodeId, const std::string& label,
                                const std::string& parentBranchId) override;
  Result<void> archive(const std::string& branchId, const std::string& reason) override;
  Result<void> merge(const std::string& sourceBranchId,
                     const std::string& targetBranchId) override;
  Result<ImpactEstimate> impactPreview(const std::string& nodeId) override;
  Result<std::vector<Branch>> list() override;

private:
  Branch* find(const std::string& branchId);

  const graph::GraphModel& m_graph;
  std::vector<Branch> m_branches;
  u32 m_counter = 0;
};

} // namespace Plotline::branch
