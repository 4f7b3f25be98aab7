#pragma once

/**
 * @file IBranchService.hpp
 * @brief Branch service interface for decoupling from the transport layer
 *
 * The branch service owns branch identity and impact estimation. Calls are
 * synchronous from the caller's point of view; an implementation that talks
 * to a remote backend blocks or completes before returning.
 */

#include "Plotline/branch/branch_types.hpp"
#include "Plotline/core/result.hpp"

#include <string>
#include <vector>

namespace Plotline::branch {

class IBranchService {
public:
  virtual ~IBranchService() = default;

  /**
   * @brief Create a branch forked at @p sourceNodeId under @p parentBranchId
   * @return Assigned id and lineage (root first, new id last)
   */
  virtual Result<BranchCreation> create(const std::string& sourceNodeId,
                                        const std::string& label,
                                        const std::string& parentBranchId) = 0;

  virtual Result<void> archive(const std::string& branchId, const std::string& reason) = 0;

  virtual Result<void> merge(const std::string& sourceBranchId,
                             const std::string& targetBranchId) = 0;

  /**
   * @brief Estimate the effect of branching at @p nodeId
   */
  virtual Result<ImpactEstimate> impactPreview(const std::string& nodeId) = 0;

  /**
   * @brief All branches known to the service, root included
   */
  virtual Result<std::vector<Branch>> list() = 0;
};

} // namespace Plotline::branch
