#pragma once

/**
 * @file branch_types.hpp
 * @brief Branch records, lineage and impact estimates
 */

#include "Plotline/core/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Plotline::branch {

/**
 * @brief Lifecycle status; Archived and Merged are terminal
 */
enum class BranchStatus { Active, Archived, Merged };

/**
 * @brief Whether the local status has been acknowledged by the branch service
 */
enum class BranchSyncState { Confirmed, Pending, Failed };

/**
 * @brief What to do with an optimistic archive/merge the service rejects
 */
enum class MutationPolicy {
  KeepOptimistic,   ///< keep the applied status, mark it Failed
  RollbackOnFailure ///< restore the previous status, mark it Failed
};

/**
 * @brief One alternate timeline
 *
 * lineage lists branch ids from the root to this branch, inclusive; it
 * always begins with the root id. parentBranchId is empty only for the root.
 */
struct Branch {
  std::string branchId;
  std::optional<std::string> parentBranchId;
  std::string sourceNodeId;
  std::string label;
  BranchStatus status = BranchStatus::Active;
  std::vector<std::string> lineage;
  std::string createdAt; ///< ISO-8601, UTC
  BranchSyncState syncState = BranchSyncState::Confirmed;
  std::optional<std::string> mergedInto;
  std::optional<std::string> archiveReason;
};

/**
 * @brief Identity assigned by the branch service on creation
 */
struct BranchCreation {
  std::string branchId;
  std::vector<std::string> lineage;
};

/**
 * @brief Externally produced estimate of the downstream effect of branching
 * at a node
 */
struct ImpactEstimate {
  std::string nodeId;
  i32 descendantCount = 0;
  f64 divergenceScore = 0.0; ///< 0..1
  std::string summary;
};

[[nodiscard]] const char* toString(BranchStatus status);
[[nodiscard]] const char* toString(BranchSyncState state);
[[nodiscard]] const char* toString(MutationPolicy policy);
[[nodiscard]] std::optional<BranchStatus> parseBranchStatus(std::string_view name);
[[nodiscard]] std::optional<MutationPolicy> parseMutationPolicy(std::string_view name);

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SSZ"
 */
[[nodiscard]] std::string formatIsoTimestamp(std::chrono::system_clock::time_point time);

} // namespace Plotline::branch
