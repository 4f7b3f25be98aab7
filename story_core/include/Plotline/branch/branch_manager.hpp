#pragma once

/**
 * @file branch_manager.hpp
 * @brief Branch lifecycle, lineage and impact preview
 *
 * BranchManager keeps the local view of every branch and forwards lifecycle
 * requests to an IBranchService. Archive and merge are applied locally
 * before the service answers; the outcome is tracked in Branch::syncState
 * and a service rejection is handled according to the MutationPolicy.
 *
 * Status transitions only go forward:
 *   Active -> Archived
 *   Active -> Merged
 */

#include "Plotline/branch/IBranchService.hpp"
#include "Plotline/branch/branch_types.hpp"
#include "Plotline/core/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Plotline::branch {

struct BranchManagerSettings {
  std::string rootBranchId = "main";
  std::string rootLabel = "Main Timeline";
  MutationPolicy mutationPolicy = MutationPolicy::KeepOptimistic;
};

using BranchChangeCallback = std::function<void(const Branch&)>;

class BranchManager {
public:
  explicit BranchManager(IBranchService& service, BranchManagerSettings settings = {});

  BranchManager(const BranchManager&) = delete;
  BranchManager& operator=(const BranchManager&) = delete;

  /**
   * @brief Replace the local records with the service's branch list
   *
   * The root branch is recreated locally if the service does not report it.
   */
  Result<void> refresh();

  /**
   * @brief Fork a new branch at @p sourceNodeId under the root branch
   */
  std::optional<Branch> createBranch(const std::string& sourceNodeId, const std::string& label);

  /**
   * @brief Fork a new branch at @p sourceNodeId under @p parentBranchId
   *
   * Rejected without contacting the service when @p sourceNodeId is empty or
   * the parent is known locally and not Active. The lineage returned by the
   * service must start with the root id, end with the new id and, for a
   * locally known parent, equal the parent's lineage plus the new id.
   *
   * @return The recorded branch, or std::nullopt (nothing recorded)
   */
  std::optional<Branch> createBranch(const std::string& sourceNodeId, const std::string& label,
                                     const std::string& parentBranchId);

  /**
   * @brief Archive an Active branch
   * @return true once the service has confirmed the change
   */
  bool archiveBranch(const std::string& branchId, const std::string& reason);

  /**
   * @brief Merge an Active branch into @p targetBranchId
   *
   * Only the source branch changes locally; the target record is left as is.
   * @return true once the service has confirmed the change
   */
  bool mergeBranch(const std::string& sourceBranchId, const std::string& targetBranchId);

  /**
   * @brief Ask the service for a fresh estimate for @p nodeId
   *
   * Every call goes to the service; the previous estimate is discarded first,
   * so a failed request leaves lastImpact() empty.
   */
  std::optional<ImpactEstimate> previewImpact(const std::string& nodeId);

  [[nodiscard]] const std::optional<ImpactEstimate>& lastImpact() const { return m_lastImpact; }

  [[nodiscard]] const Branch* findBranch(const std::string& branchId) const;
  [[nodiscard]] const std::vector<Branch>& branches() const { return m_branches; }
  [[nodiscard]] std::vector<Branch> branchesWithStatus(BranchStatus status) const;

  /**
   * @brief Lineage of @p branchId, or an empty list if unknown
   */
  [[nodiscard]] std::vector<std::string> lineageOf(const std::string& branchId) const;

  [[nodiscard]] const std::string& rootBranchId() const { return m_settings.rootBranchId; }

  void setMutationPolicy(MutationPolicy policy) { m_settings.mutationPolicy = policy; }
  [[nodiscard]] MutationPolicy mutationPolicy() const { return m_settings.mutationPolicy; }

  /**
   * @brief Called after every local change to a branch record
   */
  void setOnBranchChanged(BranchChangeCallback callback);

private:
  /**
   * @brief Snapshot of the fields an optimistic mutation touches
   */
  struct PendingMutation {
    BranchStatus status = BranchStatus::Active;
    std::optional<std::string> mergedInto;
    std::optional<std::string> archiveReason;
  };

  Branch* findBranchMutable(const std::string& branchId);
  void ensureRootBranch();
  bool validateLineage(const BranchCreation& creation,
                       const std::optional<std::vector<std::string>>& parentLineage) const;

  bool settleMutation(const std::string& branchId, const PendingMutation& previous,
                      const Result<void>& outcome, const char* operation);
  void notifyChanged(const Branch& branch);

  IBranchService& m_service;
  BranchManagerSettings m_settings;
  std::vector<Branch> m_branches;
  std::optional<ImpactEstimate> m_lastImpact;
  BranchChangeCallback m_onBranchChanged;
};

} // namespace Plotline::branch
