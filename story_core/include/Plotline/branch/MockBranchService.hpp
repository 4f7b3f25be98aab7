#pragma once

/**
 * @file MockBranchService.hpp
 * @brief Mock implementation of IBranchService for testing
 *
 * Provides a scriptable branch service that:
 * - Assigns predictable ids ("branch-1", "branch-2", ...)
 * - Fails or throws on demand for each operation
 * - Counts every call for verification
 */

#include "Plotline/branch/IBranchService.hpp"

#include <map>
#include <optional>
#include <stdexcept>

namespace Plotline::branch {

class MockBranchService : public IBranchService {
public:
  explicit MockBranchService(std::string rootBranchId = "main")
      : m_rootBranchId(std::move(rootBranchId)) {
    m_lineages[m_rootBranchId] = {m_rootBranchId};
  }
  ~MockBranchService() override = default;

  // =========================================================================
  // IBranchService Implementation
  // =========================================================================

  Result<BranchCreation> create(const std::string& sourceNodeId, const std::string& label,
                                const std::string& parentBranchId) override {
    m_createCount++;
    m_lastCreateSource = sourceNodeId;
    m_lastCreateLabel = label;
    m_lastCreateParent = parentBranchId;

    if (m_failCreate) {
      return Result<BranchCreation>::error("create rejected by mock");
    }

    BranchCreation creation;
    creation.branchId = "branch-" + std::to_string(++m_nextId);

    if (m_lineageOverride) {
      creation.lineage = *m_lineageOverride;
    } else {
      auto it = m_lineages.find(parentBranchId);
      creation.lineage =
          it != m_lineages.end() ? it->second : std::vector<std::string>{m_rootBranchId};
      creation.lineage.push_back(creation.branchId);
    }
    m_lineages[creation.branchId] = creation.lineage;
    return Result<BranchCreation>::ok(creation);
  }

  Result<void> archive(const std::string& branchId, const std::string& reason) override {
    m_archiveCount++;
    m_lastArchiveId = branchId;
    m_lastArchiveReason = reason;

    if (m_throwOnArchive) {
      throw std::runtime_error("archive transport failure");
    }
    if (m_failArchive) {
      return Result<void>::error("archive rejected by mock");
    }
    return Result<void>::ok();
  }

  Result<void> merge(const std::string& sourceBranchId,
                     const std::string& targetBranchId) override {
    m_mergeCount++;
    m_lastMergeSource = sourceBranchId;
    m_lastMergeTarget = targetBranchId;

    if (m_failMerge) {
      return Result<void>::error("merge rejected by mock");
    }
    return Result<void>::ok();
  }

  Result<ImpactEstimate> impactPreview(const std::string& nodeId) override {
    m_impactCount++;
    m_lastImpactNode = nodeId;

    if (m_failImpact) {
      return Result<ImpactEstimate>::error("impact preview unavailable");
    }

    auto it = m_impacts.find(nodeId);
    if (it != m_impacts.end()) {
      return Result<ImpactEstimate>::ok(it->second);
    }

    ImpactEstimate estimate;
    estimate.nodeId = nodeId;
    estimate.descendantCount = static_cast<i32>(m_impactCount);
    estimate.divergenceScore = 0.5;
    estimate.summary = "mock estimate for " + nodeId;
    return Result<ImpactEstimate>::ok(estimate);
  }

  Result<std::vector<Branch>> list() override {
    m_listCount++;
    if (m_failList) {
      return Result<std::vector<Branch>>::error("list unavailable");
    }
    return Result<std::vector<Branch>>::ok(m_listed);
  }

  // =========================================================================
  // Scripting
  // =========================================================================

  void setFailCreate(bool fail) { m_failCreate = fail; }
  void setFailArchive(bool fail) { m_failArchive = fail; }
  void setThrowOnArchive(bool shouldThrow) { m_throwOnArchive = shouldThrow; }
  void setFailMerge(bool fail) { m_failMerge = fail; }
  void setFailImpact(bool fail) { m_failImpact = fail; }
  void setFailList(bool fail) { m_failList = fail; }

  /**
   * @brief Return this lineage from every subsequent create()
   */
  void setLineageOverride(std::optional<std::vector<std::string>> lineage) {
    m_lineageOverride = std::move(lineage);
  }

  void setImpact(const std::string& nodeId, const ImpactEstimate& estimate) {
    m_impacts[nodeId] = estimate;
  }

  void setListedBranches(std::vector<Branch> branches) { m_listed = std::move(branches); }

  // =========================================================================
  // Verification
  // =========================================================================

  [[nodiscard]] int getCreateCount() const { return m_createCount; }
  [[nodiscard]] int getArchiveCount() const { return m_archiveCount; }
  [[nodiscard]] int getMergeCount() const { return m_mergeCount; }
  [[nodiscard]] int getImpactCount() const { return m_impactCount; }
  [[nodiscard]] int getListCount() const { return m_listCount; }

  [[nodiscard]] const std::string& getLastCreateSource() const { return m_lastCreateSource; }
  [[nodiscard]] const std::string& getLastCreateLabel() const { return m_lastCreateLabel; }
  [[nodiscard]] const std::string& getLastCreateParent() const { return m_lastCreateParent; }
  [[nodiscard]] const std::string& getLastArchiveId() const { return m_lastArchiveId; }
  [[nodiscard]] const std::string& getLastArchiveReason() const { return m_lastArchiveReason; }
  [[nodiscard]] const std::string& getLastMergeSource() const { return m_lastMergeSource; }
  [[nodiscard]] const std::string& getLastMergeTarget() const { return m_lastMergeTarget; }
  [[nodiscard]] const std::string& getLastImpactNode() const { return m_lastImpactNode; }

  void resetCounters() {
    m_createCount = 0;
    m_archiveCount = 0;
    m_mergeCount = 0;
    m_impactCount = 0;
    m_listCount = 0;
  }

private:
  std::string m_rootBranchId;
  std::map<std::string, std::vector<std::string>> m_lineages;
  std::map<std::string, ImpactEstimate> m_impacts;
  std::vector<Branch> m_listed;
  std::optional<std::vector<std::string>> m_lineageOverride;
  int m_nextId = 0;

  bool m_failCreate = false;
  bool m_failArchive = false;
  bool m_throwOnArchive = false;
  bool m_failMerge = false;
  bool m_failImpact = false;
  bool m_failList = false;

  int m_createCount = 0;
  int m_archiveCount = 0;
  int m_mergeCount = 0;
  int m_impactCount = 0;
  int m_listCount = 0;

  std::string m_lastCreateSource;
  std::string m_lastCreateLabel;
  std::string m_lastCreateParent;
  std::string m_lastArchiveId;
  std::string m_lastArchiveReason;
  std::string m_lastMergeSource;
  std::string m_lastMergeTarget;
  std::string m_lastImpactNode;
};

} // namespace Plotline::branch
