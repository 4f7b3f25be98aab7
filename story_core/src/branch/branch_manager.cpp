#include "Plotline/branch/branch_manager.hpp"
#include "Plotline/core/logger.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace Plotline::branch {

namespace {

// Service implementations may throw; convert that into an ordinary failure
template <typename T, typename Fn> Result<T> callService(const char* operation, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& e) {
    return Result<T>::error(std::string(operation) + " threw: " + e.what());
  }
}

} // namespace

BranchManager::BranchManager(IBranchService& service, BranchManagerSettings settings)
    : m_service(service), m_settings(std::move(settings)) {
  ensureRootBranch();
}

void BranchManager::ensureRootBranch() {
  if (findBranch(m_settings.rootBranchId)) {
    return;
  }

  Branch root;
  root.branchId = m_settings.rootBranchId;
  root.sourceNodeId = "root";
  root.label = m_settings.rootLabel;
  root.status = BranchStatus::Active;
  root.lineage = {m_settings.rootBranchId};
  root.createdAt = formatIsoTimestamp(std::chrono::system_clock::now());
  root.syncState = BranchSyncState::Confirmed;
  m_branches.insert(m_branches.begin(), std::move(root));
}

// ============================================================================
// Loading
// ============================================================================

Result<void> BranchManager::refresh() {
  auto listed = callService<std::vector<Branch>>("list", [this]() { return m_service.list(); });
  if (listed.isError()) {
    PLOTLINE_LOG_ERROR("BranchManager: failed to load branches: " + listed.error());
    return Result<void>::error(listed.error());
  }

  m_branches = std::move(listed).value();
  ensureRootBranch();
  PLOTLINE_LOG_INFO("BranchManager: loaded {} branch(es)", m_branches.size());
  return Result<void>::ok();
}

// ============================================================================
// Creation
// ============================================================================

std::optional<Branch> BranchManager::createBranch(const std::string& sourceNodeId,
                                                  const std::string& label) {
  return createBranch(sourceNodeId, label, m_settings.rootBranchId);
}

std::optional<Branch> BranchManager::createBranch(const std::string& sourceNodeId,
                                                  const std::string& label,
                                                  const std::string& parentBranchId) {
  if (sourceNodeId.empty()) {
    PLOTLINE_LOG_DEBUG("BranchManager: branch creation without a source node ignored");
    return std::nullopt;
  }

  std::optional<std::vector<std::string>> parentLineage;
  if (const Branch* parent = findBranch(parentBranchId)) {
    if (parent->status != BranchStatus::Active) {
      PLOTLINE_LOG_DEBUG("BranchManager: parent '" + parentBranchId + "' is " +
                         toString(parent->status) + ", cannot fork from it");
      return std::nullopt;
    }
    parentLineage = parent->lineage;
  }

  auto created = callService<BranchCreation>("create", [&]() {
    return m_service.create(sourceNodeId, label, parentBranchId);
  });
  if (created.isError()) {
    PLOTLINE_LOG_ERROR("BranchManager: failed to create branch at '" + sourceNodeId +
                       "': " + created.error());
    return std::nullopt;
  }

  const BranchCreation& creation = created.value();
  if (!validateLineage(creation, parentLineage)) {
    PLOTLINE_LOG_ERROR("BranchManager: service returned an inconsistent lineage for '" +
                       creation.branchId + "'");
    return std::nullopt;
  }

  Branch branch;
  branch.branchId = creation.branchId;
  branch.parentBranchId = parentBranchId;
  branch.sourceNodeId = sourceNodeId;
  branch.label = label;
  branch.status = BranchStatus::Active;
  branch.lineage = creation.lineage;
  branch.createdAt = formatIsoTimestamp(std::chrono::system_clock::now());
  branch.syncState = BranchSyncState::Confirmed;

  m_branches.push_back(branch);
  PLOTLINE_LOG_INFO("BranchManager: created branch '" + branch.branchId + "' (" + label + ")");
  notifyChanged(m_branches.back());
  return branch;
}

bool BranchManager::validateLineage(
    const BranchCreation& creation,
    const std::optional<std::vector<std::string>>& parentLineage) const {
  if (creation.branchId.empty() || findBranch(creation.branchId)) {
    return false;
  }
  const auto& lineage = creation.lineage;
  if (lineage.size() < 2 || lineage.front() != m_settings.rootBranchId ||
      lineage.back() != creation.branchId) {
    return false;
  }
  if (parentLineage) {
    if (lineage.size() != parentLineage->size() + 1) {
      return false;
    }
    return std::equal(parentLineage->begin(), parentLineage->end(), lineage.begin());
  }
  return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool BranchManager::archiveBranch(const std::string& branchId, const std::string& reason) {
  Branch* branch = findBranchMutable(branchId);
  if (!branch) {
    PLOTLINE_LOG_DEBUG("BranchManager: cannot archive unknown branch '" + branchId + "'");
    return false;
  }
  if (branch->status != BranchStatus::Active) {
    PLOTLINE_LOG_DEBUG("BranchManager: branch '" + branchId + "' is already " +
                       toString(branch->status));
    return false;
  }

  PendingMutation previous{branch->status, branch->mergedInto, branch->archiveReason};
  branch->status = BranchStatus::Archived;
  branch->archiveReason = reason;
  branch->syncState = BranchSyncState::Pending;
  notifyChanged(*branch);

  auto outcome = callService<void>("archive",
                                   [&]() { return m_service.archive(branchId, reason); });
  return settleMutation(branchId, previous, outcome, "archive");
}

bool BranchManager::mergeBranch(const std::string& sourceBranchId,
                                const std::string& targetBranchId) {
  if (sourceBranchId == targetBranchId) {
    PLOTLINE_LOG_DEBUG("BranchManager: cannot merge '" + sourceBranchId + "' into itself");
    return false;
  }

  Branch* branch = findBranchMutable(sourceBranchId);
  if (!branch) {
    PLOTLINE_LOG_DEBUG("BranchManager: cannot merge unknown branch '" + sourceBranchId + "'");
    return false;
  }
  if (branch->status != BranchStatus::Active) {
    PLOTLINE_LOG_DEBUG("BranchManager: branch '" + sourceBranchId + "' is already " +
                       toString(branch->status));
    return false;
  }

  PendingMutation previous{branch->status, branch->mergedInto, branch->archiveReason};
  branch->status = BranchStatus::Merged;
  branch->mergedInto = targetBranchId;
  branch->syncState = BranchSyncState::Pending;
  notifyChanged(*branch);

  auto outcome = callService<void>(
      "merge", [&]() { return m_service.merge(sourceBranchId, targetBranchId); });
  return settleMutation(sourceBranchId, previous, outcome, "merge");
}

bool BranchManager::settleMutation(const std::string& branchId, const PendingMutation& previous,
                                   const Result<void>& outcome, const char* operation) {
  // The service may have triggered a refresh; look the record up again
  Branch* branch = findBranchMutable(branchId);
  if (!branch) {
    return outcome.isOk();
  }

  if (outcome.isOk()) {
    branch->syncState = BranchSyncState::Confirmed;
    PLOTLINE_LOG_INFO(std::string("BranchManager: ") + operation + " of '" + branchId +
                      "' confirmed");
    notifyChanged(*branch);
    return true;
  }

  PLOTLINE_LOG_ERROR(std::string("BranchManager: ") + operation + " of '" + branchId +
                     "' failed: " + outcome.error());

  if (m_settings.mutationPolicy == MutationPolicy::RollbackOnFailure) {
    branch->status = previous.status;
    branch->mergedInto = previous.mergedInto;
    branch->archiveReason = previous.archiveReason;
  } else {
    PLOTLINE_LOG_WARN("BranchManager: keeping unconfirmed status '" +
                      std::string(toString(branch->status)) + "' on '" + branchId + "'");
  }
  branch->syncState = BranchSyncState::Failed;
  notifyChanged(*branch);
  return false;
}

// ============================================================================
// Impact preview
// ============================================================================

std::optional<ImpactEstimate> BranchManager::previewImpact(const std::string& nodeId) {
  m_lastImpact.reset();
  if (nodeId.empty()) {
    return std::nullopt;
  }

  auto estimate = callService<ImpactEstimate>(
      "impactPreview", [&]() { return m_service.impactPreview(nodeId); });
  if (estimate.isError()) {
    PLOTLINE_LOG_ERROR("BranchManager: impact preview for '{}' failed: {}", nodeId,
                       estimate.error());
    return std::nullopt;
  }

  ImpactEstimate result = std::move(estimate).value();
  if (result.nodeId.empty()) {
    result.nodeId = nodeId;
  }
  result.divergenceScore = std::clamp(result.divergenceScore, 0.0, 1.0);
  m_lastImpact = result;
  return result;
}

// ============================================================================
// Queries
// ============================================================================

const Branch* BranchManager::findBranch(const std::string& branchId) const {
  auto it = std::find_if(m_branches.begin(), m_branches.end(),
                         [&branchId](const Branch& b) { return b.branchId == branchId; });
  return it != m_branches.end() ? &(*it) : nullptr;
}

Branch* BranchManager::findBranchMutable(const std::string& branchId) {
  auto it = std::find_if(m_branches.begin(), m_branches.end(),
                         [&branchId](const Branch& b) { return b.branchId == branchId; });
  return it != m_branches.end() ? &(*it) : nullptr;
}

std::vector<Branch> BranchManager::branchesWithStatus(BranchStatus status) const {
  std::vector<Branch> result;
  std::copy_if(m_branches.begin(), m_branches.end(), std::back_inserter(result),
               [status](const Branch& b) { return b.status == status; });
  return result;
}

std::vector<std::string> BranchManager::lineageOf(const std::string& branchId) const {
  const Branch* branch = findBranch(branchId);
  return branch ? branch->lineage : std::vector<std::string>{};
}

void BranchManager::setOnBranchChanged(BranchChangeCallback callback) {
  m_onBranchChanged = std::move(callback);
}

void BranchManager::notifyChanged(const Branch& branch) {
  if (m_onBranchChanged) {
    // Copy: the callback may cause m_branches to reallocate
    Branch copy = branch;
    m_onBranchChanged(copy);
  }
}

} // namespace Plotline::branch
