#include "Plotline/branch/branch_types.hpp"

#include <ctime>

namespace Plotline::branch {

const char* toString(BranchStatus status) {
  switch (status) {
  case BranchStatus::Active:
    return "active";
  case BranchStatus::Archived:
    return "archived";
  case BranchStatus::Merged:
    return "merged";
  }
  return "active";
}

const char* toString(BranchSyncState state) {
  switch (state) {
  case BranchSyncState::Confirmed:
    return "confirmed";
  case BranchSyncState::Pending:
    return "pending";
  case BranchSyncState::Failed:
    return "failed";
  }
  return "confirmed";
}

const char* toString(MutationPolicy policy) {
  switch (policy) {
  case MutationPolicy::KeepOptimistic:
    return "keep_optimistic";
  case MutationPolicy::RollbackOnFailure:
    return "rollback_on_failure";
  }
  return "keep_optimistic";
}

std::optional<BranchStatus> parseBranchStatus(std::string_view name) {
  if (name == "active")
    return BranchStatus::Active;
  if (name == "archived")
    return BranchStatus::Archived;
  if (name == "merged")
    return BranchStatus::Merged;
  return std::nullopt;
}

std::optional<MutationPolicy> parseMutationPolicy(std::string_view name) {
  if (name == "keep_optimistic")
    return MutationPolicy::KeepOptimistic;
  if (name == "rollback_on_failure")
    return MutationPolicy::RollbackOnFailure;
  return std::nullopt;
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point time) {
  const std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  char buffer[32];
  if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
    return {};
  }
  return buffer;
}

} // namespace Plotline::branch
