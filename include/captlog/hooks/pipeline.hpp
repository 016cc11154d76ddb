#pragma once

#include "captlog/common/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace captlog::hooks {

enum class FailurePolicy {
  AbortOnFailure,
  WarnOnFailure,
};

/// What a step did. `exit_code` is nullopt when the step chose not to run; a
/// skip with a non-empty detail is reported as a warning.
struct StepOutcome {
  std::optional<int> exit_code;
  std::string detail;

  static StepOutcome ran(int code) { return StepOutcome{.exit_code = code, .detail = ""}; }
  static StepOutcome skipped(std::string why) {
    return StepOutcome{.exit_code = std::nullopt, .detail = std::move(why)};
  }
};

struct HookStep {
  std::string name;
  FailurePolicy policy = FailurePolicy::WarnOnFailure;
  std::function<common::Result<StepOutcome>()> run;
};

[[nodiscard]] int run_pipeline(const std::string &hook, const std::vector<HookStep> &steps);

} // namespace captlog::hooks
