#include "captlog/hooks/pipeline.hpp"

#include "captlog/observability/global.hpp"

#include <exception>

namespace captlog::hooks {

namespace {

common::Result<StepOutcome> run_guarded(const HookStep &step) {
  if (!step.run) {
    return common::Result<StepOutcome>::failure("no action");
  }
  try {
    return step.run();
  } catch (const std::exception &ex) {
    return common::Result<StepOutcome>::failure(std::string("exception: ") + ex.what());
  } catch (...) {
    return common::Result<StepOutcome>::failure("exception: unknown");
  }
}

} // namespace

int run_pipeline(const std::string &hook, const std::vector<HookStep> &steps) {
  for (const auto &step : steps) {
    const auto outcome = run_guarded(step);
    const bool abort_on_failure = step.policy == FailurePolicy::AbortOnFailure;

    if (!outcome.ok()) {
      observability::record_hook_step(hook, step.name, 1);
      if (abort_on_failure) {
        observability::record_error("hook", hook + " step '" + step.name +
                                                "' failed: " + outcome.error());
        return 1;
      }
      observability::record_warning("hook", hook + " step '" + step.name +
                                                "' failed: " + outcome.error());
      continue;
    }

    const auto &result = outcome.value();
    if (!result.exit_code.has_value()) {
      observability::record_hook_step(hook, step.name, 0, true);
      if (!result.detail.empty()) {
        observability::record_warning("hook", hook + " step '" + step.name +
                                                  "' skipped: " + result.detail);
      }
      continue;
    }

    const int code = *result.exit_code;
    observability::record_hook_step(hook, step.name, code);
    if (code == 0) {
      continue;
    }
    if (abort_on_failure) {
      return code;
    }
    observability::record_warning("hook", hook + " step '" + step.name + "' exited with " +
                                              std::to_string(code) +
                                              (result.detail.empty() ? "" : ": " + result.detail));
  }
  return 0;
}

} // namespace captlog::hooks
