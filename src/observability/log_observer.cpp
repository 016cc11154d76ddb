#include "captlog/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace captlog::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  auto log_line = [this](const std::string &level, const std::string &message) {
    *out_ << "[" << level << "] " << message << "\n";
  };

  std::visit(
      [&log_line](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, EntryRecordedEvent>) {
          log_line("INFO", "entry." + evt.outcome + " project=" + evt.project +
                               " section=" + evt.section + " file=" + evt.file);
        } else if constexpr (std::is_same_v<T, HookStepEvent>) {
          log_line("DEBUG", "hook.step hook=" + evt.hook + " step=" + evt.step +
                                (evt.skipped ? std::string(" skipped")
                                             : " exit=" + std::to_string(evt.exit_code)));
        } else if constexpr (std::is_same_v<T, PublishEvent>) {
          if (evt.success) {
            log_line("INFO", "publish.ok repo=" + evt.repo);
          } else {
            log_line("WARN", "publish.failed repo=" + evt.repo + ": " + evt.detail);
          }
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() { out_->flush(); }

} // namespace captlog::observability
