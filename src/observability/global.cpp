#include "captlog/observability/global.hpp"

#include "captlog/observability/log_observer.hpp"

#include <mutex>

namespace captlog::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

// Warnings must reach stderr even before the CLI has installed an observer.
IObserver &fallback_observer() {
  static LogObserver observer;
  return observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
    return;
  }
  if (std::holds_alternative<WarningEvent>(event) || std::holds_alternative<ErrorEvent>(event)) {
    fallback_observer().record_event(event);
  }
}

void record_entry(const std::string &project, const std::string &section,
                  const std::string &file, const std::string &outcome) {
  record_event(EntryRecordedEvent{
      .project = project, .section = section, .file = file, .outcome = outcome});
}

void record_hook_step(const std::string &hook, const std::string &step, const int exit_code,
                      const bool skipped) {
  record_event(
      HookStepEvent{.hook = hook, .step = step, .exit_code = exit_code, .skipped = skipped});
}

void record_publish(const std::string &repo, const bool success, const std::string &detail) {
  record_event(PublishEvent{.repo = repo, .success = success, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace captlog::observability
