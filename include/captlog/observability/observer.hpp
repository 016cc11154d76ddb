#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace captlog::observability {

struct EntryRecordedEvent {
  std::string project;
  std::string section;
  std::string file;
  std::string outcome;
};

struct HookStepEvent {
  std::string hook;
  std::string step;
  int exit_code = 0;
  bool skipped = false;
};

struct PublishEvent {
  std::string repo;
  bool success = false;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<EntryRecordedEvent, HookStepEvent, PublishEvent, WarningEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace captlog::observability
