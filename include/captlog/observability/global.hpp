#pragma once

#include "captlog/observability/observer.hpp"

#include <memory>

namespace captlog::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_entry(const std::string &project, const std::string &section,
                  const std::string &file, const std::string &outcome);
void record_hook_step(const std::string &hook, const std::string &step, int exit_code,
                      bool skipped = false);
void record_publish(const std::string &repo, bool success, const std::string &detail = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace captlog::observability
