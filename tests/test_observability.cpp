#include "test_framework.hpp"

#include "captlog/config/schema.hpp"
#include "captlog/observability/factory.hpp"
#include "captlog/observability/global.hpp"
#include "captlog/observability/log_observer.hpp"

#include <sstream>

void register_observability_tests(std::vector<captlog::tests::TestCase> &tests) {
  using captlog::tests::require;
  namespace obs = captlog::observability;

  tests.push_back({"log_observer_formats_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::EntryRecordedEvent{
                         .project = "demo", .section = "other", .file = "/l/x.md", .outcome = "added"});
                     observer.record_event(obs::HookStepEvent{
                         .hook = "commit-msg", .step = "pre-commit", .exit_code = 3, .skipped = false});
                     observer.record_event(
                         obs::PublishEvent{.repo = "/notes", .success = false, .detail = "rejected"});
                     observer.record_event(obs::WarningEvent{.component = "config", .message = "odd"});
                     observer.flush();

                     const std::string text = out.str();
                     require(text.find("[INFO] entry.added project=demo section=other file=/l/x.md\n") !=
                                 std::string::npos,
                             text);
                     require(text.find("[DEBUG] hook.step hook=commit-msg step=pre-commit exit=3\n") !=
                                 std::string::npos,
                             text);
                     require(text.find("[WARN] publish.failed repo=/notes: rejected\n") !=
                                 std::string::npos,
                             text);
                     require(text.find("[WARN] config: odd\n") != std::string::npos, text);
                   }});

  tests.push_back({"observer_factory_selects_backend", [] {
                     captlog::config::Config config;
                     config.observability = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                   }});

  tests.push_back({"global_observer_receives_events", [] {
                     std::ostringstream out;
                     obs::set_global_observer(std::make_unique<obs::LogObserver>(out));
                     obs::record_publish("/notes", true);
                     obs::set_global_observer(nullptr);
                     require(out.str() == "[INFO] publish.ok repo=/notes\n", out.str());
                   }});
}
