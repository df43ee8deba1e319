#pragma once

#include "model.h"
#include "outcome.h"
#include "util.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbuild {

// Message texts; `short_text` defaults to `summary` and `long_text` to `short_text`.
struct notification_template {
  std::string id;
  std::string summary;
  std::optional<std::string> short_text;
  std::optional<std::string> long_text;
};

struct notification_options {
  std::vector<notification_template> templates;
  std::vector<notification_config> notifications;  // fire against the root outcome
};

struct notification_message {
  std::string summary;
  std::string short_text;
  std::string long_text;
};

// A delivery mechanism, selected by notification_config::kind
class notification_kind : unmovable {
 public:
  virtual ~notification_kind() = default;

  virtual std::string_view name() const = 0;
  virtual void send(notification_config const &config,
                    notification_message const &message) const = 0;
};

// Writes the long text through the logger
class console_notification : public notification_kind {
 public:
  std::string_view name() const override { return "console"; }
  void send(notification_config const &config,
            notification_message const &message) const override;
};

std::vector<std::unique_ptr<notification_kind>> make_default_notification_kinds();

// Replaces ${name} with vars[name]; unknown variables are kept verbatim.
std::string notification_expand(std::string_view text,
                                std::map<std::string, std::string> const &vars);

class notifier : unmovable {
 public:
  // Throws configuration_error for unknown kinds or template ids anywhere in `options`
  // or in the per-project notifications of `projects`.
  notifier(std::vector<std::unique_ptr<notification_kind>> kinds,
           notification_options options,
           std::vector<project_config> const &projects);

  // Sends every notification whose `when` list matches its outcome's tags. Returns the
  // number of messages delivered; delivery errors are logged and skipped.
  std::size_t notify(root_outcome const &root) const;

  notification_message format(notification_config const &config,
                              build_outcome const &outcome) const;
  notification_message format(notification_config const &config,
                              root_outcome const &root) const;

 private:
  struct project_notifications {
    std::string project;
    std::vector<notification_config> notifications;
  };

  notification_template const &template_for(notification_config const &config,
                                            notification_template const &fallback) const;
  bool deliver(notification_config const &config,
               notification_message const &message) const;

  std::map<std::string, std::unique_ptr<notification_kind>, std::less<>> kinds_;
  notification_options options_;
  std::vector<project_notifications> projects_;
};

}  // namespace dbuild
