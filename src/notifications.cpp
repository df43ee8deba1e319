#include "notifications.h"

#include "errors.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>

namespace dbuild {

namespace {

notification_template const kProjectTemplate{
  .id = "project",
  .summary = "${project}: ${status}",
  .short_text = std::nullopt,
  .long_text = "Project ${project}: ${status}\n${reason}",
};

notification_template const kRootTemplate{
  .id = "root",
  .summary = "dbuild: ${status}",
  .short_text = std::nullopt,
  .long_text = "dbuild: ${status}\n${reason}",
};

bool matches(notification_config const &config, std::vector<std::string> const &tags) {
  return std::ranges::any_of(config.when, [&](std::string const &w) {
    return std::ranges::find(tags, w) != tags.end();
  });
}

notification_message render(notification_template const &t,
                            std::map<std::string, std::string> const &vars) {
  auto const short_text{ t.short_text.value_or(t.summary) };
  auto const long_text{ t.long_text.value_or(short_text) };
  return { .summary = notification_expand(t.summary, vars),
           .short_text = notification_expand(short_text, vars),
           .long_text = notification_expand(long_text, vars) };
}

}  // namespace

void console_notification::send(notification_config const &,
                                notification_message const &message) const {
  tui::info("%s", message.long_text.c_str());
}

std::vector<std::unique_ptr<notification_kind>> make_default_notification_kinds() {
  std::vector<std::unique_ptr<notification_kind>> kinds;
  kinds.push_back(std::make_unique<console_notification>());
  return kinds;
}

std::string notification_expand(std::string_view text,
                                std::map<std::string, std::string> const &vars) {
  std::string out;
  std::size_t pos{ 0 };
  while (pos < text.size()) {
    auto const open{ text.find("${", pos) };
    if (open == std::string_view::npos) { break; }
    auto const close{ text.find('}', open + 2) };
    if (close == std::string_view::npos) { break; }

    out.append(text.substr(pos, open - pos));
    auto const it{ vars.find(std::string{ text.substr(open + 2, close - open - 2) }) };
    if (it == vars.end()) {
      out.append(text.substr(open, close - open + 1));
    } else {
      out += it->second;
    }
    pos = close + 1;
  }
  out.append(text.substr(std::min(pos, text.size())));
  return out;
}

notifier::notifier(std::vector<std::unique_ptr<notification_kind>> kinds,
                   notification_options options,
                   std::vector<project_config> const &projects)
    : options_{ std::move(options) } {
  for (auto &k : kinds) {
    std::string name{ k->name() };
    kinds_[name] = std::move(k);
  }

  std::vector<std::string> template_ids;
  for (auto const &t : options_.templates) {
    if (t.id.empty()) { throw configuration_error("Notification template without an id"); }
    if (std::ranges::find(template_ids, t.id) != template_ids.end()) {
      throw configuration_error("Notification template " + t.id + " is defined twice");
    }
    template_ids.push_back(t.id);
  }

  auto const check = [&](notification_config const &n, std::string const &where) {
    if (!kinds_.contains(n.kind)) {
      throw configuration_error("Unknown notification kind '" + n.kind + "' in " + where);
    }
    if (n.template_id &&
        std::ranges::find(template_ids, *n.template_id) == template_ids.end()) {
      throw configuration_error("Unknown notification template '" + *n.template_id +
                                "' in " + where);
    }
  };

  for (auto const &n : options_.notifications) { check(n, "global notifications"); }
  for (auto const &p : projects) {
    for (auto const &n : p.notifications) { check(n, "project " + p.name); }
    if (!p.notifications.empty()) {
      projects_.push_back({ .project = p.name, .notifications = p.notifications });
    }
  }
}

notification_template const &notifier::template_for(
    notification_config const &config,
    notification_template const &fallback) const {
  if (!config.template_id) { return fallback; }
  auto const it{ std::ranges::find(options_.templates,
                                   *config.template_id,
                                   &notification_template::id) };
  if (it == options_.templates.end()) {
    throw internal_error("notification template " + *config.template_id + " vanished");
  }
  return *it;
}

notification_message notifier::format(notification_config const &config,
                                      build_outcome const &outcome) const {
  return render(template_for(config, kProjectTemplate),
                { { "project", outcome_project(outcome) },
                  { "status", outcome_status(outcome) },
                  { "reason", outcome_reason(outcome) } });
}

notification_message notifier::format(notification_config const &config,
                                      root_outcome const &root) const {
  std::string report;
  for (auto const &o : root.projects) {
    report += outcome_project(o) + ": " + outcome_status(o);
    auto const reason{ outcome_reason(o) };
    if (!reason.empty()) { report += " (" + reason + ")"; }
    report += "\n";
  }
  if (!report.empty()) { report.pop_back(); }

  return render(template_for(config, kRootTemplate),
                { { "project", "dbuild" },
                  { "status", root.succeeded() ? "success" : "failure" },
                  { "reason", report } });
}

bool notifier::deliver(notification_config const &config,
                       notification_message const &message) const {
  try {
    kinds_.find(config.kind)->second->send(config, message);
    return true;
  } catch (std::runtime_error const &e) {
    tui::error("Notification '%s' could not be sent: %s", config.kind.c_str(), e.what());
    return false;
  }
}

std::size_t notifier::notify(root_outcome const &root) const {
  std::size_t sent{ 0 };

  for (auto const &p : projects_) {
    auto const *outcome{ root.find(p.project) };
    if (!outcome) {
      tui::warn("No outcome for project %s; skipping its notifications", p.project.c_str());
      continue;
    }
    auto const tags{ outcome_when_ids(*outcome) };
    for (auto const &n : p.notifications) {
      if (matches(n, tags) && deliver(n, format(n, *outcome))) { ++sent; }
    }
  }

  auto const tags{ root.when_ids() };
  for (auto const &n : options_.notifications) {
    if (matches(n, tags) && deliver(n, format(n, root))) { ++sent; }
  }
  return sent;
}

}  // namespace dbuild
