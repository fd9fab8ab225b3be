#include "cleanroom/templates.hpp"

namespace {

constexpr std::string_view kWorklogTemplate = R"(# Work Log

> Development session log. Updated after each work session.

---

<!-- ## Session: YYYY-MM-DD -->
<!-- ### What was done -->
<!-- - Description -->
<!-- ### Files created/modified -->
<!-- - `path/to/file` -->
)";

constexpr std::string_view kChangelogTemplate = R"(# Changelog

All notable changes to this project will be documented in this file.

The format is based on [Keep a Changelog](https://keepachangelog.com/en/1.1.0/).

<!-- ## [Phase N] - YYYY-MM-DD -->
<!-- ### Added -->
<!-- - Feature description -->
)";

} // namespace

namespace cleanroom {

TemplateCatalog TemplateCatalog::builtin() {
  TemplateCatalog c;
  c.set("WORKLOG.md", std::string(kWorklogTemplate));
  c.set("CHANGELOG.md", std::string(kChangelogTemplate));
  return c;
}

void TemplateCatalog::set(std::string name, std::string body) {
  entries_[std::move(name)] = std::move(body);
}

std::optional<std::string_view> TemplateCatalog::find(std::string_view base_name) const {
  if (const auto it = entries_.find(std::string(base_name)); it != entries_.end())
    return std::string_view(it->second);

  const std::string *best = nullptr;
  std::size_t best_len = 0;
  for (const auto &[name, body] : entries_) {
    if (name.size() > best_len && base_name.ends_with(name)) {
      best = &body;
      best_len = name.size();
    }
  }
  if (!best)
    return std::nullopt;
  return std::string_view(*best);
}

} // namespace cleanroom
