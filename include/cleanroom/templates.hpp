#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cleanroom {

// Canonical stand-in bodies keyed by file base name.
class TemplateCatalog {
public:
  // WORKLOG.md (empty session log) and CHANGELOG.md (Keep a Changelog header).
  static TemplateCatalog builtin();

  void set(std::string name, std::string body);

  // Exact base-name match first, then the longest key the base name ends with.
  [[nodiscard]] std::optional<std::string_view> find(std::string_view base_name) const;

private:
  std::map<std::string, std::string> entries_;
};

} // namespace cleanroom
