#pragma once
#include "cleanroom/config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cleanroom {

enum class TermOrigin : std::uint8_t { ScrubRule, Blocklist, Marker };

struct ValidationFinding {
  std::string term;
  TermOrigin origin;
  std::string file;        // repo-relative
  std::size_t line_number; // 1-based
  std::string line_text;
};

struct ValidationResult {
  std::vector<ValidationFinding> findings;
  std::size_t suppressed = 0; // matching lines beyond kMaxFindingsPerFile per (term, file)

  [[nodiscard]] bool passed() const { return findings.empty(); }
};

// Read-only scan of the transformed tree for every scrub find-term, every blocklist
// term and every marker delimiter. All findings are gathered; nothing stops early.
ValidationResult validate(const std::filesystem::path& snapshot_root, const PublishConfig& config);

const char* to_string(TermOrigin origin);

} // namespace cleanroom
