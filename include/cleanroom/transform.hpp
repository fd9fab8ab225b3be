#pragma once
#include "cleanroom/config.hpp"
#include "cleanroom/templates.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cleanroom {

class Snapshot; // fwd

struct MarkerFileReport {
  std::string path;
  std::size_t regions_removed = 0;
  std::size_t unmatched_starts = 0;
};

struct RuleReport {
  std::string find;
  std::string replace;
  std::size_t files_matched = 0; // files of any type containing `find` before the rule ran
  std::size_t files_changed = 0; // text files and symlink targets actually rewritten
};

enum class ResetStatus : std::uint8_t { Reset, NoTemplate, NotFound };

struct ResetReport {
  std::string path;
  ResetStatus status;
};

struct TransformReport {
  std::vector<MarkerFileReport> markers; // only files with a region or an unmatched start
  std::vector<RuleReport> rules;         // one per scrub rule, in config order
  std::vector<ResetReport> resets;       // one per reset_to_templates entry

  // Human-readable lint: rules that never matched, skipped resets, unmatched markers.
  [[nodiscard]] std::vector<std::string> warnings() const;
};

// Pass A (marker regions) -> Pass B (scrub rules) -> Pass C (template reset),
// all acting in place on the snapshot. Throws IoError on any read/write failure.
class Transformer {
public:
  Transformer(const PublishConfig& config, TemplateCatalog catalog);

  TransformReport run(const Snapshot& snapshot) const;

private:
  const PublishConfig& config_;
  TemplateCatalog catalog_;
};

} // namespace cleanroom
