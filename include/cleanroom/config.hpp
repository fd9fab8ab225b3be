#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cleanroom {

struct Identity {
  std::string name;
  std::string email;
};

struct ScrubRule {
  std::string find;
  std::string replace;
};

struct MarkerPair {
  std::string start;
  std::string end;
};

// Operator-authored publish configuration; immutable for the duration of a run.
struct PublishConfig {
  std::vector<ScrubRule> scrub_rules;          // applied in order
  std::vector<std::string> exclude_paths;      // repo-relative, removed before transforming
  std::vector<std::string> reset_to_templates; // repo-relative, replaced by catalog template
  std::vector<std::string> validation_blocklist;
  std::vector<MarkerPair> markers;             // defaults to the BUSINESS pair
  std::map<std::string, std::string> templates; // base name -> body, overrides the catalog
  std::string remote;
  std::string branch;
  std::string commit_message;
  Identity author;
};

// Parse a JSON config document. Throws ConfigError on malformed input.
PublishConfig parse_config(std::string_view json_text);

// Read and parse a JSON config file. Throws ConfigError if missing or malformed.
PublishConfig load_config(const std::filesystem::path& path);

} // namespace cleanroom
