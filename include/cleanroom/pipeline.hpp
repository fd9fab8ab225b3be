#pragma once
#include "cleanroom/config.hpp"
#include "cleanroom/diff.hpp"
#include "cleanroom/history.hpp"
#include "cleanroom/snapshot.hpp"
#include "cleanroom/templates.hpp"
#include "cleanroom/transform.hpp"
#include "cleanroom/transport.hpp"
#include "cleanroom/validate.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cleanroom {

enum class Stage : std::uint8_t { Idle, SnapshotReady, Transformed, Validated, Published, Rejected };

struct PreviewResult {
  std::size_t files_copied = 0;
  std::vector<ExclusionNote> exclusions;
  TransformReport transform;
  ValidationResult validation;
  DiffReport diff;
};

enum class PublishStatus : std::uint8_t { Published, Rejected };

struct PublishResult {
  PublishStatus status = PublishStatus::Rejected;
  std::size_t files_copied = 0;
  std::vector<ExclusionNote> exclusions;
  TransformReport transform;
  ValidationResult validation; // the findings when Rejected
  RootCommit commit;           // set when Published
  PushOutcome push;            // set when Published
};

// Snapshot -> Transform -> Validate -> Publish. Every call starts from scratch on a
// new snapshot, which is removed before the call returns or throws.
class Pipeline {
public:
  Pipeline(std::filesystem::path source_root, PublishConfig config,
           std::vector<std::string> tracked_paths,
           TemplateCatalog catalog = TemplateCatalog::builtin());

  // Never touches git or the network; completes whatever validation says.
  PreviewResult preview();

  // Refuses (status Rejected) unless validation passed. Otherwise writes a parentless
  // root commit and force-pushes it through `transport`.
  // Throws PublishError if the history cannot be written or the push is rejected.
  PublishResult publish(Transport& transport);

  [[nodiscard]] Stage stage() const { return stage_; }
  [[nodiscard]] const PublishConfig& config() const { return config_; }

private:
  Snapshot prepare(std::size_t& files_copied, std::vector<ExclusionNote>& exclusions,
                   TransformReport& transform, ValidationResult& validation);

  std::filesystem::path source_root_;
  PublishConfig config_;
  std::vector<std::string> tracked_paths_;
  TemplateCatalog catalog_;
  Stage stage_ = Stage::Idle;
};

const char* to_string(Stage stage);

} // namespace cleanroom
