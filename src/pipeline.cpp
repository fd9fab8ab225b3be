#include "cleanroom/pipeline.hpp"

#include "cleanroom/errors.hpp"

namespace cleanroom {

Pipeline::Pipeline(std::filesystem::path source_root, PublishConfig config,
                   std::vector<std::string> tracked_paths, TemplateCatalog catalog)
    : source_root_(std::move(source_root)), config_(std::move(config)),
      tracked_paths_(std::move(tracked_paths)), catalog_(std::move(catalog)) {}

Snapshot Pipeline::prepare(std::size_t &files_copied, std::vector<ExclusionNote> &exclusions,
                           TransformReport &transform, ValidationResult &validation) {
  stage_ = Stage::Idle;
  auto snap = Snapshot::create(source_root_, tracked_paths_, config_.exclude_paths);
  files_copied = snap.copied_count();
  exclusions = snap.exclusions();
  stage_ = Stage::SnapshotReady;

  transform = Transformer{config_, catalog_}.run(snap);
  stage_ = Stage::Transformed;

  validation = validate(snap.root(), config_);
  stage_ = Stage::Validated;
  return snap;
}

PreviewResult Pipeline::preview() {
  PreviewResult res;
  const auto snap = prepare(res.files_copied, res.exclusions, res.transform, res.validation);
  res.diff = render_preview(source_root_, tracked_paths_, snap);
  return res;
}

PublishResult Pipeline::publish(Transport &transport) {
  PublishResult res;
  const auto snap = prepare(res.files_copied, res.exclusions, res.transform, res.validation);
  if (!res.validation.passed()) {
    stage_ = Stage::Rejected;
    res.status = PublishStatus::Rejected;
    return res;
  }

  res.commit = create_root_history(snap.root(), config_.branch, config_.author,
                                   config_.commit_message);
  res.push = transport.force_push(snap.root(), config_.branch);
  if (!res.push.accepted) {
    throw PublishError("push to " + transport.describe() + " (" + config_.branch +
                       ") rejected:\n" + res.push.detail);
  }
  stage_ = Stage::Published;
  res.status = PublishStatus::Published;
  return res;
}

const char *to_string(Stage stage) {
  switch (stage) {
  case Stage::Idle:
    return "idle";
  case Stage::SnapshotReady:
    return "snapshot-ready";
  case Stage::Transformed:
    return "transformed";
  case Stage::Validated:
    return "validated";
  case Stage::Published:
    return "published";
  case Stage::Rejected:
    return "rejected";
  }
  return "unknown";
}

} // namespace cleanroom
