#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace cleanroom {

struct PushOutcome {
  bool accepted = false;
  std::string detail; // remote's raw output, or a summary for local pushes
};

// Replaces a remote branch with the local one. Implementations overwrite the remote
// ref unconditionally: whatever history the branch had before is no longer reachable
// from it. This is irreversible from the publisher's side.
class Transport {
public:
  virtual ~Transport() = default;

  // `work_root` holds the .git written by create_root_history.
  virtual PushOutcome force_push(const std::filesystem::path& work_root,
                                 const std::string& branch) = 0;

  [[nodiscard]] virtual std::string describe() const = 0;
};

// Remote is a git directory on this machine (bare, or a work tree with .git).
// Copies missing loose objects and overwrites refs/heads/<branch>.
class LocalTransport final : public Transport {
public:
  explicit LocalTransport(std::filesystem::path remote_path);

  PushOutcome force_push(const std::filesystem::path& work_root,
                         const std::string& branch) override;
  [[nodiscard]] std::string describe() const override;

private:
  std::filesystem::path remote_path_;
};

// Any other URL: delegates to `git push --force`, which handles protocol and auth.
class GitCliTransport final : public Transport {
public:
  explicit GitCliTransport(std::string url);

  PushOutcome force_push(const std::filesystem::path& work_root,
                         const std::string& branch) override;
  [[nodiscard]] std::string describe() const override;

private:
  std::string url_;
};

// file:// URLs and existing local directories get a LocalTransport, the rest git.
std::unique_ptr<Transport> make_transport(const std::string& url,
                                          const std::filesystem::path& repo_root);

} // namespace cleanroom
