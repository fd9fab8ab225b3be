#include "cli/registry.hpp"

int cmd_preview(int argc, char **argv);
int cmd_publish(int argc, char **argv);
int cmd_check(int argc, char **argv);

namespace cleanroom::cli {

void register_all_commands() {
  register_command("preview", ::cmd_preview,
                   "Sanitize a snapshot and show the diff against the working tree (no push)");
  register_command("publish", ::cmd_publish,
                   "Sanitize, validate, commit as a fresh root and force-push to the remote");
  register_command("check", ::cmd_check,
                   "Sanitize and validate only; exit 1 if any private term survives");
}

} // namespace cleanroom::cli
