#pragma once

namespace cleanroom::cli {

// Subcommand handler: receives argv starting at the subcommand name, returns the exit code.
using command_fn = int (*)(int argc, char **argv);

// Exit codes shared by every command.
inline constexpr int kExitOk = 0;
inline constexpr int kExitValidation = 1;
inline constexpr int kExitConfig = 2;
inline constexpr int kExitRuntime = 3;

} // namespace cleanroom::cli
