#pragma once

namespace warden::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitBlocked = 2;

/// Entry point behind `main`. `argv[0]` is the program name.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace warden::cli
