#pragma once

#include "warden/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace warden::repo {

struct ProcessOptions {
  std::chrono::milliseconds timeout{10'000};
  std::filesystem::path working_dir;
  // Set in the child only.
  std::vector<std::pair<std::string, std::string>> env;
  bool allow_failure = false;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs argv directly, never through a shell. argv[0] is looked up on PATH.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const ProcessOptions &options) = 0;
};

/// fork/exec with both pipes drained while waiting. A run that outlives its timeout is
/// killed with SIGKILL and reported as a failure.
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const ProcessOptions &options) override;
};

[[nodiscard]] std::string join_argv(const std::vector<std::string> &argv);

} // namespace warden::repo
