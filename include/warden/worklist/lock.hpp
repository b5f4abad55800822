#pragma once

#include "warden/common/result.hpp"

#include <filesystem>

namespace warden::worklist {

/// Exclusive advisory lock on `<worklist>.lock`, held for a whole read-modify-write.
/// acquire() never waits: a lock held elsewhere, including by another WorklistLock in this
/// process, fails immediately.
class WorklistLock {
public:
  explicit WorklistLock(const std::filesystem::path &worklist_path);
  ~WorklistLock();

  WorklistLock(const WorklistLock &) = delete;
  WorklistLock &operator=(const WorklistLock &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] bool held() const { return fd_ >= 0; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace warden::worklist
