#include "warden/worklist/lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <unistd.h>

namespace warden::worklist {

WorklistLock::WorklistLock(const std::filesystem::path &worklist_path)
    : path_(worklist_path.string() + ".lock") {}

WorklistLock::~WorklistLock() { release(); }

common::Status WorklistLock::acquire() {
  if (fd_ >= 0) {
    return common::Status::success();
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create lock directory: " + ec.message());
    }
  }

  const int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Status::error("failed to open lock file " + path_.string() + ": " +
                                 std::strerror(errno));
  }

  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    close(fd);
    if (err == EWOULDBLOCK) {
      return common::Status::error("worklist is locked by another session (" + path_.string() +
                                   ")");
    }
    return common::Status::error("failed to lock " + path_.string() + ": " + std::strerror(err));
  }

  const std::string pid = std::to_string(static_cast<long>(getpid())) + "\n";
  if (ftruncate(fd, 0) == 0) {
    const ssize_t written = write(fd, pid.data(), pid.size());
    (void)written;
  }
  fd_ = fd;
  return common::Status::success();
}

void WorklistLock::release() {
  if (fd_ < 0) {
    return;
  }
  (void)flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

} // namespace warden::worklist
