#pragma once

#include "warden/common/result.hpp"
#include "warden/common/time.hpp"
#include "warden/session/render.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace warden::session {

inline constexpr const char *kManifestFile = "MANIFEST.sha256";

struct ArtifactWriteResult {
  std::string name;
  std::filesystem::path path;
  common::Status status = common::Status::success();
};

struct ArchiveResult {
  std::filesystem::path directory;
  std::vector<ArtifactWriteResult> artifacts;
  common::Status manifest = common::Status::success();

  [[nodiscard]] std::size_t written() const;
  [[nodiscard]] std::size_t failed() const;
};

/// Writes each session's artifacts into `<root>/<YYYY-MM-DD>`, or the next free
/// `<YYYY-MM-DD>-N` when that day already has an archive. Existing directories are never
/// written into.
class ArchiveWriter {
public:
  explicit ArchiveWriter(std::filesystem::path root);
  virtual ~ArchiveWriter() = default;

  /// Each artifact is written atomically and independently; a failure is recorded and the
  /// rest are still attempted. A manifest of SHA-256 digests follows the written ones.
  [[nodiscard]] ArchiveResult write(const SessionArtifactSet &artifacts, common::TimePoint at);

  /// Claims a fresh directory for `at`.
  [[nodiscard]] common::Result<std::filesystem::path> reserve_directory(common::TimePoint at);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

protected:
  [[nodiscard]] virtual common::Status write_artifact(const std::filesystem::path &path,
                                                      const std::string &content);

private:
  std::filesystem::path root_;
};

} // namespace warden::session
