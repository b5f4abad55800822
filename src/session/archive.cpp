#include "warden/session/archive.hpp"

#include "warden/common/digest.hpp"
#include "warden/common/fs.hpp"

#include <sstream>

namespace warden::session {

namespace {

// Bounds the suffix search; a day with this many closes points at a runaway caller.
constexpr int kMaxSuffix = 1000;

} // namespace

std::size_t ArchiveResult::written() const {
  std::size_t count = 0;
  for (const auto &artifact : artifacts) {
    if (artifact.status.ok()) {
      ++count;
    }
  }
  return count;
}

std::size_t ArchiveResult::failed() const { return artifacts.size() - written(); }

ArchiveWriter::ArchiveWriter(std::filesystem::path root) : root_(std::move(root)) {}

common::Result<std::filesystem::path>
ArchiveWriter::reserve_directory(const common::TimePoint at) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        "failed to create archive root " + root_.string() + ": " + ec.message(),
        common::ErrorKind::ArtifactWriteFailure);
  }

  const std::string date = common::date_key(at);
  for (int suffix = 1; suffix <= kMaxSuffix; ++suffix) {
    const std::string name = suffix == 1 ? date : date + "-" + std::to_string(suffix);
    const auto candidate = root_ / name;
    // create_directory reports false for an existing directory, which makes the claim atomic.
    if (std::filesystem::create_directory(candidate, ec)) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    if (ec) {
      return common::Result<std::filesystem::path>::failure(
          "failed to create " + candidate.string() + ": " + ec.message(),
          common::ErrorKind::ArtifactWriteFailure);
    }
  }
  return common::Result<std::filesystem::path>::failure(
      "no free archive directory for " + date + " under " + root_.string(),
      common::ErrorKind::ArtifactWriteFailure);
}

common::Status ArchiveWriter::write_artifact(const std::filesystem::path &path,
                                             const std::string &content) {
  return common::write_file_atomic(path, content);
}

ArchiveResult ArchiveWriter::write(const SessionArtifactSet &artifacts,
                                   const common::TimePoint at) {
  ArchiveResult result;
  const auto directory = reserve_directory(at);
  if (!directory.ok()) {
    for (const auto &artifact : artifacts.artifacts()) {
      result.artifacts.push_back(ArtifactWriteResult{
          .name = artifact.name,
          .path = {},
          .status = common::Status::error(directory.error(),
                                          common::ErrorKind::ArtifactWriteFailure)});
    }
    result.manifest = common::Status::error("archive directory unavailable",
                                            common::ErrorKind::ArtifactWriteFailure);
    return result;
  }
  result.directory = directory.value();

  std::ostringstream manifest;
  for (const auto &artifact : artifacts.artifacts()) {
    const auto path = result.directory / artifact.name;
    auto status = write_artifact(path, artifact.content);
    if (status.ok()) {
      manifest << common::sha256_hex(artifact.content) << "  " << artifact.name << "\n";
    } else {
      status = common::Status::error(status.error(), common::ErrorKind::ArtifactWriteFailure);
    }
    result.artifacts.push_back(
        ArtifactWriteResult{.name = artifact.name, .path = path, .status = std::move(status)});
  }

  if (result.written() == 0) {
    result.manifest =
        common::Status::error("no artifacts written", common::ErrorKind::ArtifactWriteFailure);
    return result;
  }
  result.manifest = write_artifact(result.directory / kManifestFile, manifest.str());
  return result;
}

} // namespace warden::session
