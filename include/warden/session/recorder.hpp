#pragma once

#include "warden/common/result.hpp"
#include "warden/common/time.hpp"
#include "warden/repo/inspector.hpp"
#include "warden/session/archive.hpp"
#include "warden/session/metrics.hpp"
#include "warden/session/render.hpp"
#include "warden/worklist/store.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace warden::session {

/// Inputs of one session close. `now` is supplied by the caller; the recorder never reads
/// the clock itself.
struct SessionContext {
  common::TimePoint window_start{};
  common::TimePoint now{};
  std::string project_name;
  std::string notes;
  // Ids or descriptions given explicitly by the operator.
  std::vector<std::string> completed;
  std::vector<std::string> in_progress;
  EffortRates effort;
  // Saved atomically after the merge when set. The caller holds the worklist lock.
  std::filesystem::path worklist_path;
};

struct SessionCloseReport {
  SessionArtifactSet artifacts;
  ArchiveResult archive;
  SessionMetrics metrics;
  std::string branch;
  bool repository_available = false;
  std::vector<std::string> diagnostics;
  std::vector<std::string> completed_ids;
  std::vector<std::string> started_ids;
  std::vector<std::string> added_ids;
  // References that matched no work item.
  std::vector<std::string> unresolved;
  common::Status worklist_saved = common::Status::success();

  /// At least one artifact reached disk.
  [[nodiscard]] bool succeeded() const { return archive.written() > 0; }
  /// `<artifact>: <reason>` for every failed write, the worklist save included.
  [[nodiscard]] std::vector<std::string> failures() const;
};

/// Reconstructs a session from repository state and the worklist, then archives it.
class SessionRecorder {
public:
  SessionRecorder(repo::RepositoryInspector &inspector, ArchiveWriter &archive);

  [[nodiscard]] SessionCloseReport close_session(const SessionContext &context,
                                                 worklist::WorklistStore &worklist);

private:
  repo::RepositoryInspector &inspector_;
  ArchiveWriter &archive_;
};

} // namespace warden::session
