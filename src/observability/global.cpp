#include "warden/observability/global.hpp"

#include <mutex>

namespace warden::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_gate_decision(const std::string &kind, const std::string &target, const bool allowed,
                          const std::string &reason, const std::string &rule_id) {
  record_event(GateDecisionEvent{
      .kind = kind, .target = target, .allowed = allowed, .reason = reason, .rule_id = rule_id});
}

void record_advisory(const std::string &target, const std::string &message) {
  record_event(AdvisoryEvent{.target = target, .message = message});
}

void record_repository_degraded(const std::string &operation, const std::string &message) {
  record_event(RepositoryDegradedEvent{.operation = operation, .message = message});
}

void record_artifact(const std::string &artifact, const std::string &path, const bool written,
                     const std::string &error) {
  record_event(
      ArtifactEvent{.artifact = artifact, .path = path, .written = written, .error = error});
}

void record_session_closed(const std::string &archive_dir, const std::size_t written,
                           const std::size_t failed, const std::chrono::seconds duration) {
  record_event(SessionClosedEvent{.archive_dir = archive_dir,
                                  .artifacts_written = written,
                                  .artifacts_failed = failed,
                                  .duration = duration});
}

void record_gate_latency(const std::chrono::microseconds latency) {
  record_metric(GateLatencyMetric{.latency = latency});
}

void record_commits_archived(const std::uint64_t commits) {
  record_metric(CommitsArchivedMetric{.commits = commits});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace warden::observability
