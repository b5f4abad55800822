#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::observability {

struct GateDecisionEvent {
  std::string kind;
  std::string target;
  bool allowed = true;
  std::string reason;
  std::string rule_id;
};

struct AdvisoryEvent {
  std::string target;
  std::string message;
};

struct RepositoryDegradedEvent {
  std::string operation;
  std::string message;
};

struct ArtifactEvent {
  std::string artifact;
  std::string path;
  bool written = false;
  std::string error;
};

struct SessionClosedEvent {
  std::string archive_dir;
  std::size_t artifacts_written = 0;
  std::size_t artifacts_failed = 0;
  std::chrono::seconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<GateDecisionEvent, AdvisoryEvent, RepositoryDegradedEvent,
                                   ArtifactEvent, SessionClosedEvent, ErrorEvent>;

struct GateLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct CommitsArchivedMetric {
  std::uint64_t commits = 0;
};

using ObserverMetric = std::variant<GateLatencyMetric, CommitsArchivedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace warden::observability
