#include "warden/observability/log_observer.hpp"

#include "warden/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace warden::observability {

namespace {

std::string quoted(const std::string &value) { return "\"" + value + "\""; }

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(const std::filesystem::path &log_file) : out_(&std::cerr) {
  std::error_code ec;
  if (log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }
  file_.open(log_file, std::ios::app);
  if (file_.is_open()) {
    out_ = &file_;
  }
}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << common::now_rfc3339() << " [" << level << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GateDecisionEvent>) {
          if (evt.allowed) {
            log_line("INFO", "gate.allow kind=" + evt.kind + " target=" + quoted(evt.target));
          } else {
            log_line("WARN", "gate.block kind=" + evt.kind + " target=" + quoted(evt.target) +
                                 (evt.rule_id.empty() ? "" : " rule=" + evt.rule_id) +
                                 " reason=" + quoted(evt.reason));
          }
        } else if constexpr (std::is_same_v<T, AdvisoryEvent>) {
          log_line("WARN", "gate.advisory target=" + quoted(evt.target) + " " + evt.message);
        } else if constexpr (std::is_same_v<T, RepositoryDegradedEvent>) {
          log_line("WARN", "repo.degraded op=" + evt.operation + " " + evt.message);
        } else if constexpr (std::is_same_v<T, ArtifactEvent>) {
          if (evt.written) {
            log_line("INFO", "artifact.written name=" + evt.artifact + " path=" + evt.path);
          } else {
            log_line("ERROR", "artifact.failed name=" + evt.artifact + " path=" + evt.path +
                                  " error=" + quoted(evt.error));
          }
        } else if constexpr (std::is_same_v<T, SessionClosedEvent>) {
          log_line("INFO", "session.closed dir=" + evt.archive_dir +
                               " written=" + std::to_string(evt.artifacts_written) +
                               " failed=" + std::to_string(evt.artifacts_failed) +
                               " duration_s=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, GateLatencyMetric>) {
          log_line("DEBUG", "metric.gate_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CommitsArchivedMetric>) {
          log_line("DEBUG", "metric.commits_archived=" + std::to_string(m.commits));
        }
      },
      metric);
}

} // namespace warden::observability
