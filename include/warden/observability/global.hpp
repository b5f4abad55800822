#pragma once

#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_gate_decision(const std::string &kind, const std::string &target, bool allowed,
                          const std::string &reason, const std::string &rule_id);
void record_advisory(const std::string &target, const std::string &message);
void record_repository_degraded(const std::string &operation, const std::string &message);
void record_artifact(const std::string &artifact, const std::string &path, bool written,
                     const std::string &error = "");
void record_session_closed(const std::string &archive_dir, std::size_t written,
                           std::size_t failed, std::chrono::seconds duration);
void record_gate_latency(std::chrono::microseconds latency);
void record_commits_archived(std::uint64_t commits);
void record_error(const std::string &component, const std::string &message);

} // namespace warden::observability
