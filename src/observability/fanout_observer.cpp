#include "warden/observability/fanout_observer.hpp"

namespace warden::observability {

namespace {

bool forces_flush(const ObserverEvent &event) {
  return std::holds_alternative<SessionClosedEvent>(event) ||
         std::holds_alternative<ErrorEvent>(event);
}

} // namespace

void FanOutObserver::attach(std::unique_ptr<IObserver> sink) {
  if (sink == nullptr) {
    return;
  }
  if (!name_.empty()) {
    name_ += "+";
  }
  name_ += std::string(sink->name());
  sinks_.push_back(std::move(sink));
}

void FanOutObserver::record_event(const ObserverEvent &event) {
  const bool urgent = forces_flush(event);
  for (auto &sink : sinks_) {
    sink->record_event(event);
    if (urgent) {
      sink->flush();
    }
  }
}

void FanOutObserver::record_metric(const ObserverMetric &metric) {
  for (auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void FanOutObserver::flush() {
  for (auto &sink : sinks_) {
    sink->flush();
  }
}

std::unique_ptr<IObserver> FanOutObserver::release_single() {
  if (sinks_.size() != 1) {
    return nullptr;
  }
  auto only = std::move(sinks_.front());
  sinks_.clear();
  name_.clear();
  return only;
}

} // namespace warden::observability
