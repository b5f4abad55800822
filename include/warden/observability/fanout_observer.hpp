#pragma once

#include "warden/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace warden::observability {

/// Forwards to every sink in insertion order. Sinks are flushed as soon as a session
/// close or an error is seen so that a short-lived process does not lose them.
class FanOutObserver final : public IObserver {
public:
  void attach(std::unique_ptr<IObserver> sink);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  // "log+log" style, empty when nothing is attached.
  [[nodiscard]] std::string_view name() const override { return name_; }

  [[nodiscard]] bool empty() const { return sinks_.empty(); }
  // Hands back the only sink so a one-entry list needs no wrapper.
  [[nodiscard]] std::unique_ptr<IObserver> release_single();

private:
  std::vector<std::unique_ptr<IObserver>> sinks_;
  std::string name_;
};

} // namespace warden::observability
