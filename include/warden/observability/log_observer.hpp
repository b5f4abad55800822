#pragma once

#include "warden/observability/observer.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>

namespace warden::observability {

/// `<timestamp> [LEVEL] message` lines. Writes to stderr unless a log file is given; a file
/// that cannot be opened also falls back to stderr.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(const std::filesystem::path &log_file);
  /// Borrowed stream; must outlive the observer.
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] bool writes_to_file() const { return file_.is_open(); }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ofstream file_;
  std::ostream *out_ = nullptr;
  std::mutex mutex_;
};

} // namespace warden::observability
