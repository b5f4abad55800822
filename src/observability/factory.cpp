#include "warden/observability/factory.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/fanout_observer.hpp"
#include "warden/observability/log_observer.hpp"

#include <sstream>

namespace warden::observability {

namespace {

std::unique_ptr<IObserver> create_log_observer(const config::Config &config) {
  const std::string log_file = common::trim(config.observability.log_file);
  if (log_file.empty()) {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<LogObserver>(common::resolve_against(log_file, config.project_root));
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  auto fanout = std::make_unique<FanOutObserver>();
  std::stringstream backends(config.observability.backend);
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    if (common::to_lower(common::trim(backend)) == "log") {
      fanout->attach(create_log_observer(config));
    }
  }

  if (fanout->empty()) {
    return nullptr;
  }
  if (auto single = fanout->release_single(); single != nullptr) {
    return single;
  }
  return fanout;
}

} // namespace warden::observability
