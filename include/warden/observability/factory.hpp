#pragma once

#include "warden/config/schema.hpp"
#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

/// Builds the sink named by `observability.backend`, which may be a comma list.
/// `log` appends to `observability.log_file` (stderr when unset) resolved against the
/// project root. `none` and `noop` contribute nothing. Returns null when no sink remains,
/// which leaves every record_* call a no-op.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace warden::observability
