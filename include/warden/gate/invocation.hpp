#pragma once

#include "warden/common/result.hpp"
#include "warden/gate/gate.hpp"

#include <optional>
#include <string>

namespace warden::gate {

/// Parse a gate request. Two shapes are accepted:
///
///   {"operationKind": "FileWrite", "target": "...", "metadata": {"cwd": "..."}}
///   {"tool_name": "Bash", "tool_input": {"command": "..."}, "cwd": "..."}
///
/// Returns std::nullopt for a hook payload naming a tool that is not gated. A payload that
/// cannot be read, or that names an unknown operation kind, fails with MalformedInput.
[[nodiscard]] common::Result<std::optional<ToolInvocation>>
parse_invocation(const std::string &json, common::TimePoint requested_at);

} // namespace warden::gate
