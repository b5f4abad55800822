#include "warden/gate/invocation.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

namespace warden::gate {

namespace {

using ParseResult = common::Result<std::optional<ToolInvocation>>;

ParseResult malformed(const std::string &message) {
  return ParseResult::failure(message, common::ErrorKind::MalformedInput);
}

bool is_json_object(const std::string &json) {
  const std::size_t open = common::json_skip_ws(json, 0);
  if (open >= json.size() || json[open] != '{') {
    return false;
  }
  const std::size_t close = common::json_find_matching_token(json, open, '{', '}');
  if (close == std::string::npos) {
    return false;
  }
  return common::json_skip_ws(json, close + 1) == json.size();
}

std::filesystem::path working_dir_from(const std::string &object) {
  for (const char *field : {"cwd", "working_dir", "workingDirectory"}) {
    if (const auto value = common::json_get_string(object, field); value.has_value()) {
      return std::filesystem::path(*value);
    }
  }
  return {};
}

ParseResult parse_operation_shape(const std::string &json, const std::string &operation,
                                  const common::TimePoint requested_at) {
  const auto kind = operation_kind_from_string(operation);
  if (!kind.ok()) {
    return ParseResult::failure(kind.status());
  }
  const auto target = common::json_get_string(json, "target");
  if (!target.has_value()) {
    return malformed("gate payload has no string 'target'");
  }

  ToolInvocation invocation;
  invocation.kind = kind.value();
  invocation.target = *target;
  invocation.requested_at = requested_at;
  if (const auto metadata = common::json_get_object(json, "metadata"); metadata.has_value()) {
    invocation.working_dir = working_dir_from(*metadata);
  }
  if (invocation.working_dir.empty()) {
    invocation.working_dir = working_dir_from(json);
  }
  return ParseResult::success(std::move(invocation));
}

ParseResult parse_hook_shape(const std::string &json, const std::string &tool_name,
                             const common::TimePoint requested_at) {
  const auto input = common::json_get_object(json, "tool_input");

  ToolInvocation invocation;
  invocation.requested_at = requested_at;
  invocation.working_dir = working_dir_from(json);

  if (tool_name == "Bash") {
    if (!input.has_value()) {
      return malformed("Bash payload has no 'tool_input' object");
    }
    const auto command = common::json_get_string(*input, "command");
    if (!command.has_value()) {
      return malformed("Bash payload has no string 'command'");
    }
    invocation.kind = OperationKind::ShellCommand;
    invocation.target = *command;
    return ParseResult::success(std::move(invocation));
  }

  if (tool_name == "Write" || tool_name == "Edit" || tool_name == "MultiEdit" ||
      tool_name == "NotebookEdit") {
    if (!input.has_value()) {
      return malformed(tool_name + " payload has no 'tool_input' object");
    }
    auto path = common::json_get_string(*input, "file_path");
    if (!path.has_value()) {
      path = common::json_get_string(*input, "notebook_path");
    }
    if (!path.has_value()) {
      return malformed(tool_name + " payload has no 'file_path'");
    }
    invocation.kind = tool_name == "Write" ? OperationKind::FileWrite : OperationKind::FileEdit;
    invocation.target = *path;
    return ParseResult::success(std::move(invocation));
  }

  return ParseResult::success(std::nullopt);
}

} // namespace

ParseResult parse_invocation(const std::string &json, const common::TimePoint requested_at) {
  if (common::trim(json).empty()) {
    return malformed("empty gate payload");
  }
  if (!is_json_object(json)) {
    return malformed("gate payload is not a JSON object");
  }

  if (const auto operation = common::json_get_string(json, "operationKind");
      operation.has_value()) {
    return parse_operation_shape(json, *operation, requested_at);
  }
  if (const auto tool_name = common::json_get_string(json, "tool_name"); tool_name.has_value()) {
    return parse_hook_shape(json, *tool_name, requested_at);
  }
  return malformed("gate payload has neither 'operationKind' nor 'tool_name'");
}

} // namespace warden::gate
