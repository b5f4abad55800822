#pragma once

#include "warden/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace warden::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Resolve `value` against `base` unless it is already absolute. `~` and `$VAR` are expanded.
[[nodiscard]] std::filesystem::path resolve_against(const std::string &value,
                                                    const std::filesystem::path &base);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write to a sibling temp file and rename it over `path`. Readers see either the old
/// or the new content.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace warden::common
