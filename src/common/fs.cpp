#include "warden/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace warden::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set",
                                                ErrorKind::ConfigurationError);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  if (value.find('$') == std::string::npos) {
    return value;
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  const auto normal_candidate = candidate.lexically_normal();
  auto normal_parent = parent.lexically_normal();
  if (!normal_parent.has_filename() && normal_parent.has_relative_path()) {
    normal_parent = normal_parent.parent_path();
  }

  auto c_it = normal_candidate.begin();
  auto p_it = normal_parent.begin();

  for (; p_it != normal_parent.end(); ++p_it, ++c_it) {
    if (c_it == normal_candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

std::filesystem::path resolve_against(const std::string &value,
                                      const std::filesystem::path &base) {
  std::filesystem::path expanded(expand_path(value));
  if (expanded.empty() || expanded.is_absolute()) {
    return expanded;
  }
  return (base / expanded).lexically_normal();
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Unable to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error("Failed to create directory: " + path.parent_path().string() + ": " +
                           ec.message());
    }
  }

  const auto temp_path =
      std::filesystem::path(path.string() + ".tmp." + std::to_string(static_cast<long>(getpid())));
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("Failed to open temp file: " + temp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      out.close();
      std::filesystem::remove(temp_path, ec);
      return Status::error("Failed to write temp file: " + temp_path.string());
    }
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    return Status::error("Failed to replace " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace warden::common
