#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace warden::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON string body (\n, \t, \", \\, \/ and \u00XX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a top-level string field. std::nullopt when the field is absent or not a string.
[[nodiscard]] std::optional<std::string> json_get_string(const std::string &json,
                                                         const std::string &field);

/// Extract a top-level object field (including braces).
[[nodiscard]] std::optional<std::string> json_get_object(const std::string &json,
                                                         const std::string &field);

} // namespace warden::common
