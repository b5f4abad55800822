#include "warden/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace warden::common {

namespace {

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

void append_utf8(std::string &out, const unsigned int cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

// Position of the value that belongs to `field` in the root object, or npos.
std::size_t find_top_level_value(const std::string &json, const std::string &field) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::string::npos;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      return std::string::npos;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::string::npos;
    }

    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::string::npos;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::string::npos;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      return std::string::npos;
    }
    if (key == field) {
      return pos;
    }

    // Skip over the value.
    const char ch = json[pos];
    if (ch == '"') {
      const auto end = json_find_string_end(json, pos);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      pos = end + 1;
    } else if (ch == '{' || ch == '[') {
      const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
      if (end == std::string::npos) {
        return std::string::npos;
      }
      pos = end + 1;
    } else {
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}') {
        ++pos;
      }
    }
  }
  return std::string::npos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int cp = 0;
      bool valid = i + 4 < raw.size();
      for (std::size_t k = 1; valid && k <= 4; ++k) {
        const int digit = hex_value(raw[i + k]);
        if (digit < 0) {
          valid = false;
        } else {
          cp = (cp << 4U) | static_cast<unsigned int>(digit);
        }
      }
      if (!valid) {
        out += "\\u";
        break;
      }
      append_utf8(out, cp);
      i += 4;
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<std::string> json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = find_top_level_value(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return std::nullopt;
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::optional<std::string> json_get_object(const std::string &json, const std::string &field) {
  const std::size_t pos = find_top_level_value(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return std::nullopt;
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return json.substr(pos, end - pos + 1);
}

} // namespace warden::common
