#pragma once

#include <string>

namespace warden::common {

[[nodiscard]] std::string sha256_hex(const std::string &data);

} // namespace warden::common
