#pragma once

#include <array>
#include <string>
#include <string_view>

namespace warden::session {

enum class ChangeCategory { Security, Fix, Feature, Docs, Refactor, Other };

/// Fixed changelog order, also the keyword-scan priority.
inline constexpr std::array<ChangeCategory, 6> kCategories = {
    ChangeCategory::Security, ChangeCategory::Fix,      ChangeCategory::Feature,
    ChangeCategory::Docs,     ChangeCategory::Refactor, ChangeCategory::Other};

/// `SECURITY`, `FIX`, ...
[[nodiscard]] std::string_view category_to_string(ChangeCategory category);

/// A recognised leading type (`fix:`, `feat(ui):`, `[SECURITY]`, `DOCS - ...`) decides the
/// category; otherwise the first category with a keyword in the message wins.
[[nodiscard]] ChangeCategory classify_commit(const std::string &message);

} // namespace warden::session
