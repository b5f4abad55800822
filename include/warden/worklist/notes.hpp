#pragma once

#include "warden/worklist/work_item.hpp"

#include <string>
#include <vector>

namespace warden::worklist {

struct MentionedTask {
  std::string description;
  Priority priority = Priority::Medium;
};

/// What a block of session notes says about the worklist.
struct NoteFindings {
  std::vector<MentionedTask> new_tasks;
  std::vector<std::string> completed;
  std::vector<std::string> in_progress;

  [[nodiscard]] bool empty() const {
    return new_tasks.empty() && completed.empty() && in_progress.empty();
  }
};

/// Recognised lines (leading `-`/`*` bullets allowed, keywords case-insensitive):
///   TODO: text, TODO(high): text, - [ ] text    new task
///   DONE: id-or-text, - [x] id-or-text           completion
///   WIP: id-or-text, - [~] id-or-text            in progress
[[nodiscard]] NoteFindings scan_notes(const std::string &text);

/// Item ids a commit subject closes (`closes WL-004`, `completes WL-010`).
[[nodiscard]] std::vector<std::string> closed_item_refs(const std::string &subject);

} // namespace warden::worklist
