#include "warden/worklist/notes.hpp"

#include "warden/common/fs.hpp"

#include <regex>

namespace warden::worklist {

namespace {

const std::regex &todo_pattern() {
  static const std::regex pattern(R"(^(?:[-*]\s+)?TODO(?:\(\s*([A-Za-z0-9]+)\s*\))?\s*:\s*(.+)$)",
                                  std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

const std::regex &done_pattern() {
  static const std::regex pattern(R"(^(?:[-*]\s+)?DONE\s*:\s*(.+)$)",
                                  std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

const std::regex &wip_pattern() {
  static const std::regex pattern(R"(^(?:[-*]\s+)?WIP\s*:\s*(.+)$)",
                                  std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

const std::regex &checkbox_pattern() {
  static const std::regex pattern(R"(^[-*]\s+\[([ xX~])\]\s+(.+)$)");
  return pattern;
}

const std::regex &closes_pattern() {
  static const std::regex pattern(R"(\b(?:closes|closed|completes|completed)\s+([A-Za-z]+-[0-9]+))",
                                  std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

} // namespace

NoteFindings scan_notes(const std::string &text) {
  NoteFindings findings;
  for (const auto &raw : common::split_lines(text)) {
    const std::string line = common::trim(raw);
    if (line.empty()) {
      continue;
    }

    std::smatch match;
    if (std::regex_match(line, match, todo_pattern())) {
      MentionedTask task;
      task.description = common::trim(match[2].str());
      if (match[1].matched) {
        const auto priority = priority_from_string(match[1].str());
        if (priority.ok()) {
          task.priority = priority.value();
        }
      }
      if (!task.description.empty()) {
        findings.new_tasks.push_back(std::move(task));
      }
      continue;
    }
    if (std::regex_match(line, match, done_pattern())) {
      findings.completed.push_back(common::trim(match[1].str()));
      continue;
    }
    if (std::regex_match(line, match, wip_pattern())) {
      findings.in_progress.push_back(common::trim(match[1].str()));
      continue;
    }
    if (std::regex_match(line, match, checkbox_pattern())) {
      const std::string body = common::trim(match[2].str());
      const char marker = match[1].str().front();
      if (marker == 'x' || marker == 'X') {
        findings.completed.push_back(body);
      } else if (marker == '~') {
        findings.in_progress.push_back(body);
      } else {
        findings.new_tasks.push_back(MentionedTask{.description = body});
      }
    }
  }
  return findings;
}

std::vector<std::string> closed_item_refs(const std::string &subject) {
  std::vector<std::string> out;
  for (auto it = std::sregex_iterator(subject.begin(), subject.end(), closes_pattern());
       it != std::sregex_iterator(); ++it) {
    out.push_back(common::to_upper((*it)[1].str()));
  }
  return out;
}

} // namespace warden::worklist
