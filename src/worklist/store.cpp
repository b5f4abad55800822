#include "warden/worklist/store.hpp"

#include "warden/common/fs.hpp"

#include <charconv>
#include <cstdio>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace warden::worklist {

namespace {

constexpr const char *kLastUpdatedLabel = "Last updated:";
constexpr const char *kSummaryHeading = "Summary";

common::Result<WorklistStore> malformed(const std::size_t line_no, const std::string &message) {
  return common::Result<WorklistStore>::failure(
      "worklist line " + std::to_string(line_no) + ": " + message,
      common::ErrorKind::MalformedInput);
}

std::optional<std::size_t> parse_size(const std::string &text) {
  std::size_t value = 0;
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<ItemStatus> parse_marker(const char marker) {
  switch (marker) {
  case ' ':
    return ItemStatus::Pending;
  case '~':
    return ItemStatus::InProgress;
  case 'x':
  case 'X':
    return ItemStatus::Completed;
  default:
    return std::nullopt;
  }
}

std::string first_token(const std::string &text) {
  const auto space = text.find(' ');
  return space == std::string::npos ? text : text.substr(0, space);
}

std::optional<std::size_t> id_number(const std::string &id) {
  if (!common::starts_with(id, kIdPrefix)) {
    return std::nullopt;
  }
  return parse_size(id.substr(std::string(kIdPrefix).size()));
}

} // namespace

double WorklistCounts::completion_rate() const {
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(completed) / static_cast<double>(total);
}

WorklistStore::WorklistStore(std::string title) : title_(std::move(title)) {}

common::Result<WorklistStore> WorklistStore::parse(const std::string &text) {
  WorklistStore store("");
  std::optional<WorklistCounts> declared;
  // Checkboxes under a heading that names no priority are filed as Medium, never dropped.
  Priority section = Priority::Medium;
  bool in_summary = false;
  bool saw_title = false;
  std::unordered_set<std::string> seen_ids;
  std::vector<std::size_t> unnumbered;

  const auto lines = common::split_lines(text);
  for (std::size_t index = 0; index < lines.size(); ++index) {
    const std::size_t line_no = index + 1;
    const std::string line = common::trim(lines[index]);
    if (line.empty()) {
      continue;
    }

    if (common::starts_with(line, "## ")) {
      const std::string heading = common::trim(line.substr(3));
      in_summary = heading == kSummaryHeading;
      section = Priority::Medium;
      if (in_summary) {
        declared = WorklistCounts{};
        continue;
      }
      const auto priority = priority_from_string(heading);
      if (priority.ok()) {
        section = priority.value();
      }
      continue;
    }

    if (common::starts_with(line, "# ") && !saw_title) {
      store.title_ = common::trim(line.substr(2));
      saw_title = true;
      continue;
    }

    if (common::starts_with(line, kLastUpdatedLabel)) {
      const std::string value = common::trim(line.substr(std::string(kLastUpdatedLabel).size()));
      const auto at = common::parse_rfc3339(value);
      if (!at.ok()) {
        return malformed(line_no, "invalid timestamp: " + value);
      }
      store.last_updated_ = at.value();
      continue;
    }

    if (in_summary) {
      if (!common::starts_with(line, "- ")) {
        continue;
      }
      const auto colon = line.find(':');
      if (colon == std::string::npos) {
        return malformed(line_no, "summary entry without a value: " + line);
      }
      const std::string label = common::to_lower(common::trim(line.substr(2, colon - 2)));
      const auto value = parse_size(common::trim(line.substr(colon + 1)));
      if (!value.has_value()) {
        return malformed(line_no, "summary count is not a number: " + line);
      }
      if (label == "total") {
        declared->total = *value;
      } else if (label == "completed") {
        declared->completed = *value;
      } else if (label == "in progress") {
        declared->in_progress = *value;
      } else if (label == "pending") {
        declared->pending = *value;
      } else {
        return malformed(line_no, "unknown summary entry: " + label);
      }
      continue;
    }

    if (line.size() < 6 || !common::starts_with(line, "- [") || line[4] != ']') {
      continue;
    }
    const auto status = parse_marker(line[3]);
    if (!status.has_value()) {
      return malformed(line_no, "unknown checkbox marker: " + line);
    }
    const std::string body = common::trim(line.substr(5));
    if (body.empty()) {
      return malformed(line_no, "item without a description");
    }

    WorkItem item;
    item.priority = section;
    item.status = *status;
    const std::string token = first_token(body);
    if (looks_like_item_id(token)) {
      item.id = token;
      item.description = common::trim(body.substr(token.size()));
      if (!seen_ids.insert(item.id).second) {
        return malformed(line_no, "duplicate item id " + item.id);
      }
    } else {
      item.description = body;
      unnumbered.push_back(store.items_.size());
    }
    store.items_.push_back(std::move(item));
  }

  // Hand-written lines without an id get one after every existing id is known.
  for (const std::size_t position : unnumbered) {
    store.items_[position].id = store.next_id();
  }

  if (declared.has_value()) {
    const auto derived = store.counts();
    if (!(*declared == derived)) {
      std::ostringstream message;
      message << "summary counts (total " << declared->total << ", completed "
              << declared->completed << ", in progress " << declared->in_progress << ", pending "
              << declared->pending << ") do not match items (total " << derived.total
              << ", completed " << derived.completed << ", in progress " << derived.in_progress
              << ", pending " << derived.pending << ")";
      return common::Result<WorklistStore>::failure(message.str(),
                                                    common::ErrorKind::MalformedInput);
    }
  }

  return common::Result<WorklistStore>::success(std::move(store));
}

common::Result<WorklistStore> WorklistStore::load(const std::filesystem::path &path,
                                                  const std::string &default_title) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<WorklistStore>::success(WorklistStore(default_title));
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<WorklistStore>::failure(content.status());
  }
  auto parsed = parse(content.value());
  if (!parsed.ok()) {
    return common::Result<WorklistStore>::failure(path.string() + ": " + parsed.error(),
                                                  parsed.kind());
  }
  if (parsed.value().title_.empty()) {
    parsed.value().title_ = default_title;
  }
  return parsed;
}

common::Status WorklistStore::save(const std::filesystem::path &path) const {
  return common::write_file_atomic(path, render());
}

std::string WorklistStore::render() const {
  const auto summary = counts();
  std::ostringstream out;
  out << "# " << (title_.empty() ? "Worklist" : title_) << "\n\n";
  out << kLastUpdatedLabel << " " << common::format_rfc3339(last_updated_) << "\n\n";
  out << "## " << kSummaryHeading << "\n\n";
  out << "- Total: " << summary.total << "\n";
  out << "- Completed: " << summary.completed << "\n";
  out << "- In progress: " << summary.in_progress << "\n";
  out << "- Pending: " << summary.pending << "\n";

  for (const Priority priority : kPriorities) {
    out << "\n## " << priority_to_string(priority) << "\n\n";
    for (const WorkItem *item : items_by_priority(priority)) {
      out << "- [" << status_marker(item->status) << "] " << item->id << " " << item->description
          << "\n";
    }
  }
  return out.str();
}

common::Result<std::string> WorklistStore::add(const std::string &description,
                                               const Priority priority) {
  WorkItem item;
  item.id = next_id();
  item.description = common::trim(description);
  item.priority = priority;
  const auto status = insert(item);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status);
  }
  return common::Result<std::string>::success(item.id);
}

common::Status WorklistStore::insert(WorkItem item) {
  item.id = common::trim(item.id);
  item.description = common::trim(item.description);
  if (item.id.empty()) {
    return common::Status::error("work item id is empty", common::ErrorKind::MalformedInput);
  }
  if (item.description.empty() || item.description.find('\n') != std::string::npos) {
    return common::Status::error("work item description must be a single non-empty line",
                                 common::ErrorKind::MalformedInput);
  }
  for (const auto &existing : items_) {
    if (existing.id == item.id) {
      return common::Status::error("duplicate work item id " + item.id,
                                   common::ErrorKind::MalformedInput);
    }
  }
  items_.push_back(std::move(item));
  return common::Status::success();
}

common::Status WorklistStore::set_status(const std::string &id_or_description,
                                         const ItemStatus status) {
  WorkItem *item = find_mutable(id_or_description);
  if (item == nullptr) {
    return common::Status::error("no work item matches '" + id_or_description + "'",
                                 common::ErrorKind::MalformedInput);
  }
  item->status = status;
  return common::Status::success();
}

const WorkItem *WorklistStore::find(const std::string &id_or_description) const {
  const std::string needle = common::trim(id_or_description);
  if (needle.empty()) {
    return nullptr;
  }
  const std::string lowered = common::to_lower(needle);

  for (const auto &item : items_) {
    if (common::to_lower(item.id) == lowered) {
      return &item;
    }
  }

  const std::string token = first_token(needle);
  if (token != needle && looks_like_item_id(token)) {
    const std::string lowered_token = common::to_lower(token);
    for (const auto &item : items_) {
      if (common::to_lower(item.id) == lowered_token) {
        return &item;
      }
    }
  }

  for (const auto &item : items_) {
    if (common::to_lower(item.description) == lowered) {
      return &item;
    }
  }

  const WorkItem *candidate = nullptr;
  for (const auto &item : items_) {
    if (common::to_lower(item.description).find(lowered) != std::string::npos) {
      if (candidate != nullptr) {
        return nullptr;
      }
      candidate = &item;
    }
  }
  return candidate;
}

WorkItem *WorklistStore::find_mutable(const std::string &id_or_description) {
  return const_cast<WorkItem *>(std::as_const(*this).find(id_or_description));
}

std::vector<const WorkItem *> WorklistStore::items_by_priority(const Priority priority) const {
  std::vector<const WorkItem *> out;
  for (const auto &item : items_) {
    if (item.priority == priority) {
      out.push_back(&item);
    }
  }
  return out;
}

WorklistCounts WorklistStore::counts() const {
  WorklistCounts counts;
  counts.total = items_.size();
  for (const auto &item : items_) {
    switch (item.status) {
    case ItemStatus::Completed:
      ++counts.completed;
      break;
    case ItemStatus::InProgress:
      ++counts.in_progress;
      break;
    case ItemStatus::Pending:
      ++counts.pending;
      break;
    }
  }
  return counts;
}

std::string WorklistStore::next_id() const {
  std::size_t highest = 0;
  for (const auto &item : items_) {
    if (const auto number = id_number(item.id); number.has_value() && *number > highest) {
      highest = *number;
    }
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%s%03zu", kIdPrefix, highest + 1);
  return buffer;
}

} // namespace warden::worklist
