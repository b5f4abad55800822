#pragma once

#include "warden/common/result.hpp"
#include "warden/common/time.hpp"
#include "warden/worklist/work_item.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace warden::worklist {

inline constexpr const char *kIdPrefix = "WL-";

struct WorklistCounts {
  std::size_t total = 0;
  std::size_t completed = 0;
  std::size_t in_progress = 0;
  std::size_t pending = 0;

  /// completed / total, 0 for an empty list.
  [[nodiscard]] double completion_rate() const;

  bool operator==(const WorklistCounts &) const = default;
};

/// The persisted task list. Items are never removed, only transitioned, and ids are unique.
class WorklistStore {
public:
  explicit WorklistStore(std::string title = "Worklist");

  /// Parses the markdown format written by render(). A `## Summary` block, when present,
  /// must agree with the items that follow it.
  [[nodiscard]] static common::Result<WorklistStore> parse(const std::string &text);
  /// A missing file is an empty store titled `default_title`.
  [[nodiscard]] static common::Result<WorklistStore> load(const std::filesystem::path &path,
                                                          const std::string &default_title);
  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;
  [[nodiscard]] std::string render() const;

  /// Appends a pending item with the next free `WL-NNN` id.
  [[nodiscard]] common::Result<std::string> add(const std::string &description,
                                                Priority priority);
  [[nodiscard]] common::Status insert(WorkItem item);
  [[nodiscard]] common::Status set_status(const std::string &id_or_description,
                                          ItemStatus status);

  /// Lookup order: id, leading id token, exact description, then a unique description
  /// substring. All text comparisons ignore case.
  [[nodiscard]] const WorkItem *find(const std::string &id_or_description) const;
  [[nodiscard]] std::vector<const WorkItem *> items_by_priority(Priority priority) const;
  [[nodiscard]] const std::vector<WorkItem> &items() const { return items_; }
  [[nodiscard]] WorklistCounts counts() const;
  [[nodiscard]] std::string next_id() const;

  [[nodiscard]] const std::string &title() const { return title_; }
  [[nodiscard]] common::TimePoint last_updated() const { return last_updated_; }
  void touch(common::TimePoint at) { last_updated_ = at; }

private:
  WorkItem *find_mutable(const std::string &id_or_description);

  std::string title_;
  common::TimePoint last_updated_{};
  std::vector<WorkItem> items_;
};

} // namespace warden::worklist
