#include "warden/repo/inspector.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"

#include <cctype>
#include <charconv>

namespace warden::repo {

namespace {

constexpr char kRecordSeparator = '\x1e';
constexpr char kFieldSeparator = '\x1f';

std::vector<std::string> split(const std::string &text, const char separator) {
  std::vector<std::string> out;
  std::string current;
  for (const char ch : text) {
    if (ch == separator) {
      out.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  out.push_back(std::move(current));
  return out;
}

std::string renamed_target(const std::string &path) {
  const std::string arrow = " => ";
  const auto open = path.find('{');
  const auto close = path.find('}', open == std::string::npos ? 0 : open);
  if (open != std::string::npos && close != std::string::npos) {
    const std::string inner = path.substr(open + 1, close - open - 1);
    const auto arrow_pos = inner.find(arrow);
    if (arrow_pos != std::string::npos) {
      std::string joined = path.substr(0, open) + inner.substr(arrow_pos + arrow.size()) +
                           path.substr(close + 1);
      std::string collapsed;
      for (const char ch : joined) {
        if (ch == '/' && !collapsed.empty() && collapsed.back() == '/') {
          continue;
        }
        collapsed.push_back(ch);
      }
      return collapsed;
    }
  }
  const auto arrow_pos = path.find(arrow);
  if (arrow_pos != std::string::npos) {
    return path.substr(arrow_pos + arrow.size());
  }
  return path;
}

bool parse_count(const std::string &text, std::uint64_t &out) {
  if (text.empty()) {
    return false;
  }
  const auto *begin = text.data();
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

ChangeKind classify_status(const char x, const char y) {
  const std::string code{x, y};
  if (code == "??") {
    return ChangeKind::Untracked;
  }
  if (x == 'U' || y == 'U' || code == "AA" || code == "DD") {
    return ChangeKind::Conflicted;
  }
  for (const char ch : {x, y}) {
    switch (ch) {
    case 'A':
      return ChangeKind::Added;
    case 'M':
    case 'T':
      return ChangeKind::Modified;
    case 'D':
      return ChangeKind::Deleted;
    case 'R':
      return ChangeKind::Renamed;
    case 'C':
      return ChangeKind::Copied;
    default:
      break;
    }
  }
  return ChangeKind::Other;
}

} // namespace

std::string_view change_kind_to_string(const ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return "added";
  case ChangeKind::Modified:
    return "modified";
  case ChangeKind::Deleted:
    return "deleted";
  case ChangeKind::Renamed:
    return "renamed";
  case ChangeKind::Copied:
    return "copied";
  case ChangeKind::Untracked:
    return "untracked";
  case ChangeKind::Conflicted:
    return "conflicted";
  case ChangeKind::Other:
    return "other";
  }
  return "other";
}

bool parse_numstat_line(const std::string &line, FileChange &out) {
  const auto first_tab = line.find('\t');
  if (first_tab == std::string::npos) {
    return false;
  }
  const auto second_tab = line.find('\t', first_tab + 1);
  if (second_tab == std::string::npos) {
    return false;
  }

  const std::string added = line.substr(0, first_tab);
  const std::string removed = line.substr(first_tab + 1, second_tab - first_tab - 1);
  const std::string path = line.substr(second_tab + 1);
  if (path.empty()) {
    return false;
  }

  FileChange change;
  change.path = renamed_target(path);
  if (added == "-" && removed == "-") {
    change.binary = true;
  } else if (!parse_count(added, change.added) || !parse_count(removed, change.removed)) {
    return false;
  }
  out = std::move(change);
  return true;
}

std::vector<UncommittedChange> parse_porcelain(const std::string &output) {
  std::vector<UncommittedChange> out;
  const auto entries = split(output, '\0');
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const std::string &entry = entries[i];
    if (entry.size() < 4 || entry[2] != ' ') {
      continue;
    }
    UncommittedChange change;
    change.kind = classify_status(entry[0], entry[1]);
    change.path = entry.substr(3);
    // Renames and copies carry the origin path as the next entry.
    if (entry[0] == 'R' || entry[0] == 'C') {
      ++i;
    }
    out.push_back(std::move(change));
  }
  return out;
}

bool is_commit_hash(const std::string &value) {
  if (value.size() < 4 || value.size() > 64) {
    return false;
  }
  for (const char ch : value) {
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

RepositoryInspector::RepositoryInspector(std::filesystem::path repo_path, IProcessRunner &runner,
                                         InspectorOptions options)
    : repo_path_(std::move(repo_path)), runner_(runner), options_(std::move(options)) {}

void RepositoryInspector::note(const std::string &operation, const std::string &message) {
  const std::string text = common::trim(message);
  diagnostics_.push_back(operation + ": " + text);
  observability::record_repository_degraded(operation, text);
}

common::Result<ProcessResult> RepositoryInspector::git(const std::vector<std::string> &args,
                                                       const bool allow_failure) {
  std::error_code ec;
  if (!std::filesystem::is_directory(repo_path_, ec)) {
    return common::Result<ProcessResult>::failure("repository path does not exist: " +
                                                      repo_path_.string(),
                                                  common::ErrorKind::RepositoryUnavailable);
  }

  std::vector<std::string> argv{options_.git_binary, "-c", "core.quotepath=off"};
  argv.insert(argv.end(), args.begin(), args.end());

  ProcessOptions process_options;
  process_options.timeout = options_.timeout;
  process_options.working_dir = repo_path_;
  process_options.allow_failure = allow_failure;
  process_options.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"LC_ALL", "C"}};

  auto result = runner_.run(argv, process_options);
  if (!result.ok()) {
    return common::Result<ProcessResult>::failure(result.error(),
                                                  common::ErrorKind::RepositoryUnavailable);
  }
  return result;
}

bool RepositoryInspector::is_available() {
  const auto result = git({"rev-parse", "--is-inside-work-tree"});
  if (!result.ok()) {
    note("is_available", result.error());
    return false;
  }
  return common::trim(result.value().stdout_text) == "true";
}

std::string RepositoryInspector::current_branch() {
  const auto symbolic = git({"symbolic-ref", "--short", "-q", "HEAD"}, true);
  if (!symbolic.ok()) {
    note("current_branch", symbolic.error());
    return kUnknownBranch;
  }
  if (symbolic.value().exit_code == 0) {
    const std::string branch = common::trim(symbolic.value().stdout_text);
    if (!branch.empty()) {
      return branch;
    }
  }

  // symbolic-ref exits 1 without output on a detached HEAD.
  const auto head = git({"rev-parse", "--verify", "-q", "HEAD"});
  if (!head.ok()) {
    note("current_branch", head.error());
    return kUnknownBranch;
  }
  return kDetachedBranch;
}

std::vector<UncommittedChange> RepositoryInspector::uncommitted_changes() {
  std::vector<std::string> args{"status", "--porcelain=v1", "-z", "--untracked-files=all"};
  if (!options_.ignored_paths.empty()) {
    args.insert(args.end(), {"--", ":/"});
    for (const auto &ignored : options_.ignored_paths) {
      args.push_back(":(exclude)" + ignored.generic_string());
    }
  }
  const auto result = git(args);
  if (!result.ok()) {
    note("uncommitted_changes", result.error());
    return {};
  }
  return parse_porcelain(result.value().stdout_text);
}

std::vector<CommitRecord> RepositoryInspector::commits_since(const common::TimePoint since) {
  const std::string format = "--format=%x1e%H%x1f%an%x1f%at%x1f%s";
  const auto result =
      git({"log", "--reverse", "--no-color", "--since=" + common::git_date(since), format,
           "--numstat"});
  if (!result.ok()) {
    // A repository without commits has nothing to report.
    if (result.error().find("does not have any commits") != std::string::npos) {
      return {};
    }
    note("commits_since", result.error());
    return {};
  }

  std::vector<CommitRecord> commits;
  for (const auto &record : split(result.value().stdout_text, kRecordSeparator)) {
    if (common::trim(record).empty()) {
      continue;
    }
    const auto lines = common::split_lines(record);
    if (lines.empty()) {
      continue;
    }
    const auto fields = split(lines.front(), kFieldSeparator);
    if (fields.size() < 4 || !is_commit_hash(fields[0])) {
      note("commits_since", "unparseable log record: " + lines.front());
      continue;
    }

    CommitRecord commit;
    commit.hash = fields[0];
    commit.author = fields[1];
    std::int64_t seconds = 0;
    const auto [ptr, ec] =
        std::from_chars(fields[2].data(), fields[2].data() + fields[2].size(), seconds);
    if (ec == std::errc() && ptr == fields[2].data() + fields[2].size()) {
      commit.authored_at = common::from_unix_seconds(seconds);
    }
    commit.message = fields[3];
    // Subjects containing the separator are rejoined.
    for (std::size_t i = 4; i < fields.size(); ++i) {
      commit.message += fields[i];
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
      FileChange change;
      if (parse_numstat_line(lines[i], change)) {
        commit.files_changed.push_back(std::move(change));
      }
    }
    commits.push_back(std::move(commit));
  }
  return commits;
}

std::vector<FileChange> RepositoryInspector::diff_stats(const std::string &hash) {
  if (!is_commit_hash(hash)) {
    note("diff_stats", "rejected non-hex revision: " + hash);
    return {};
  }
  const auto result = git({"show", "--no-color", "--format=", "--numstat", hash});
  if (!result.ok()) {
    note("diff_stats", result.error());
    return {};
  }

  std::vector<FileChange> out;
  for (const auto &line : common::split_lines(result.value().stdout_text)) {
    FileChange change;
    if (parse_numstat_line(line, change)) {
      out.push_back(std::move(change));
    }
  }
  return out;
}

} // namespace warden::repo
