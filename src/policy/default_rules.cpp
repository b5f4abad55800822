#include "warden/policy/rule_set.hpp"

namespace warden::policy {

const std::vector<std::string> &default_protected_file_patterns() {
  static const std::vector<std::string> patterns = {
      R"(re:(^|/)\.env(\.[^/]*)?$)",
      "/.git/",
      "/.ssh/",
      "/.gnupg/",
      "/.aws/",
      "id_rsa",
      "id_ed25519",
      R"(re:\.pem$)",
      R"(re:\.p12$)",
      R"(re:\.keystore$)",
      "credentials.json",
      "/.warden/",
  };
  return patterns;
}

const std::vector<std::string> &default_dangerous_command_patterns() {
  static const std::vector<std::string> patterns = {
      // Recursive delete of /, ~, $HOME or a bare glob, whatever the flag spelling.
      R"(re:\brm\s+((-[a-zA-Z]+|--[a-z-]+)\s+)*(-[a-zA-Z]*[rR][a-zA-Z]*|--recursive)\s+((-[a-zA-Z]+|--[a-z-]+)\s+)*((/|~|\$HOME)/?\*?|\*)(\s|[;&|)]|$))",
      "dd if=",
      "of=/dev/",
      "> /dev/sd",
      "mkfs",
      "git reset --hard",
      // --force, --force-with-lease, -f in any short-flag cluster, or a +refspec.
      R"(re:\bgit\s+(-[cC]\s+\S+\s+)*push\b[^;&|]*\s(--force|-[a-zA-Z]*f[a-zA-Z]*(\s|$)|\+\S))",
      "shred ",
      "wipefs",
      "srm ",
      ":(){ :|:& };:",
      "chmod -R 777 /",
  };
  return patterns;
}

const std::vector<std::string> &default_caution_command_patterns() {
  static const std::vector<std::string> patterns = {
      R"(re:(^|[;&|(]\s*)(sudo\s+)?rm\s)",
      "git clean",
      "git rebase",
      "git commit --amend",
      "git filter-branch",
      "git checkout -- ",
      "git restore",
      "git branch -D",
      "git stash drop",
      "git stash clear",
      "chmod -R",
      R"(re:curl[^|]*\|\s*(ba)?sh)",
  };
  return patterns;
}

} // namespace warden::policy
