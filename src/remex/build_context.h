#ifndef REMEX_BUILD_CONTEXT_H_
#define REMEX_BUILD_CONTEXT_H_

#include <string>
#include <vector>
#include <filesystem>

#include <remex/provider.h>

namespace fs = std::filesystem;

// .dockerignore patterns, matched against paths relative to the context root
class IgnoreRules {
  struct Rule {
    std::string pattern;
    bool negate;
  };
  std::vector<Rule> rules_;
 public:
  IgnoreRules() = default;
  explicit IgnoreRules(const std::string& dockerignore);
  // the last matching rule wins; a match on a parent directory excludes its children
  bool Excluded(const std::string& relpath) const;
};

// Deterministic tar (ustar with pax long names) of a directory: entries sorted,
// owners zeroed and mtimes fixed, so equal trees give equal hashes.
// Throws ConfigurationError on unreadable entries.
BuildContext PackBuildContext(const fs::path& root);

std::string Sha256Hex(const std::string& data);

#endif  // REMEX_BUILD_CONTEXT_H_
