#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <dockhand/core/types.h>

namespace dockhand::archive {

// .dockerignore style exclusion rules.
//
// Patterns are matched with fnmatch against the '/' separated path relative to the root
// and against each of its parent directories, so "build" excludes "build/x/y.o". A leading
// '!' re-includes what an earlier rule excluded; the last matching rule decides.
class ArchiveRules {
public:
    struct Rule {
        std::string pattern;
        bool negate{false};
    };

    ArchiveRules() = default;
    explicit ArchiveRules(const std::vector<std::string>& patterns);

    // Reads one pattern per line; blank lines and '#' comments are skipped. A missing file
    // yields an empty rule set.
    static Result<ArchiveRules> fromFile(const std::filesystem::path& ignoreFile);

    void add(std::string_view pattern);

    bool excludes(std::string_view relativePath) const;
    // True when some rule can re-include a path, so excluded directories still need walking.
    bool hasExceptions() const noexcept { return hasExceptions_; }
    bool empty() const noexcept { return rules_.empty(); }
    const std::vector<Rule>& rules() const noexcept { return rules_; }

private:
    std::vector<Rule> rules_;
    bool hasExceptions_{false};
};

} // namespace dockhand::archive
