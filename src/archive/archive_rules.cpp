#include <dockhand/archive/archive_rules.h>
#include <dockhand/core/failure.h>

#include <fnmatch.h>
#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace dockhand::archive {

namespace {

std::string trim(std::string_view s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t begin = 0;
    for (;;) {
        auto slash = path.find('/', begin);
        parts.push_back(path.substr(begin, slash - begin));
        if (slash == std::string::npos)
            break;
        begin = slash + 1;
    }
    return parts;
}

// A "**" component matches zero or more path components; every other component is an
// fnmatch pattern for exactly one.
bool matchComponents(const std::vector<std::string>& pattern, std::size_t pi,
                     const std::vector<std::string>& path, std::size_t si) {
    if (pi == pattern.size()) {
        return si == path.size();
    }
    if (pattern[pi] == "**") {
        for (std::size_t next = si; next <= path.size(); ++next) {
            if (matchComponents(pattern, pi + 1, path, next))
                return true;
        }
        return false;
    }
    if (si == path.size()) {
        return false;
    }
    return fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) == 0 &&
           matchComponents(pattern, pi + 1, path, si + 1);
}

bool globMatch(const std::string& pattern, const std::string& path) {
    return matchComponents(splitPath(pattern), 0, splitPath(path), 0);
}

// Clean the way the daemon CLI does: no leading "/" or "./", no trailing "/".
std::string normalizePattern(std::string pattern) {
    pattern = std::filesystem::path(pattern).lexically_normal().generic_string();
    while (!pattern.empty() && pattern.front() == '/') {
        pattern.erase(pattern.begin());
    }
    while (!pattern.empty() && pattern.back() == '/') {
        pattern.pop_back();
    }
    if (pattern == ".") {
        pattern.clear();
    }
    return pattern;
}

} // namespace

ArchiveRules::ArchiveRules(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        add(p);
    }
}

Result<ArchiveRules> ArchiveRules::fromFile(const std::filesystem::path& ignoreFile) {
    std::error_code ec;
    if (!std::filesystem::exists(ignoreFile, ec)) {
        return ArchiveRules{};
    }
    std::ifstream in(ignoreFile);
    if (!in) {
        return makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                           fmt::format("Cannot read ignore file '{}'", ignoreFile.string()));
    }
    ArchiveRules rules;
    std::string line;
    while (std::getline(in, line)) {
        auto t = trim(line);
        if (t.empty() || t.front() == '#')
            continue;
        rules.add(t);
    }
    spdlog::debug("ArchiveRules: loaded {} rules from {}", rules.rules_.size(),
                  ignoreFile.string());
    return rules;
}

void ArchiveRules::add(std::string_view raw) {
    auto text = trim(raw);
    Rule rule;
    if (!text.empty() && text.front() == '!') {
        rule.negate = true;
        text = trim(std::string_view(text).substr(1));
    }
    rule.pattern = normalizePattern(text);
    if (rule.pattern.empty()) {
        return;
    }
    hasExceptions_ = hasExceptions_ || rule.negate;
    rules_.push_back(std::move(rule));
}

bool ArchiveRules::excludes(std::string_view relativePath) const {
    const std::string path(relativePath);
    bool excluded = false;
    for (const auto& rule : rules_) {
        bool matched = globMatch(rule.pattern, path);
        // A rule naming a directory covers everything below it.
        for (auto slash = path.find('/'); !matched && slash != std::string::npos;
             slash = path.find('/', slash + 1)) {
            matched = globMatch(rule.pattern, path.substr(0, slash));
        }
        if (matched) {
            excluded = !rule.negate;
        }
    }
    return excluded;
}

} // namespace dockhand::archive
