#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <dockhand/archive/archive_options.h>
#include <dockhand/archive/archive_rules.h>
#include <dockhand/archive/archive_stream.h>
#include <dockhand/core/types.h>

namespace dockhand::archive {

struct ArchiveEntry {
    enum class Type { File, Symlink };

    // Relative, '/' separated, never starting with "/" or "..".
    std::string path;
    Type type{Type::File};
    // File to read the content from (File entries).
    std::filesystem::path source;
    // Link text as stored on disk (Symlink entries).
    std::string linkTarget;
    std::uint32_t mode{0644};
    std::uint64_t size{0};
    std::int64_t mtime{0};
};

// Packs a directory tree into a build context.
//
// Entries are regular files and symlinks in lexicographic order of their relative path;
// directories are implied by the paths. Owner ids and names are zeroed so unchanged input
// yields byte-identical tar output.
class ArchiveBuilder {
public:
    static Result<ArchiveStream> build(const std::filesystem::path& root,
                                       const ArchiveRules& rules = {},
                                       const ArchiveOptions& options = {});

    // Walks the tree and applies the rules; no file content is read.
    static Result<std::vector<ArchiveEntry>> collect(const std::filesystem::path& root,
                                                     const ArchiveRules& rules,
                                                     bool followSymlinks);

    // Serializes entries as an uncompressed ustar/pax tar stream.
    static Result<std::string> writeTar(const std::vector<ArchiveEntry>& entries);
};

} // namespace dockhand::archive
