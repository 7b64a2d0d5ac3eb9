#include <dockhand/archive/archive_builder.h>
#include <dockhand/archive/gzip_compressor.h>
#include <dockhand/archive/parallel_gzip_writer.h>
#include <dockhand/core/failure.h>

#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace dockhand::archive {

namespace {

Error ioFailure(const std::string& detail, const std::string& cause = {}) {
    return makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo, detail, cause);
}

Error escapeFailure(const std::string& rel, const fs::path& target) {
    return makeFailure(ErrorCode::ArchiveError, FailureKind::PathEscapesRoot,
                       fmt::format("'{}' resolves to '{}' outside the build context", rel,
                                   target.string()));
}

bool isWithin(const fs::path& root, const fs::path& candidate) {
    auto rel = candidate.lexically_relative(root);
    if (rel.empty()) {
        return false;
    }
    auto first = rel.begin()->string();
    return first != "..";
}

// lstat/stat without throwing; follow selects stat.
bool statPath(const fs::path& p, bool follow, struct stat& st) {
    return (follow ? ::stat(p.c_str(), &st) : ::lstat(p.c_str(), &st)) == 0;
}

ArchiveEntry fileEntry(std::string rel, const fs::path& source, const struct stat& st) {
    ArchiveEntry e;
    e.path = std::move(rel);
    e.type = ArchiveEntry::Type::File;
    e.source = source;
    e.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    e.size = static_cast<std::uint64_t>(st.st_size);
    e.mtime = static_cast<std::int64_t>(st.st_mtime);
    return e;
}

la_ssize_t appendToString(struct archive*, void* clientData, const void* buffer,
                          size_t length) {
    static_cast<std::string*>(clientData)->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

using ArchivePtr = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using EntryPtr = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

} // namespace

Result<std::vector<ArchiveEntry>> ArchiveBuilder::collect(const fs::path& root,
                                                          const ArchiveRules& rules,
                                                          bool followSymlinks) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return ioFailure(fmt::format("Build context '{}' is not a directory", root.string()),
                         ec ? ec.message() : std::string{});
    }
    const auto canonicalRoot = fs::canonical(root, ec);
    if (ec) {
        return ioFailure(fmt::format("Cannot resolve build context '{}'", root.string()),
                         ec.message());
    }

    auto options = fs::directory_options::none;
    if (followSymlinks) {
        options |= fs::directory_options::follow_directory_symlink;
    }

    std::vector<ArchiveEntry> entries;
    fs::recursive_directory_iterator it(root, options, ec);
    if (ec) {
        return ioFailure(fmt::format("Cannot read directory '{}'", root.string()), ec.message());
    }

    // Canonical directories from the root down to the current entry. Only a target
    // already on this chain is a cycle; siblings reached twice are archived twice.
    std::vector<fs::path> ancestors{canonicalRoot};
    auto descendInto = [&](const fs::path& target) {
        ancestors.resize(static_cast<std::size_t>(it.depth()) + 1);
        if (std::find(ancestors.begin(), ancestors.end(), target) != ancestors.end()) {
            it.disable_recursion_pending();
            return;
        }
        ancestors.push_back(target);
    };

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            return ioFailure(fmt::format("Cannot read directory under '{}'", root.string()),
                             ec.message());
        }
        const auto& path = it->path();
        const auto rel = path.lexically_relative(root).generic_string();
        if (rel.empty() || rel == ".." || rel.starts_with("../")) {
            return escapeFailure(rel, path);
        }

        struct stat st {};
        if (!statPath(path, false, st)) {
            return ioFailure(fmt::format("Cannot stat '{}'", rel), std::strerror(errno));
        }
        const bool isLink = S_ISLNK(st.st_mode);
        const bool isDir = S_ISDIR(st.st_mode);

        if (rules.excludes(rel)) {
            struct stat targetSt {};
            const bool followedDir = isLink && followSymlinks && statPath(path, true, targetSt) &&
                                     S_ISDIR(targetSt.st_mode);
            if (!isDir && !followedDir) {
                continue;
            }
            if (!rules.hasExceptions()) {
                it.disable_recursion_pending();
                continue;
            }
            if (followSymlinks) {
                // Re-included children may sit below; walk on but keep the cycle guard.
                auto target = fs::canonical(path, ec);
                if (ec || !isWithin(canonicalRoot, target)) {
                    ec.clear();
                    it.disable_recursion_pending();
                    continue;
                }
                descendInto(target);
            }
            continue;
        }

        if (isLink && !followSymlinks) {
            ArchiveEntry e;
            e.path = rel;
            e.type = ArchiveEntry::Type::Symlink;
            e.linkTarget = fs::read_symlink(path, ec).string();
            if (ec) {
                return ioFailure(fmt::format("Cannot read symlink '{}'", rel), ec.message());
            }
            e.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
            e.mtime = static_cast<std::int64_t>(st.st_mtime);
            entries.push_back(std::move(e));
            continue;
        }

        if (isLink) {
            auto target = fs::canonical(path, ec);
            if (ec) {
                return ioFailure(fmt::format("Cannot resolve symlink '{}'", rel), ec.message());
            }
            if (!isWithin(canonicalRoot, target)) {
                return escapeFailure(rel, target);
            }
            if (!statPath(path, true, st)) {
                return ioFailure(fmt::format("Cannot stat '{}'", rel), std::strerror(errno));
            }
            if (S_ISDIR(st.st_mode)) {
                descendInto(target);
                continue;
            }
            if (S_ISREG(st.st_mode)) {
                entries.push_back(fileEntry(rel, path, st));
            }
            continue;
        }

        if (isDir) {
            if (followSymlinks) {
                auto target = fs::canonical(path, ec);
                if (ec) {
                    return ioFailure(fmt::format("Cannot resolve directory '{}'", rel),
                                     ec.message());
                }
                descendInto(target);
            }
            continue;
        }
        if (S_ISREG(st.st_mode)) {
            entries.push_back(fileEntry(rel, path, st));
        } else {
            spdlog::debug("ArchiveBuilder: skipping special file '{}'", rel);
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const ArchiveEntry& a, const ArchiveEntry& b) { return a.path < b.path; });
    return entries;
}

Result<std::string> ArchiveBuilder::writeTar(const std::vector<ArchiveEntry>& entries) {
    ArchivePtr a(archive_write_new(), archive_write_free);
    if (!a) {
        return ioFailure("archive_write_new failed");
    }
    std::string out;
    if (archive_write_set_format_pax_restricted(a.get()) != ARCHIVE_OK ||
        archive_write_add_filter_none(a.get()) != ARCHIVE_OK ||
        archive_write_open(a.get(), &out, nullptr, appendToString, nullptr) != ARCHIVE_OK) {
        return ioFailure("Cannot initialize tar writer", archiveError(a.get()));
    }

    std::vector<char> buffer(DEFAULT_BUFFER_SIZE);
    for (const auto& entry : entries) {
        std::ifstream in;
        if (entry.type == ArchiveEntry::Type::File) {
            in.open(entry.source, std::ios::binary);
            if (!in) {
                return ioFailure(fmt::format("Cannot read '{}'", entry.path),
                                 std::strerror(errno));
            }
        }

        EntryPtr e(archive_entry_new(), archive_entry_free);
        archive_entry_set_pathname(e.get(), entry.path.c_str());
        archive_entry_set_perm(e.get(), static_cast<mode_t>(entry.mode));
        archive_entry_set_mtime(e.get(), static_cast<time_t>(entry.mtime), 0);
        archive_entry_set_uid(e.get(), 0);
        archive_entry_set_gid(e.get(), 0);
        if (entry.type == ArchiveEntry::Type::Symlink) {
            archive_entry_set_filetype(e.get(), AE_IFLNK);
            archive_entry_set_symlink(e.get(), entry.linkTarget.c_str());
            archive_entry_set_size(e.get(), 0);
        } else {
            archive_entry_set_filetype(e.get(), AE_IFREG);
            archive_entry_set_size(e.get(), static_cast<la_int64_t>(entry.size));
        }

        int r = archive_write_header(a.get(), e.get());
        if (r == ARCHIVE_WARN) {
            spdlog::warn("ArchiveBuilder: '{}': {}", entry.path, archiveError(a.get()));
        } else if (r != ARCHIVE_OK) {
            return ioFailure(fmt::format("Cannot write tar header for '{}'", entry.path),
                             archiveError(a.get()));
        }

        if (entry.type == ArchiveEntry::Type::File) {
            std::uint64_t written = 0;
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto n = static_cast<std::size_t>(in.gcount());
                if (n == 0)
                    break;
                if (archive_write_data(a.get(), buffer.data(), n) < 0) {
                    return ioFailure(fmt::format("Cannot write data for '{}'", entry.path),
                                     archiveError(a.get()));
                }
                written += n;
            }
            if (in.bad()) {
                return ioFailure(fmt::format("Read error on '{}'", entry.path),
                                 std::strerror(errno));
            }
            if (written != entry.size) {
                spdlog::warn("ArchiveBuilder: '{}' changed size while archiving ({} -> {})",
                             entry.path, entry.size, written);
            }
        }
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        return ioFailure("Cannot finish tar stream", archiveError(a.get()));
    }
    return out;
}

Result<ArchiveStream> ArchiveBuilder::build(const fs::path& root, const ArchiveRules& rules,
                                            const ArchiveOptions& options) {
    auto entries = collect(root, rules, options.followSymlinks);
    if (!entries) {
        return entries.error();
    }
    auto tar = writeTar(entries.value());
    if (!tar) {
        return tar.error();
    }

    const auto tarSize = tar.value().size();
    std::string bytes;
    switch (options.compression) {
        case Compression::None:
            bytes = std::move(tar).value();
            break;
        case Compression::Serial: {
            auto gz = GzipCompressor(options.level).compress(tar.value());
            if (!gz) {
                return gz.error();
            }
            bytes = std::move(gz).value();
            break;
        }
        case Compression::Parallel: {
            ParallelGzipWriter writer(options.effectiveWorkers(), options.effectiveChunkSize(),
                                      options.level);
            auto gz = writer.compress(tar.value());
            if (!gz) {
                return gz.error();
            }
            bytes = std::move(gz).value();
            break;
        }
    }

    spdlog::debug("ArchiveBuilder: {} entries from '{}', tar {} bytes, output {} bytes",
                  entries.value().size(), root.string(), tarSize, bytes.size());
    return ArchiveStream(std::move(bytes), options.compression, entries.value().size());
}

} // namespace dockhand::archive
