#include <dockhand/archive/gzip_compressor.h>
#include <dockhand/core/failure.h>

#include <algorithm>
#include <limits>
#include <vector>
#include <zlib.h>

#include <spdlog/spdlog.h>

namespace dockhand::archive {

namespace {
constexpr int kGzipWindowBits = 15 + 16; // zlib window, gzip wrapper
constexpr int kMemLevel = 8;
constexpr std::size_t kChunk = 32 * 1024;
// avail_in is a uInt; larger inputs go in several calls.
constexpr std::size_t kMaxSlice = std::numeric_limits<uInt>::max();

std::size_t effectiveSlice(std::size_t requested) {
    return requested == 0 ? kMaxSlice : std::min(requested, kMaxSlice);
}

[[nodiscard]] Error makeZlibError(const char* operation, int code, const z_stream& stream) {
    return makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                       fmt::format("{} failed ({})", operation, code),
                       stream.msg ? stream.msg : "");
}
} // namespace

GzipCompressor::GzipCompressor(int level, std::size_t sliceSize)
    : level_(std::clamp(level, 0, 9)), sliceSize_(effectiveSlice(sliceSize)) {}

Result<std::string> GzipCompressor::compress(std::string_view data) const {
    z_stream stream{};
    int rc = deflateInit2(&stream, level_, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        return makeZlibError("deflateInit2", rc, stream);
    }

    std::string out;
    out.reserve(deflateBound(&stream, static_cast<uLong>(data.size())));
    std::vector<char> temp(kChunk);
    std::size_t offset = 0;
    int flush = Z_NO_FLUSH;
    do {
        const std::size_t n = std::min(sliceSize_, data.size() - offset);
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + offset));
        stream.avail_in = static_cast<uInt>(n);
        offset += n;
        flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;

        // Drains the slice; with Z_FINISH this also emits the trailer.
        do {
            stream.next_out = reinterpret_cast<Bytef*>(temp.data());
            stream.avail_out = static_cast<uInt>(temp.size());
            rc = deflate(&stream, flush);
            if (rc == Z_STREAM_ERROR) {
                auto err = makeZlibError("deflate", rc, stream);
                deflateEnd(&stream);
                return err;
            }
            out.append(temp.data(), temp.size() - stream.avail_out);
        } while (stream.avail_out == 0);
    } while (flush != Z_FINISH);
    deflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        return makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                           fmt::format("deflate did not finish ({})", rc));
    }
    spdlog::trace("GzipCompressor: {} -> {} bytes (level {})", data.size(), out.size(), level_);
    return out;
}

Result<std::string> GzipCompressor::decompress(std::string_view data, std::size_t limit,
                                               std::size_t sliceSize) {
    const std::size_t slice = effectiveSlice(sliceSize);
    std::string out;
    std::vector<char> temp(kChunk);
    std::size_t offset = 0;

    // One pass per gzip member.
    while (offset < data.size()) {
        z_stream stream{};
        int rc = inflateInit2(&stream, kGzipWindowBits);
        if (rc != Z_OK) {
            return makeZlibError("inflateInit2", rc, stream);
        }

        // Bytes handed to zlib so far; part of the last slice may belong to the next member.
        std::size_t fed = offset;
        do {
            if (stream.avail_in == 0 && fed < data.size()) {
                const std::size_t n = std::min(slice, data.size() - fed);
                stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + fed));
                stream.avail_in = static_cast<uInt>(n);
                fed += n;
            }
            stream.next_out = reinterpret_cast<Bytef*>(temp.data());
            stream.avail_out = static_cast<uInt>(temp.size());
            rc = inflate(&stream, Z_NO_FLUSH);
            const bool inputExhausted = stream.avail_in == 0 && fed == data.size();
            if (rc == Z_BUF_ERROR && inputExhausted) {
                inflateEnd(&stream);
                return makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                                   "Truncated gzip stream");
            }
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                auto err = makeZlibError("inflate", rc, stream);
                inflateEnd(&stream);
                return err;
            }
            out.append(temp.data(), temp.size() - stream.avail_out);
            if (limit && out.size() > limit) {
                inflateEnd(&stream);
                return Error{ErrorCode::BodyTooLarge,
                             fmt::format("Decompressed data exceeds {} bytes", limit)};
            }
            if (rc != Z_STREAM_END && inputExhausted && stream.avail_out != 0) {
                inflateEnd(&stream);
                return makeFailure(ErrorCode::ArchiveError, FailureKind::ArchiveIo,
                                   "Truncated gzip stream");
            }
        } while (rc != Z_STREAM_END);

        offset = fed - stream.avail_in;
        inflateEnd(&stream);
    }
    return out;
}

} // namespace dockhand::archive
