#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/verb.hpp>

#include <dockhand/core/types.h>

namespace dockhand::http {

namespace beast_http = boost::beast::http;

// Registry credentials header used by image push/pull and build endpoints.
inline constexpr std::string_view kAuthHeader = "X-Registry-Auth";

// Pull-based producer for request bodies of unknown length. Returns the next chunk,
// std::nullopt at the end, or an error that aborts the request.
using BodySource = std::function<Result<std::optional<std::string>>()>;

// Body shapes the daemon API accepts, each with its default content type.
class Payload {
public:
    enum class Kind { None, Text, Json, XTar, Tar };

    Payload() = default;

    static Payload none() { return Payload{}; }
    static Payload text(std::string data) { return Payload{Kind::Text, std::move(data)}; }
    static Payload json(std::string data) { return Payload{Kind::Json, std::move(data)}; }
    static Payload xtar(std::string data) { return Payload{Kind::XTar, std::move(data)}; }
    static Payload tar(std::string data) { return Payload{Kind::Tar, std::move(data)}; }

    Kind kind() const noexcept { return kind_; }
    bool isNone() const noexcept { return kind_ == Kind::None; }
    const std::string& data() const& noexcept { return data_; }
    std::string&& data() && noexcept { return std::move(data_); }

    // MIME type, or std::nullopt for None and Text.
    std::optional<std::string_view> mimeType() const noexcept;

private:
    Payload(Kind kind, std::string data) : kind_(kind), data_(std::move(data)) {}

    Kind kind_{Kind::None};
    std::string data_;
};

struct StreamingBody {
    BodySource source;
};

// One outbound request. Built by RequestBuilder and not modified afterwards; a streaming
// body is drained by the Connection that sends it.
class Request {
public:
    using QueryParams = std::vector<std::pair<std::string, std::string>>;
    using Body = std::variant<std::monostate, std::string, StreamingBody>;

    beast_http::verb method() const noexcept { return method_; }
    // Encoded path without the query string.
    const std::string& path() const noexcept { return path_; }
    const QueryParams& query() const noexcept { return query_; }
    // Encoded path plus query string, as written on the request line.
    std::string target() const;
    const beast_http::fields& headers() const noexcept { return headers_; }

    bool hasBody() const noexcept { return !std::holds_alternative<std::monostate>(body_); }
    bool isStreaming() const noexcept { return std::holds_alternative<StreamingBody>(body_); }
    // Buffered body bytes, or nullptr when the body is absent or streaming.
    const std::string* bufferedBody() const noexcept { return std::get_if<std::string>(&body_); }
    BodySource* streamingSource() noexcept;

private:
    friend class RequestBuilder;
    Request() = default;

    beast_http::verb method_{beast_http::verb::get};
    std::string path_;
    QueryParams query_;
    beast_http::fields headers_;
    Body body_;
};

class RequestBuilder {
public:
    RequestBuilder(beast_http::verb method, std::string_view path);

    // Marks the path as already percent-encoded.
    RequestBuilder& preEncoded();
    RequestBuilder& query(std::string key, std::string value);
    // Appends a key-only parameter ("?all").
    RequestBuilder& queryKey(std::string key);
    // Appends key=value for every value, keeping their order.
    RequestBuilder& queryValues(const std::string& key, const std::vector<std::string>& values);
    RequestBuilder& header(std::string_view name, std::string_view value);
    RequestBuilder& body(Payload payload);
    RequestBuilder& streamBody(BodySource source, std::string_view contentType);

    // Caller headers always win; Content-Type/Content-Length/Transfer-Encoding are only
    // derived from the body when absent.
    Request build();

private:
    beast_http::verb method_;
    std::string path_;
    bool preEncoded_{false};
    Request::QueryParams query_;
    beast_http::fields headers_;
    Request::Body body_;
    std::optional<std::string> defaultContentType_;
};

} // namespace dockhand::http
