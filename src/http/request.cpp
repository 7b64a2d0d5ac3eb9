#include <dockhand/http/request.h>
#include <dockhand/http/url.h>

#include "beast_util.h"

namespace dockhand::http {

std::optional<std::string_view> Payload::mimeType() const noexcept {
    switch (kind_) {
        case Kind::Json:
            return "application/json";
        case Kind::XTar:
            return "application/x-tar";
        case Kind::Tar:
            return "application/tar";
        case Kind::None:
        case Kind::Text:
            break;
    }
    return std::nullopt;
}

std::string Request::target() const {
    if (query_.empty()) {
        return path_;
    }
    return url::constructEndpoint(path_, url::encodedPairs(query_));
}

BodySource* Request::streamingSource() noexcept {
    auto* body = std::get_if<StreamingBody>(&body_);
    return body ? &body->source : nullptr;
}

RequestBuilder::RequestBuilder(beast_http::verb method, std::string_view path)
    : method_(method), path_(path) {}

RequestBuilder& RequestBuilder::preEncoded() {
    preEncoded_ = true;
    return *this;
}

RequestBuilder& RequestBuilder::query(std::string key, std::string value) {
    query_.emplace_back(std::move(key), std::move(value));
    return *this;
}

RequestBuilder& RequestBuilder::queryKey(std::string key) {
    query_.emplace_back(std::move(key), std::string{});
    return *this;
}

RequestBuilder& RequestBuilder::queryValues(const std::string& key,
                                            const std::vector<std::string>& values) {
    for (const auto& v : values) {
        query_.emplace_back(key, v);
    }
    return *this;
}

RequestBuilder& RequestBuilder::header(std::string_view name, std::string_view value) {
    headers_.set(detail::toBeast(name), detail::toBeast(value));
    return *this;
}

RequestBuilder& RequestBuilder::body(Payload payload) {
    if (payload.isNone()) {
        body_ = std::monostate{};
        defaultContentType_.reset();
        return *this;
    }
    if (auto mime = payload.mimeType()) {
        defaultContentType_ = std::string(*mime);
    } else {
        defaultContentType_.reset();
    }
    body_ = std::move(payload).data();
    return *this;
}

RequestBuilder& RequestBuilder::streamBody(BodySource source, std::string_view contentType) {
    body_ = StreamingBody{std::move(source)};
    if (contentType.empty()) {
        defaultContentType_.reset();
    } else {
        defaultContentType_ = std::string(contentType);
    }
    return *this;
}

Request RequestBuilder::build() {
    Request req;
    req.method_ = method_;
    req.path_ = preEncoded_ ? std::move(path_) : url::encodePath(path_);
    if (req.path_.empty() || req.path_.front() != '/') {
        req.path_.insert(req.path_.begin(), '/');
    }
    req.query_ = std::move(query_);
    req.headers_ = std::move(headers_);

    if (defaultContentType_ && req.headers_.find(beast_http::field::content_type) ==
                                   req.headers_.end()) {
        req.headers_.set(beast_http::field::content_type, *defaultContentType_);
    }

    if (auto* buffered = std::get_if<std::string>(&body_)) {
        if (req.headers_.find(beast_http::field::content_length) == req.headers_.end()) {
            req.headers_.set(beast_http::field::content_length,
                             std::to_string(buffered->size()));
        }
    } else if (std::holds_alternative<StreamingBody>(body_)) {
        // Length is unknown up front.
        req.headers_.erase(beast_http::field::content_length);
        req.headers_.set(beast_http::field::transfer_encoding, "chunked");
    }
    req.body_ = std::move(body_);
    return req;
}

} // namespace dockhand::http
