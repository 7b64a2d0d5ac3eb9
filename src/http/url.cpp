#include <dockhand/http/url.h>

#include <array>
#include <cctype>

namespace dockhand::http::url {

namespace {

constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                       '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

void appendEscaped(std::string& out, unsigned char c) {
    out.push_back('%');
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
}

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

std::string formEncode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            appendEscaped(out, c);
        }
    }
    return out;
}

std::string encodePath(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (isUnreserved(c) || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            appendEscaped(out, c);
        }
    }
    return out;
}

std::string encodedPair(std::string_view key, std::string_view value) {
    return formEncode(key) + "=" + formEncode(value);
}

std::string encodedPairs(const std::vector<std::pair<std::string, std::string>>& pairs) {
    std::string out;
    for (const auto& [key, value] : pairs) {
        if (!out.empty())
            out.push_back('&');
        if (value.empty()) {
            out += formEncode(key);
        } else {
            out += encodedPair(key, value);
        }
    }
    return out;
}

std::string
encodedVecPairs(const std::vector<std::pair<std::string, std::vector<std::string>>>& pairs) {
    std::string out;
    for (const auto& [key, values] : pairs) {
        for (const auto& value : values) {
            if (!out.empty())
                out.push_back('&');
            out += encodedPair(key, value);
        }
    }
    return out;
}

std::string constructEndpoint(std::string_view endpoint, const std::optional<std::string>& query) {
    std::string out(endpoint);
    if (query) {
        out.push_back('?');
        out += *query;
    }
    return out;
}

} // namespace dockhand::http::url
