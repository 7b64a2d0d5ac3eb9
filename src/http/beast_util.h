#pragma once

#include <string>
#include <string_view>

#include <boost/beast/core/string.hpp>

namespace dockhand::http::detail {

// Beast's string_view is not std::string_view on every Boost release.
inline boost::beast::string_view toBeast(std::string_view s) {
    return {s.data(), s.size()};
}

inline std::string_view toStd(boost::beast::string_view s) {
    return {s.data(), s.size()};
}

inline std::string toString(boost::beast::string_view s) {
    return {s.data(), s.size()};
}

} // namespace dockhand::http::detail
