#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dockhand::http::url {

// application/x-www-form-urlencoded encoding of one component (space becomes '+').
std::string formEncode(std::string_view value);

// Percent-encodes everything but unreserved characters and '/'.
std::string encodePath(std::string_view path);

// "key=value", both form encoded.
std::string encodedPair(std::string_view key, std::string_view value);

// Joins pairs with '&'. A pair with an empty value renders as the bare key.
std::string encodedPairs(const std::vector<std::pair<std::string, std::string>>& pairs);

// Repeats each key once per value: encodedVecPairs({{"t", {"a", "b"}}}) == "t=a&t=b".
std::string
encodedVecPairs(const std::vector<std::pair<std::string, std::vector<std::string>>>& pairs);

// Appends "?query" to the endpoint when a query is given.
std::string constructEndpoint(std::string_view endpoint,
                              const std::optional<std::string>& query = std::nullopt);

} // namespace dockhand::http::url
