#pragma once

#include <string>
#include <utility>
#include <vector>

namespace intra_core {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char *kApiBaseUrl = "https://api.intra.42.fr";

/**
 * @brief Appends percent-encoded query parameters to a base URL.
 *
 * @param base Absolute URL, may already carry a query string.
 * @param params Key/value pairs appended in order.
 * @return The full URL.
 * @throws UrlConstructionError if the base is not a valid absolute URL or a
 *         parameter cannot be encoded.
 */
std::string build_url(const std::string &base, const QueryParams &params);

}  // namespace intra_core
