#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace erp_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "81", etc.
    std::string target;   // path component (e.g. "/base/odata/standard.odata")
};

/// Ordered list of query parameters (name, raw value).
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode every byte except unreserved characters and @p safe.
std::string percentEncode(const std::string& text, const std::string& safe = "_");

/// Build "name=value&..." with percent-encoded values.
std::string buildQueryString(const QueryParams& params);

/// "user:password" in base64, for the Authorization: Basic header.
std::string basicAuthToken(const std::string& user, const std::string& password);

/// True for an empty key or the all-zero sentinel UUID.
bool isEmptyKey(const std::string& key);

/// Strip leading/trailing whitespace.
std::string trim(const std::string& text);

/// True when @p text is a calendar date in YYYY-MM-DD form.
bool isIsoDate(const std::string& text);

/// Format a time point as a local YYYY-MM-DD date.
std::string formatDate(std::chrono::system_clock::time_point tp);

/// Round half away from zero to @p places decimals.
double roundTo(double value, int places);

} // namespace erp_sync
