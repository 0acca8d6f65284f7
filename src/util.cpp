#include "util.hpp"
#include "models.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <cctype>
#include <cmath>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace erp_sync {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }

    // OData resources are appended as "<target>/<entity>".
    while (parts.target.size() > 1 && parts.target.back() == '/') {
        parts.target.pop_back();
    }
    return parts;
}

std::string percentEncode(const std::string& text, const std::string& safe) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' ||
            safe.find(static_cast<char>(c)) != std::string::npos) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string buildQueryString(const QueryParams& params) {
    std::string query;
    for (const auto& [name, value] : params) {
        if (!query.empty()) query += '&';
        query += name;
        query += '=';
        query += percentEncode(value, "");
    }
    return query;
}

// Beast's base64 lives in a detail namespace with no stability promise. It has
// kept this encoded_size/encode signature since Boost 1.70, the floor the build
// requires; revisit this function when raising that floor.
std::string basicAuthToken(const std::string& user, const std::string& password) {
    namespace base64 = boost::beast::detail::base64;

    const std::string credentials = user + ":" + password;
    std::string token(base64::encoded_size(credentials.size()), '\0');
    token.resize(base64::encode(token.data(), credentials.data(), credentials.size()));
    return token;
}

bool isEmptyKey(const std::string& key) {
    return key.empty() || key == kEmptyUuid;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool isIsoDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    for (std::size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    const int month = std::stoi(text.substr(5, 2));
    const int day   = std::stoi(text.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

std::string formatDate(std::chrono::system_clock::time_point tp) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d");
    return oss.str();
}

double roundTo(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

} // namespace erp_sync
