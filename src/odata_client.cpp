#include "odata_client.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef ERP_SYNC_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace erp_sync {

namespace {

http::request<http::empty_body> makeRequest(const std::string& host,
                                            const std::string& target,
                                            const std::string& authToken) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "erp_sync/1.0");
    if (!authToken.empty()) {
        req.set(http::field::authorization, "Basic " + authToken);
    }
    return req;
}

/// Non-200 bodies are often XML error pages; only a 200 must carry JSON.
nlohmann::json parseBody(unsigned int status, const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        if (status == 200) {
            throw std::runtime_error(
                std::string("Failed to parse JSON response: ") + e.what());
        }
        return nlohmann::json();
    }
}

} // namespace

ODataClient::ODataClient(const std::string& baseUrl,
                         const std::string& user,
                         const std::string& password)
{
    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target == "/" ? "" : parts.target;
    mUseSsl   = (parts.scheme == "https");
    if (!user.empty()) {
        mAuthToken = basicAuthToken(user, password);
    }

#ifndef ERP_SYNC_HAS_SSL
    if (mUseSsl) {
        throw std::runtime_error("ERP URL " + baseUrl +
                                 " needs HTTPS, but erp_sync was built without OpenSSL");
    }
#endif
}

RemoteSource::Response
ODataClient::get(const std::string& resource,
                 const QueryParams& params,
                 int timeoutMs)
{
    std::string target = mBasePath + "/" + resource;
    if (!params.empty()) {
        target += "?" + buildQueryString(params);
    }

    if (mVerbose) {
        std::cerr << "[ODataClient] GET " << mHost << ":" << mPort
                  << target << "\n";
    }

    return mUseSsl ? doHttpsRequest(target, timeoutMs)
                   : doHttpRequest(target, timeoutMs);
}

// ---------------------------------------------------------------------------
// Transports
// ---------------------------------------------------------------------------

namespace {

/// Send one GET over an already connected stream and read the full reply.
/// @p Stream is a beast::tcp_stream or an ssl_stream over one.
template <typename Stream>
RemoteSource::Response exchange(Stream& stream,
                                const std::string& host,
                                const std::string& target,
                                const std::string& authToken,
                                std::chrono::milliseconds timeout)
{
    auto req = makeRequest(host, target, authToken);
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::read(stream, buffer, res);

    RemoteSource::Response response;
    response.httpStatus = res.result_int();
    response.body       = parseBody(response.httpStatus, res.body());
    return response;
}

} // namespace

RemoteSource::Response
ODataClient::doHttpRequest(const std::string& target, int timeoutMs)
{
    const std::chrono::milliseconds timeout(timeoutMs);

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    stream.expires_after(timeout);
    stream.connect(resolver.resolve(mHost, mPort));

    auto response = exchange(stream, mHost, target, mAuthToken, timeout);
    if (mVerbose) {
        std::cerr << "[ODataClient] HTTP " << response.httpStatus << "\n";
    }

    // The reply is already read; a failed shutdown changes nothing.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return response;
}

RemoteSource::Response
ODataClient::doHttpsRequest(const std::string& target, int timeoutMs)
{
#ifdef ERP_SYNC_HAS_SSL
    namespace ssl = net::ssl;
    const std::chrono::milliseconds timeout(timeoutMs);

    net::io_context ioc;
    ssl::context    tls(ssl::context::tlsv12_client);
    tls.set_default_verify_paths();
    tls.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Cannot set TLS server name for " + mHost);
    }

    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).connect(resolver.resolve(mHost, mPort));
    stream.handshake(ssl::stream_base::client);

    auto response = exchange(stream, mHost, target, mAuthToken, timeout);
    if (mVerbose) {
        std::cerr << "[ODataClient] HTTPS " << response.httpStatus << "\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);
    return response;
#else
    (void)target;
    (void)timeoutMs;
    throw std::runtime_error("Cannot reach " + mHost + " over HTTPS: built without OpenSSL");
#endif
}

} // namespace erp_sync
