#pragma once

#include "util.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace erp_sync {

/// A read-only view of the remote ERP collections.
class RemoteSource {
public:
    struct Response {
        unsigned int   httpStatus = 0;
        nlohmann::json body;
    };

    virtual ~RemoteSource() = default;

    /// GET @p resource (already percent-encoded) with @p params.
    /// @throws std::runtime_error on network / timeout / parse errors.
    virtual Response get(const std::string& resource,
                         const QueryParams& params,
                         int timeoutMs) = 0;
};

/// OData HTTP client built on Boost.Beast, with basic authentication.
class ODataClient : public RemoteSource {
public:
    /// @param baseUrl  Service root, e.g. "http://host:81/base/odata/standard.odata"
    ODataClient(const std::string& baseUrl,
                const std::string& user,
                const std::string& password);

    Response get(const std::string& resource,
                 const QueryParams& params,
                 int timeoutMs) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    std::string mAuthToken;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target, int timeoutMs);
    Response doHttpsRequest(const std::string& target, int timeoutMs);
};

} // namespace erp_sync
