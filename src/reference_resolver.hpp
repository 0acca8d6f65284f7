#pragma once

#include "odata_client.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace erp_sync {

/// UUID -> display name, per catalog. Lives for one sync run; entries are
/// never evicted or overwritten.
class ReferenceCache {
public:
    std::optional<std::string> find(const std::string& catalog,
                                    const std::string& key) const;

    /// Returns false if the key already had a name.
    bool store(const std::string& catalog,
               const std::string& key,
               const std::string& name);

    std::size_t size(const std::string& catalog) const;
    std::size_t size() const;

private:
    std::map<std::string, std::unordered_map<std::string, std::string>> mEntries;
};

/// Resolves catalog references to display names through single-entity
/// lookups, caching successes only.
class ReferenceResolver {
public:
    ReferenceResolver(RemoteSource& source,
                      ReferenceCache& cache,
                      int lookupTimeoutMs = 30000,
                      bool verbose = false);

    /// Display name of @p key in @p catalog, or nullopt for an empty or
    /// sentinel key and for any lookup failure. Never throws.
    std::optional<std::string> resolve(const std::string& catalog,
                                       const std::string& key);

    /// First name found across @p catalogs, in order.
    std::optional<std::string> resolveAny(const std::vector<std::string>& catalogs,
                                          const std::string& key);

    int lookupCount()  const { return mLookups; }
    int failureCount() const { return mFailures; }

private:
    RemoteSource&   mSource;
    ReferenceCache& mCache;
    int             mTimeoutMs;
    bool            mVerbose;
    int             mLookups  = 0;
    int             mFailures = 0;
};

} // namespace erp_sync
