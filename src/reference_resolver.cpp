#include "reference_resolver.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>

namespace erp_sync {

namespace {

// Candidate display fields, most specific first.
const char* const kNameFields[] = {"Description", "НаименованиеПолное"};

const char* const kUnnamed = "unnamed";

std::string displayName(const nlohmann::json& entity) {
    for (const char* field : kNameFields) {
        std::string name = readString(entity, field);
        if (!trim(name).empty()) return name;
    }
    return kUnnamed;
}

} // namespace

// ---------------------------------------------------------------------------
// ReferenceCache
// ---------------------------------------------------------------------------

std::optional<std::string> ReferenceCache::find(const std::string& catalog,
                                                const std::string& key) const {
    auto c = mEntries.find(catalog);
    if (c == mEntries.end()) return std::nullopt;
    auto it = c->second.find(key);
    if (it == c->second.end()) return std::nullopt;
    return it->second;
}

bool ReferenceCache::store(const std::string& catalog,
                           const std::string& key,
                           const std::string& name) {
    return mEntries[catalog].emplace(key, name).second;
}

std::size_t ReferenceCache::size(const std::string& catalog) const {
    auto c = mEntries.find(catalog);
    return c == mEntries.end() ? 0 : c->second.size();
}

std::size_t ReferenceCache::size() const {
    std::size_t total = 0;
    for (const auto& [catalog, names] : mEntries) {
        total += names.size();
    }
    return total;
}

// ---------------------------------------------------------------------------
// ReferenceResolver
// ---------------------------------------------------------------------------

ReferenceResolver::ReferenceResolver(RemoteSource& source,
                                     ReferenceCache& cache,
                                     int lookupTimeoutMs,
                                     bool verbose)
    : mSource(source)
    , mCache(cache)
    , mTimeoutMs(lookupTimeoutMs)
    , mVerbose(verbose) {}

std::optional<std::string> ReferenceResolver::resolve(const std::string& catalog,
                                                      const std::string& key)
{
    if (isEmptyKey(key)) return std::nullopt;

    if (auto cached = mCache.find(catalog, key)) {
        return cached;
    }

    ++mLookups;
    const std::string resource =
        percentEncode(catalog, "_") + "(guid'" + percentEncode(key, "-") + "')";

    try {
        const auto resp = mSource.get(resource, {{"$format", "json"}}, mTimeoutMs);
        if (resp.httpStatus != 200 || !resp.body.is_object()) {
            ++mFailures;
            if (mVerbose) {
                std::cerr << "[Resolver] " << catalog << " " << key
                          << ": HTTP " << resp.httpStatus << "\n";
            }
            return std::nullopt;
        }

        std::string name = displayName(resp.body);
        mCache.store(catalog, key, name);
        return name;

    } catch (const std::exception& e) {
        ++mFailures;
        if (mVerbose) {
            std::cerr << "[Resolver] " << catalog << " " << key
                      << ": " << e.what() << "\n";
        }
        return std::nullopt;
    }
}

std::optional<std::string>
ReferenceResolver::resolveAny(const std::vector<std::string>& catalogs,
                              const std::string& key)
{
    for (const auto& catalog : catalogs) {
        if (auto name = resolve(catalog, key)) return name;
    }
    return std::nullopt;
}

} // namespace erp_sync
