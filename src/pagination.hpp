#pragma once

#include "models.hpp"
#include "odata_client.hpp"
#include "pacer.hpp"

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace erp_sync {

/// Loads @p count records starting at @p offset.
/// nullopt means the request failed; an empty vector means no data there.
using PageFetcher = std::function<std::optional<std::vector<nlohmann::json>>(
    std::int64_t offset, std::int64_t count)>;

/// Outcome of fault isolation over one failing range.
struct IsolationResult {
    std::vector<nlohmann::json> records;
    std::vector<ProblemRecord>  problems;
    bool                        reachedEnd = false;  // data ended inside the range
};

/// Range size at or below which offsets are probed one by one.
constexpr std::int64_t kProbeThreshold = 10;

/// Recursively bisect [offset, offset+count) to separate fetchable records
/// from offsets that fail even as single-item pages. Each failing offset is
/// reported with its neighbours when they can be fetched. Only @p fetch is
/// called; nothing else is touched.
IsolationResult isolateFaults(const PageFetcher& fetch,
                              std::int64_t offset,
                              std::int64_t count,
                              std::int64_t probeThreshold = kProbeThreshold);

/// Result of paging through one collection.
struct FetchResult {
    std::vector<nlohmann::json> records;
    std::vector<ProblemRecord>  problems;
    bool                        aborted = false;  // remote kept failing
};

/// Offset/limit pagination over an OData collection with fault isolation.
class Paginator {
public:
    struct Stats {
        int    totalFetched      = 0;
        int    totalRequests     = 0;
        int    failedRequests    = 0;
        int    isolatedBatches   = 0;
        int    problemRecords    = 0;
        double totalSleepSeconds = 0.0;
    };

    Paginator(RemoteSource& source,
              RequestPacer& pacer,
              int pageTimeoutMs = 120000,
              bool verbose = false);

    /// Fetch every record of @p entityName in pages of @p batchSize.
    /// Never throws on remote failures.
    FetchResult fetchAll(const std::string& entityName,
                         const std::optional<std::string>& filter,
                         int batchSize);

    /// After this many consecutive batches in which no offset could be
    /// fetched, the remote is considered down and paging stops.
    void setMaxDeadBatches(int n) { mMaxDeadBatches = n; }

    Stats getStats() const { return mStats; }

private:
    RemoteSource& mSource;
    RequestPacer& mPacer;
    int           mPageTimeoutMs;
    bool          mVerbose;
    int           mMaxDeadBatches = 10;
    Stats         mStats{};

    std::optional<std::vector<nlohmann::json>>
    loadPage(const std::string& resource,
             const std::optional<std::string>& filter,
             std::int64_t offset,
             std::int64_t count);
};

/// Log a problem record list the way operators read it.
void reportProblems(const std::string& entityName,
                    const std::vector<ProblemRecord>& problems);

} // namespace erp_sync
