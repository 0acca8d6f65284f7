#include "pagination.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <set>

namespace erp_sync {

// ---------------------------------------------------------------------------
// Fault isolation
// ---------------------------------------------------------------------------

namespace {

std::optional<DocumentSummary> probeNeighbour(const PageFetcher& fetch,
                                               std::int64_t offset) {
    if (offset < 0) return std::nullopt;
    auto page = fetch(offset, 1);
    if (!page || page->empty()) return std::nullopt;
    return summarizeDocument(page->front());
}

void merge(IsolationResult& into, IsolationResult&& from) {
    into.records.insert(into.records.end(),
                        std::make_move_iterator(from.records.begin()),
                        std::make_move_iterator(from.records.end()));
    into.problems.insert(into.problems.end(),
                         from.problems.begin(), from.problems.end());
    into.reachedEnd = into.reachedEnd || from.reachedEnd;
}

IsolationResult probeEach(const PageFetcher& fetch,
                          std::int64_t offset,
                          std::int64_t count) {
    IsolationResult result;
    std::set<std::int64_t> failed;

    for (std::int64_t pos = offset; pos < offset + count; ++pos) {
        auto page = fetch(pos, 1);
        if (page) {
            if (page->empty()) {
                result.reachedEnd = true;
                break;
            }
            result.records.push_back(std::move(page->front()));
            continue;
        }

        ProblemRecord problem;
        problem.offset = pos;
        if (failed.count(pos - 1) == 0) {
            problem.before = probeNeighbour(fetch, pos - 1);
        }
        problem.after = probeNeighbour(fetch, pos + 1);
        failed.insert(pos);
        result.problems.push_back(std::move(problem));
    }
    return result;
}

} // namespace

IsolationResult isolateFaults(const PageFetcher& fetch,
                              std::int64_t offset,
                              std::int64_t count,
                              std::int64_t probeThreshold)
{
    if (count <= 0) return {};
    if (count <= std::max<std::int64_t>(probeThreshold, 1)) {
        return probeEach(fetch, offset, count);
    }

    IsolationResult result;
    const std::int64_t half = count / 2;
    const std::int64_t ranges[2][2] = {{offset, half}, {offset + half, count - half}};

    for (const auto& range : ranges) {
        const std::int64_t start = range[0];
        const std::int64_t size  = range[1];

        auto page = fetch(start, size);
        if (!page) {
            merge(result, isolateFaults(fetch, start, size, probeThreshold));
        } else {
            if (static_cast<std::int64_t>(page->size()) < size) {
                result.reachedEnd = true;
            }
            result.records.insert(result.records.end(),
                                  std::make_move_iterator(page->begin()),
                                  std::make_move_iterator(page->end()));
        }
        if (result.reachedEnd) break;
    }
    return result;
}

// ---------------------------------------------------------------------------
// Paginator
// ---------------------------------------------------------------------------

Paginator::Paginator(RemoteSource& source,
                     RequestPacer& pacer,
                     int pageTimeoutMs,
                     bool verbose)
    : mSource(source)
    , mPacer(pacer)
    , mPageTimeoutMs(pageTimeoutMs)
    , mVerbose(verbose) {}

FetchResult Paginator::fetchAll(const std::string& entityName,
                                const std::optional<std::string>& filter,
                                int batchSize)
{
    FetchResult result;
    const std::string resource = percentEncode(entityName, "_");
    const std::int64_t batch   = std::max(batchSize, 1);

    PageFetcher fetch = [&](std::int64_t offset, std::int64_t count) {
        return loadPage(resource, filter, offset, count);
    };

    std::int64_t offset = 0;
    int deadBatches     = 0;

    while (true) {
        auto page = fetch(offset, batch);

        if (!page) {
            std::cerr << "[Paginator] " << entityName << ": batch "
                      << offset << "-" << (offset + batch)
                      << " failed, isolating problem records...\n";
            ++mStats.isolatedBatches;

            auto isolated = isolateFaults(fetch, offset, batch);
            const bool nothingLoaded = isolated.records.empty() && !isolated.reachedEnd;

            for (const auto& p : isolated.problems) {
                std::cerr << "[Paginator] >>> problem record at position "
                          << p.offset << "\n";
            }
            mStats.problemRecords += static_cast<int>(isolated.problems.size());
            result.records.insert(result.records.end(),
                                  std::make_move_iterator(isolated.records.begin()),
                                  std::make_move_iterator(isolated.records.end()));
            result.problems.insert(result.problems.end(),
                                   isolated.problems.begin(),
                                   isolated.problems.end());

            if (isolated.reachedEnd) break;

            deadBatches = nothingLoaded ? deadBatches + 1 : 0;
            if (deadBatches >= mMaxDeadBatches) {
                std::cerr << "[Paginator] " << entityName << ": "
                          << deadBatches << " consecutive batches failed "
                          << "entirely; giving up.\n";
                result.aborted = true;
                break;
            }

            offset += batch;
            mPacer.pauseAfterFailure();
            continue;
        }

        deadBatches = 0;
        if (page->empty()) break;

        const bool lastPage = static_cast<std::int64_t>(page->size()) < batch;
        result.records.insert(result.records.end(),
                              std::make_move_iterator(page->begin()),
                              std::make_move_iterator(page->end()));

        std::cerr << "[Paginator] " << entityName << ": loaded "
                  << result.records.size() << " records...\n";

        if (lastPage) break;

        offset += batch;
        mPacer.pauseAfterSuccess();
    }

    if (!result.problems.empty()) {
        reportProblems(entityName, result.problems);
    }

    mStats.totalFetched     += static_cast<int>(result.records.size());
    mStats.totalSleepSeconds = mPacer.totalSleepSeconds();

    return result;
}

std::optional<std::vector<nlohmann::json>>
Paginator::loadPage(const std::string& resource,
                    const std::optional<std::string>& filter,
                    std::int64_t offset,
                    std::int64_t count)
{
    QueryParams params = {
        {"$format", "json"},
        {"$top", std::to_string(count)},
        {"$skip", std::to_string(offset)},
    };
    if (filter && !filter->empty()) {
        params.emplace_back("$filter", *filter);
    }

    ++mStats.totalRequests;
    try {
        const auto resp = mSource.get(resource, params, mPageTimeoutMs);
        if (resp.httpStatus != 200) {
            ++mStats.failedRequests;
            if (mVerbose) {
                std::cerr << "[Paginator] HTTP " << resp.httpStatus
                          << " at skip=" << offset << " top=" << count << "\n";
            }
            return std::nullopt;
        }

        auto values = extractPageValues(resp.body);
        if (!values) {
            ++mStats.failedRequests;
            if (mVerbose) {
                std::cerr << "[Paginator] Malformed page at skip=" << offset << "\n";
            }
        }
        return values;

    } catch (const std::exception& e) {
        ++mStats.failedRequests;
        if (mVerbose) {
            std::cerr << "[Paginator] Network error at skip=" << offset
                      << " top=" << count << ": " << e.what() << "\n";
        }
        return std::nullopt;
    }
}

void reportProblems(const std::string& entityName,
                    const std::vector<ProblemRecord>& problems)
{
    std::cerr << "\n[Paginator] !!! " << entityName << ": "
              << problems.size() << " problem record(s) skipped:\n";
    for (const auto& p : problems) {
        std::cerr << "      Position: " << p.offset << "\n";
        if (p.before) {
            std::cerr << "        Before: No " << p.before->number
                      << " of " << p.before->date
                      << " (Ref_Key: " << p.before->id << ")\n";
        }
        if (p.after) {
            std::cerr << "        After:  No " << p.after->number
                      << " of " << p.after->date
                      << " (Ref_Key: " << p.after->id << ")\n";
        }
    }
    std::cerr << "\n";
}

} // namespace erp_sync
