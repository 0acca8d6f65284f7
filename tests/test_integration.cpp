/// @file test_integration.cpp
/// Integration tests; they need a reachable OData service.
///
/// Point them at a test database with:
///     export ERP_SYNC_TEST_URL=http://host:81/base/odata/standard.odata
///     export ERP_SYNC_TEST_USER=...
///     export ERP_SYNC_TEST_PASSWORD=...
///
/// If the service is not configured or not reachable, the tests against it
/// are SKIPPED (not failed).

#include "entities.hpp"
#include "mapping.hpp"
#include "odata_client.hpp"
#include "pacer.hpp"
#include "pagination.hpp"
#include "reference_resolver.hpp"
#include "sync_orchestrator.hpp"
#include "sync_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

using namespace erp_sync;
using namespace std::chrono_literals;

namespace {

std::string envOr(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

} // namespace

// ============================================================================
// Client behaviour that needs no server
// ============================================================================

TEST(ODataClient, RejectsUnsupportedUrl) {
    EXPECT_THROW(ODataClient("ftp://erp.local/odata", "u", "p"), std::invalid_argument);
}

TEST(ODataClient, RefusedConnectionThrows) {
    // Nothing listens on port 1.
    ODataClient client("http://127.0.0.1:1/base/odata/standard.odata", "u", "p");
    EXPECT_THROW(client.get(percentEncode(entities::kContractors, "_"), {{"$top", "1"}}, 2000),
                 std::runtime_error);
}

// ============================================================================
// Live service
// ============================================================================

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        mUrl = envOr("ERP_SYNC_TEST_URL");
        if (mUrl.empty()) {
            GTEST_SKIP() << "ERP_SYNC_TEST_URL not set; skipping integration tests.";
        }
        mClient = std::make_unique<ODataClient>(mUrl,
                                                envOr("ERP_SYNC_TEST_USER"),
                                                envOr("ERP_SYNC_TEST_PASSWORD"));

        SyncStore scratch(":memory:");
        SyncOrchestrator probe(*mClient, scratch);
        if (!probe.checkConnection()) {
            GTEST_SKIP() << "OData service not reachable at " << mUrl
                         << "; skipping integration tests.";
        }
    }

    std::string                  mUrl;
    std::unique_ptr<ODataClient> mClient;
};

TEST_F(IntegrationTest, FirstPageOfContractorsIsAnODataCollection) {
    auto resp = mClient->get(percentEncode(entities::kContractors, "_"),
                             {{"$format", "json"}, {"$top", "3"}}, 30000);
    ASSERT_EQ(resp.httpStatus, 200u);

    auto values = extractPageValues(resp.body);
    ASSERT_TRUE(values.has_value());
    EXPECT_LE(values->size(), 3u);
}

TEST_F(IntegrationTest, PagingMatchesOneLargePage) {
    RequestPacer pacer(50ms, 50ms);
    Paginator paginator(*mClient, pacer, 60000);

    auto small = paginator.fetchAll(entities::kNomenclatureTypes, std::nullopt, 7);
    auto large = paginator.fetchAll(entities::kNomenclatureTypes, std::nullopt, 1000);

    EXPECT_FALSE(small.aborted);
    EXPECT_FALSE(large.aborted);
    EXPECT_EQ(small.records.size() + small.problems.size(),
              large.records.size() + large.problems.size());
}

TEST_F(IntegrationTest, ResolvesAContractorName) {
    auto resp = mClient->get(percentEncode(entities::kContractors, "_"),
                             {{"$format", "json"}, {"$top", "1"}}, 30000);
    ASSERT_EQ(resp.httpStatus, 200u);
    auto values = extractPageValues(resp.body);
    ASSERT_TRUE(values.has_value());
    if (values->empty()) {
        GTEST_SKIP() << "No contractors in the test database.";
    }

    const std::string key = readString(values->front(), "Ref_Key");
    ReferenceCache cache;
    ReferenceResolver resolver(*mClient, cache);

    auto name = resolver.resolve(entities::kContractors, key);
    ASSERT_TRUE(name.has_value());
    EXPECT_FALSE(name->empty());
    EXPECT_EQ(resolver.lookupCount(), 1);
}

TEST_F(IntegrationTest, CatalogStagesRunAgainstLiveService) {
    SyncStore store(":memory:");
    SyncOptions options;
    options.pageDelayMs = 50;

    SyncOrchestrator orchestrator(*mClient, store, options);

    // A one-day window keeps the document stages short.
    const std::string today = formatDate(std::chrono::system_clock::now());
    auto report = orchestrator.run(SyncWindow{today, today});

    ASSERT_TRUE(report.connected);
    ASSERT_GE(report.stages.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_TRUE(report.stages[i].ok) << report.stages[i].error;
    }
    EXPECT_EQ(static_cast<int>(store.countRows("nomenclature_types")), report.stages[0].saved);
}
