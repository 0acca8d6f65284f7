#pragma once

#include "models.hpp"
#include "odata_client.hpp"
#include "pacer.hpp"
#include "pagination.hpp"
#include "reference_resolver.hpp"
#include "sync_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace erp_sync {

struct SyncOptions {
    int  documentBatchSize = 500;
    int  salesBatchSize    = 100;
    int  catalogBatchSize  = 1000;
    int  pageTimeoutMs     = 120000;
    int  lookupTimeoutMs   = 30000;
    int  pageDelayMs       = 300;
    int  failureDelayMs    = 500;
    int  maxDeadBatches    = 10;
    bool serverDateFilter  = false;  // also narrow documents by date remotely
    bool verbose           = false;
};

enum class Stage { Types, Nomenclature, Clients, Purchases, Sales };

const char* stageName(Stage stage);

struct StageReport {
    Stage                      stage   = Stage::Types;
    bool                       ok      = false;
    int                        fetched = 0;   // remote records (documents or entries)
    int                        saved   = 0;   // rows written
    std::vector<ProblemRecord> problems;
    std::string                error;
};

struct SyncReport {
    bool                     connected = false;
    std::vector<StageReport> stages;
    std::optional<Stage>     failedStage;

    bool succeeded() const { return connected && !failedStage; }
};

/// Runs the sync stages in order for one window:
/// types -> nomenclature -> clients -> purchases -> sales.
/// A failed stage stops the run; stages already committed stay committed.
class SyncOrchestrator {
public:
    SyncOrchestrator(RemoteSource& source,
                     SyncStore& store,
                     SyncOptions options = {});

    /// True if the remote answers a one-record catalog request with 200.
    bool checkConnection();

    /// Check the connection, then run every stage for @p window.
    /// @throws std::invalid_argument if the window is malformed.
    SyncReport run(const SyncWindow& window);

private:
    RemoteSource& mSource;
    SyncStore&    mStore;
    SyncOptions   mOptions;

    /// Per-run collaborators; rebuilt by run() so no state leaks across runs.
    struct RunContext {
        RequestPacer      pacer;
        Paginator         paginator;
        ReferenceCache    cache;
        ReferenceResolver resolver;

        RunContext(RemoteSource& source, const SyncOptions& options);
    };

    // Each stage fills @p report as it goes and throws on failure.
    void syncNomenclatureTypes(RunContext& ctx, StageReport& report);
    void syncNomenclature(RunContext& ctx, StageReport& report);
    void syncClients(RunContext& ctx, StageReport& report);
    void syncPurchases(RunContext& ctx, const SyncWindow& window, StageReport& report);
    void syncSales(RunContext& ctx, const SyncWindow& window, StageReport& report);

    FetchResult fetchOrThrow(RunContext& ctx,
                             const std::string& entity,
                             const std::optional<std::string>& filter,
                             int batchSize,
                             StageReport& report);

    std::optional<std::string> documentFilter(const SyncWindow& window) const;
};

/// Validate a window: both ends YYYY-MM-DD and dateFrom <= dateTo.
/// @throws std::invalid_argument otherwise.
void validateWindow(const SyncWindow& window);

} // namespace erp_sync
