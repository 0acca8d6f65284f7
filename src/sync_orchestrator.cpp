#include "sync_orchestrator.hpp"
#include "catalog_tree.hpp"
#include "document_flattener.hpp"
#include "entities.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace erp_sync {

namespace {

void printBanner(Stage stage) {
    std::cerr << "\n[Sync] [" << stageName(stage) << "]\n";
}

template <typename Entry>
void rejectCycles(const std::vector<Entry>& entries, const std::string& entity) {
    const auto cyclic = findParentCycles(entries);
    if (!cyclic.empty()) {
        throw std::runtime_error("Parent cycle in " + entity + " (" +
                                 std::to_string(cyclic.size()) +
                                 " entries, e.g. " + cyclic.front() + ")");
    }
}

} // namespace

const char* stageName(Stage stage) {
    switch (stage) {
    case Stage::Types:        return "nomenclature types";
    case Stage::Nomenclature: return "nomenclature";
    case Stage::Clients:      return "clients";
    case Stage::Purchases:    return "purchases";
    case Stage::Sales:        return "sales";
    }
    return "unknown";
}

void validateWindow(const SyncWindow& window) {
    if (!isIsoDate(window.dateFrom) || !isIsoDate(window.dateTo)) {
        throw std::invalid_argument("Sync window dates must be YYYY-MM-DD: " +
                                    window.dateFrom + " .. " + window.dateTo);
    }
    if (window.dateFrom > window.dateTo) {
        throw std::invalid_argument("Sync window is empty: " +
                                    window.dateFrom + " > " + window.dateTo);
    }
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SyncOrchestrator::RunContext::RunContext(RemoteSource& source, const SyncOptions& options)
    : pacer(std::chrono::milliseconds(options.pageDelayMs),
            std::chrono::milliseconds(options.failureDelayMs))
    , paginator(source, pacer, options.pageTimeoutMs, options.verbose)
    , cache()
    , resolver(source, cache, options.lookupTimeoutMs, options.verbose)
{
    paginator.setMaxDeadBatches(options.maxDeadBatches);
}

SyncOrchestrator::SyncOrchestrator(RemoteSource& source,
                                   SyncStore& store,
                                   SyncOptions options)
    : mSource(source)
    , mStore(store)
    , mOptions(options) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SyncOrchestrator::checkConnection() {
    try {
        const auto resp = mSource.get(percentEncode(entities::kContractors, "_"),
                                      {{"$top", "1"}, {"$format", "json"}},
                                      mOptions.lookupTimeoutMs);
        if (resp.httpStatus != 200) {
            std::cerr << "[Sync] Connection check failed: HTTP "
                      << resp.httpStatus << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Sync] Connection check failed: " << e.what() << "\n";
        return false;
    }
}

SyncReport SyncOrchestrator::run(const SyncWindow& window) {
    validateWindow(window);

    SyncReport report;
    std::cerr << "[Sync] Checking connection to the ERP...\n";
    report.connected = checkConnection();
    if (!report.connected) {
        std::cerr << "[Sync] ERP unreachable; no stage was run.\n";
        return report;
    }

    std::cerr << "[Sync] Window: " << window.dateFrom << " .. " << window.dateTo << "\n";

    RunContext ctx(mSource, mOptions);

    const std::pair<Stage, std::function<void(StageReport&)>> stages[] = {
        {Stage::Types,        [&](StageReport& r) { syncNomenclatureTypes(ctx, r); }},
        {Stage::Nomenclature, [&](StageReport& r) { syncNomenclature(ctx, r); }},
        {Stage::Clients,      [&](StageReport& r) { syncClients(ctx, r); }},
        {Stage::Purchases,    [&](StageReport& r) { syncPurchases(ctx, window, r); }},
        {Stage::Sales,        [&](StageReport& r) { syncSales(ctx, window, r); }},
    };

    for (const auto& [stage, body] : stages) {
        StageReport stageReport;
        stageReport.stage = stage;
        printBanner(stage);

        try {
            body(stageReport);
            stageReport.ok = true;
        } catch (const std::exception& e) {
            stageReport.error = e.what();
        }

        report.stages.push_back(stageReport);
        if (!stageReport.ok) {
            std::cerr << "[Sync] Stage '" << stageName(stage) << "' failed: "
                      << stageReport.error << "; later stages skipped.\n";
            report.failedStage = stage;
            break;
        }
    }

    if (mOptions.verbose) {
        std::cerr << "[Sync] Reference lookups: " << ctx.resolver.lookupCount()
                  << " (" << ctx.resolver.failureCount() << " failed), cached names: "
                  << ctx.cache.size() << "\n";
    }
    return report;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

FetchResult SyncOrchestrator::fetchOrThrow(RunContext& ctx,
                                           const std::string& entity,
                                           const std::optional<std::string>& filter,
                                           int batchSize,
                                           StageReport& report)
{
    auto result = ctx.paginator.fetchAll(entity, filter, batchSize);
    report.fetched += static_cast<int>(result.records.size());
    report.problems.insert(report.problems.end(),
                           result.problems.begin(), result.problems.end());
    if (result.aborted) {
        throw std::runtime_error("ERP stopped answering while loading " + entity);
    }
    std::cerr << "[Sync]   Received " << result.records.size()
              << " records from " << entity << "\n";
    return result;
}

std::optional<std::string> SyncOrchestrator::documentFilter(const SyncWindow& window) const {
    std::string filter = entities::kPostedFilter;
    if (mOptions.serverDateFilter) {
        filter += " and Date ge datetime'" + window.dateFrom + "T00:00:00'"
                  " and Date le datetime'" + window.dateTo + "T23:59:59'";
    }
    return filter;
}

// ---------------------------------------------------------------------------
// Catalog stages
// ---------------------------------------------------------------------------

void SyncOrchestrator::syncNomenclatureTypes(RunContext& ctx, StageReport& report) {
    auto fetched = fetchOrThrow(ctx, entities::kNomenclatureTypes, std::nullopt,
                                mOptions.catalogBatchSize, report);
    if (fetched.records.empty()) {
        std::cerr << "[Sync]   Nothing received; table left unchanged.\n";
        return;
    }

    std::vector<NomenclatureType> types;
    for (const auto& node : fetched.records) {
        if (auto t = parseNomenclatureType(node)) {
            types.push_back(std::move(*t));
        }
    }
    rejectCycles(types, entities::kNomenclatureTypes);

    report.saved = static_cast<int>(mStore.replaceAll(types));
    std::cerr << "[Sync]   Saved " << report.saved << " nomenclature types\n";
}

void SyncOrchestrator::syncNomenclature(RunContext& ctx, StageReport& report) {
    auto fetched = fetchOrThrow(ctx, entities::kNomenclature, std::nullopt,
                                mOptions.catalogBatchSize, report);
    if (fetched.records.empty()) {
        std::cerr << "[Sync]   Nothing received; table left unchanged.\n";
        return;
    }

    std::vector<NomenclatureItem> items;
    for (const auto& node : fetched.records) {
        if (auto item = parseNomenclatureItem(node)) {
            items.push_back(std::move(*item));
        }
    }
    rejectCycles(items, entities::kNomenclature);

    report.saved = static_cast<int>(mStore.replaceAll(items));
    for (const auto& item : items) {
        if (!item.name.empty()) {
            ctx.cache.store(entities::kNomenclature, item.id, item.name);
        }
    }
    std::cerr << "[Sync]   Saved " << report.saved << " nomenclature items\n";
}

void SyncOrchestrator::syncClients(RunContext& ctx, StageReport& report) {
    auto fetched = fetchOrThrow(ctx, entities::kPartners, std::nullopt,
                                mOptions.catalogBatchSize, report);
    if (fetched.records.empty()) {
        std::cerr << "[Sync]   Nothing received; table left unchanged.\n";
        return;
    }

    std::vector<Client> clients;
    for (const auto& node : fetched.records) {
        if (auto c = parseClient(node)) {
            clients.push_back(std::move(*c));
        }
    }

    report.saved = static_cast<int>(mStore.replaceAll(clients));
    for (const auto& c : clients) {
        if (!c.name.empty()) {
            ctx.cache.store(entities::kPartners, c.id, c.name);
        }
    }
    std::cerr << "[Sync]   Saved " << report.saved << " clients\n";
}

// ---------------------------------------------------------------------------
// Document stages
// ---------------------------------------------------------------------------

void SyncOrchestrator::syncPurchases(RunContext& ctx,
                                     const SyncWindow& window,
                                     StageReport& report)
{
    auto fetched = fetchOrThrow(ctx, entities::kPurchases, documentFilter(window),
                                mOptions.documentBatchSize, report);

    std::vector<PurchaseRecord> rows;
    int inWindow = 0;
    for (const auto& node : fetched.records) {
        const RawDocument doc = parseDocument(node, entities::kGoodsLines);
        if (doc.date.empty() || !window.contains(doc.date)) continue;

        ++inWindow;
        auto docRows = flattenPurchase(doc, ctx.resolver);
        rows.insert(rows.end(), docRows.begin(), docRows.end());
    }
    std::cerr << "[Sync]   " << inWindow << " documents in window, "
              << rows.size() << " purchase rows\n";

    report.saved = static_cast<int>(mStore.replaceWindow(window, rows));
    std::cerr << "[Sync]   Saved " << report.saved << " purchase rows\n";
}

void SyncOrchestrator::syncSales(RunContext& ctx,
                                 const SyncWindow& window,
                                 StageReport& report)
{
    const auto filter = documentFilter(window);
    auto sales       = fetchOrThrow(ctx, entities::kSales, filter,
                                    mOptions.salesBatchSize, report);
    auto corrections = fetchOrThrow(ctx, entities::kSaleCorrections, filter,
                                    mOptions.salesBatchSize, report);

    std::vector<SalesRecord> rows;
    int saleDocs = 0;
    int correctionDocs = 0;

    for (const auto& node : sales.records) {
        const RawDocument doc = parseDocument(node, entities::kGoodsLines);
        if (doc.date.empty() || !window.contains(doc.date)) continue;

        ++saleDocs;
        auto docRows = flattenSale(doc, ctx.resolver);
        rows.insert(rows.end(), docRows.begin(), docRows.end());
    }
    for (const auto& node : corrections.records) {
        const RawDocument doc = parseDocument(node, entities::kDiscrepancyLines);
        if (doc.date.empty() || !window.contains(doc.date)) continue;

        ++correctionDocs;
        auto docRows = flattenCorrection(doc, ctx.resolver);
        rows.insert(rows.end(), docRows.begin(), docRows.end());
    }
    std::cerr << "[Sync]   " << saleDocs << " sales and " << correctionDocs
              << " corrections in window, " << rows.size() << " sales rows\n";

    report.saved = static_cast<int>(mStore.replaceWindow(window, rows));
    std::cerr << "[Sync]   Saved " << report.saved << " sales rows\n";
}

} // namespace erp_sync
