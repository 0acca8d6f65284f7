#include "odata_client.hpp"
#include "sync_orchestrator.hpp"
#include "sync_store.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

struct Config {
    std::string baseUrl       = "http://localhost:81/base/odata/standard.odata";
    std::string user;
    std::string password;
    std::string dbPath        = "erp_sync.db";
    std::string dateFrom;
    std::string dateTo;
    int         days          = 365;
    erp_sync::SyncOptions options;
};

static void printUsage() {
    std::cout
        << "Usage: erp_sync [options]\n\n"
        << "Options:\n"
        << "  --base-url URL            OData service root\n"
        << "  --user NAME               ERP user (default: $ERP_SYNC_USER)\n"
        << "  --password PASS           ERP password (default: $ERP_SYNC_PASSWORD)\n"
        << "  --db PATH                 SQLite database file  (default: erp_sync.db)\n"
        << "  --date-from YYYY-MM-DD    Window start          (default: date-to - days)\n"
        << "  --date-to YYYY-MM-DD      Window end            (default: today)\n"
        << "  --days N                  Window length in days (default: 365)\n"
        << "  --batch-size N            Purchase page size    (default: 500)\n"
        << "  --sales-batch-size N      Sales page size       (default: 100)\n"
        << "  --catalog-batch-size N    Catalog page size     (default: 1000)\n"
        << "  --page-timeout-ms N       Page request timeout  (default: 120000)\n"
        << "  --lookup-timeout-ms N     Lookup timeout        (default: 30000)\n"
        << "  --delay-ms N              Pause between pages   (default: 300)\n"
        << "  --server-date-filter      Also filter documents by date on the server\n"
        << "  --verbose                 Enable verbose diagnostics\n"
        << "  --help, -h                Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    if (const char* user = std::getenv("ERP_SYNC_USER")) {
        cfg.user = user;
    }
    if (const char* password = std::getenv("ERP_SYNC_PASSWORD")) {
        cfg.password = password;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--base-url" && i + 1 < argc) {
            cfg.baseUrl = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            cfg.user = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            cfg.password = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            cfg.dbPath = argv[++i];
        } else if (arg == "--date-from" && i + 1 < argc) {
            cfg.dateFrom = argv[++i];
        } else if (arg == "--date-to" && i + 1 < argc) {
            cfg.dateTo = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            cfg.days = std::stoi(argv[++i]);
        } else if (arg == "--batch-size" && i + 1 < argc) {
            cfg.options.documentBatchSize = std::stoi(argv[++i]);
        } else if (arg == "--sales-batch-size" && i + 1 < argc) {
            cfg.options.salesBatchSize = std::stoi(argv[++i]);
        } else if (arg == "--catalog-batch-size" && i + 1 < argc) {
            cfg.options.catalogBatchSize = std::stoi(argv[++i]);
        } else if (arg == "--page-timeout-ms" && i + 1 < argc) {
            cfg.options.pageTimeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--lookup-timeout-ms" && i + 1 < argc) {
            cfg.options.lookupTimeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--delay-ms" && i + 1 < argc) {
            cfg.options.pageDelayMs = std::stoi(argv[++i]);
        } else if (arg == "--server-date-filter") {
            cfg.options.serverDateFilter = true;
        } else if (arg == "--verbose") {
            cfg.options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    // Window defaults: [today - days, today].
    const auto now = std::chrono::system_clock::now();
    if (cfg.dateTo.empty()) {
        cfg.dateTo = erp_sync::formatDate(now);
    }
    if (cfg.dateFrom.empty()) {
        cfg.dateFrom = erp_sync::formatDate(now - std::chrono::hours(24) * cfg.days);
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);
        const erp_sync::SyncWindow window{cfg.dateFrom, cfg.dateTo};

        std::cout
            << "=== erp_sync ===\n"
            << "ERP:        " << cfg.baseUrl << "\n"
            << "User:       " << (cfg.user.empty() ? "(none)" : cfg.user) << "\n"
            << "Database:   " << cfg.dbPath << "\n"
            << "Window:     " << window.dateFrom << " .. " << window.dateTo << "\n"
            << "Verbose:    " << (cfg.options.verbose ? "yes" : "no") << "\n"
            << "================\n\n";

        erp_sync::ODataClient client(cfg.baseUrl, cfg.user, cfg.password);
        client.setVerbose(cfg.options.verbose);
        erp_sync::SyncStore store(cfg.dbPath);
        erp_sync::SyncOrchestrator orchestrator(client, store, cfg.options);

        const auto report = orchestrator.run(window);

        if (!report.connected) {
            std::cerr << "Fatal error: cannot connect to the ERP at "
                      << cfg.baseUrl << "\n";
            return 1;
        }

        std::size_t skipped = 0;
        std::cout << "\n=== Summary Report ===\n";
        for (const auto& stage : report.stages) {
            std::cout << std::left << std::setw(20) << erp_sync::stageName(stage.stage)
                      << (stage.ok ? "ok     " : "FAILED ")
                      << "fetched " << std::setw(8) << stage.fetched
                      << "saved " << std::setw(8) << stage.saved
                      << "skipped " << stage.problems.size() << "\n";
            if (!stage.ok) {
                std::cout << "    error: " << stage.error << "\n";
            }
            for (const auto& p : stage.problems) {
                std::cout << "    skipped position " << p.offset;
                if (p.before) std::cout << "  after No " << p.before->number
                                        << " of " << p.before->date;
                if (p.after)  std::cout << "  before No " << p.after->number
                                        << " of " << p.after->date;
                std::cout << "\n";
            }
            skipped += stage.problems.size();
        }
        std::cout << "Skipped records:     " << skipped << "\n"
                  << "======================\n";

        return report.succeeded() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
