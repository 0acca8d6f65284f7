#include "sync_store.hpp"
#include "entities.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <iostream>
#include <set>
#include <stdexcept>

namespace erp_sync {

// =============================================================================
// Helpers
// =============================================================================

namespace {

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : mStmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &mStmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (mStmt) {
            sqlite3_finalize(mStmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        check(sqlite3_bind_text(mStmt, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bindText(int index, const std::optional<std::string>& value) {
        if (value) bindText(index, *value);
        else       bindNull(index);
    }

    void bindDouble(int index, double value) {
        check(sqlite3_bind_double(mStmt, index, value));
    }

    void bindDouble(int index, const std::optional<double>& value) {
        if (value) bindDouble(index, *value);
        else       bindNull(index);
    }

    void bindInt64(int index, int64_t value) {
        check(sqlite3_bind_int64(mStmt, index, value));
    }

    void bindNull(int index) {
        check(sqlite3_bind_null(mStmt, index));
    }

    bool step() {
        int result = sqlite3_step(mStmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(mStmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(mStmt, col));
        return text ? text : "";
    }

    std::optional<std::string> getOptionalText(int col) {
        if (isNull(col)) return std::nullopt;
        return getText(col);
    }

    double getDouble(int col) {
        return sqlite3_column_double(mStmt, col);
    }

    std::optional<double> getOptionalDouble(int col) {
        if (isNull(col)) return std::nullopt;
        return getDouble(col);
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(mStmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(mStmt, col) == SQLITE_NULL;
    }

    void reset() {
        sqlite3_reset(mStmt);
        sqlite3_clear_bindings(mStmt);
    }

private:
    sqlite3_stmt* mStmt;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Bind failed: " +
                                     std::string(sqlite3_errmsg(sqlite3_db_handle(mStmt))));
        }
    }
};

/**
 * Rolls back on scope exit unless commit() was reached
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : mDb(db) {
        run("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (mOpen) {
            char* errMsg = nullptr;
            if (sqlite3_exec(mDb, "ROLLBACK", nullptr, nullptr, &errMsg) != SQLITE_OK) {
                std::cerr << "[Store] Rollback failed: "
                          << (errMsg ? errMsg : "unknown error") << "\n";
            }
            sqlite3_free(errMsg);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        run("COMMIT");
        mOpen = false;
    }

private:
    sqlite3* mDb;
    bool     mOpen = true;

    void run(const char* sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(mDb, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error(std::string(sql) + " failed: " + error);
        }
    }
};

template <typename Row, typename Binder>
void insertRows(sqlite3* db, const std::string& sql,
                const std::vector<Row>& rows, Binder bind) {
    Statement stmt(db, sql);
    for (const auto& row : rows) {
        bind(stmt, row);
        stmt.step();
        stmt.reset();
    }
}

void deleteWindow(sqlite3* db, const std::string& table, const SyncWindow& window) {
    Statement stmt(db, "DELETE FROM " + table + " WHERE doc_date BETWEEN ?1 AND ?2");
    stmt.bindText(1, window.dateFrom);
    stmt.bindText(2, window.dateTo);
    stmt.step();
}

const std::string& docTypeTag(SaleKind kind) {
    return kind == SaleKind::Correction ? entities::kDocTypeCorrection
                                        : entities::kDocTypeSale;
}

const std::set<std::string> kTables = {
    "nomenclature_types", "nomenclature", "clients", "purchase_prices", "sales",
};

} // anonymous namespace

// =============================================================================
// Lifetime
// =============================================================================

SyncStore::SyncStore(const std::string& path) : mPath(path) {
    if (sqlite3_open(path.c_str(), &mDb) != SQLITE_OK) {
        std::string error = mDb ? sqlite3_errmsg(mDb) : "Out of memory";
        sqlite3_close(mDb);
        mDb = nullptr;
        throw std::runtime_error("Failed to open database " + path + ": " + error);
    }

    try {
        createTables();
    } catch (...) {
        sqlite3_close(mDb);
        mDb = nullptr;
        throw;
    }
}

SyncStore::~SyncStore() {
    if (mDb) {
        sqlite3_close(mDb);
    }
}

void SyncStore::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    if (sqlite3_exec(mDb, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL error: " + error);
    }
}

void SyncStore::createTables() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS nomenclature_types (
            id TEXT PRIMARY KEY CHECK (id <> ''),
            parent_id TEXT,
            name TEXT NOT NULL,
            is_folder INTEGER NOT NULL DEFAULT 0
        )
    )");

    exec(R"(
        CREATE TABLE IF NOT EXISTS nomenclature (
            id TEXT PRIMARY KEY CHECK (id <> ''),
            parent_id TEXT,
            is_folder INTEGER NOT NULL DEFAULT 0,
            code TEXT,
            name TEXT NOT NULL,
            full_name TEXT,
            article TEXT,
            type_id TEXT,
            unit_id TEXT,
            weight REAL
        )
    )");

    exec(R"(
        CREATE TABLE IF NOT EXISTS clients (
            id TEXT PRIMARY KEY CHECK (id <> ''),
            name TEXT NOT NULL,
            inn TEXT
        )
    )");

    exec(R"(
        CREATE TABLE IF NOT EXISTS purchase_prices (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            doc_date TEXT NOT NULL CHECK (length(doc_date) = 10),
            doc_number TEXT,
            contractor_id TEXT,
            contractor_name TEXT,
            nomenclature_id TEXT NOT NULL,
            nomenclature_name TEXT,
            quantity REAL NOT NULL,
            price REAL NOT NULL,
            sum_total REAL NOT NULL
        )
    )");

    exec(R"(
        CREATE TABLE IF NOT EXISTS sales (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            doc_type TEXT NOT NULL,
            doc_date TEXT NOT NULL CHECK (length(doc_date) = 10),
            doc_number TEXT,
            doc_id TEXT,
            client_id TEXT,
            client_name TEXT,
            consignee_id TEXT,
            consignee_name TEXT,
            nomenclature_id TEXT NOT NULL,
            nomenclature_name TEXT,
            quantity REAL NOT NULL,
            price REAL NOT NULL,
            sum_without_vat REAL NOT NULL,
            sum_with_vat REAL NOT NULL,
            pallets_count REAL NOT NULL DEFAULT 0,
            logistics_cost_fact REAL NOT NULL DEFAULT 0,
            logistics_cost_plan REAL NOT NULL DEFAULT 0
        )
    )");

    exec("CREATE INDEX IF NOT EXISTS idx_purchase_prices_date ON purchase_prices(doc_date)");
    exec("CREATE INDEX IF NOT EXISTS idx_sales_date ON sales(doc_date)");
    exec("CREATE INDEX IF NOT EXISTS idx_sales_type ON sales(doc_type, doc_date)");
}

// =============================================================================
// Catalogs
// =============================================================================

// Offset paging over a live catalog can hand back the same entry twice, so the
// catalog inserts are upserts: a repeated id overwrites the earlier row.

std::size_t SyncStore::replaceAll(const std::vector<NomenclatureType>& types) {
    Transaction tx(mDb);
    exec("DELETE FROM nomenclature_types");
    insertRows(mDb,
        "INSERT INTO nomenclature_types (id, parent_id, name, is_folder) "
        "VALUES (?1, ?2, ?3, ?4) "
        "ON CONFLICT(id) DO UPDATE SET parent_id = excluded.parent_id, "
        "name = excluded.name, is_folder = excluded.is_folder",
        types, [](Statement& s, const NomenclatureType& t) {
            s.bindText(1, t.id);
            s.bindText(2, t.parentId);
            s.bindText(3, t.name);
            s.bindInt64(4, t.isFolder ? 1 : 0);
        });
    tx.commit();
    return countRows("nomenclature_types");
}

std::size_t SyncStore::replaceAll(const std::vector<NomenclatureItem>& items) {
    Transaction tx(mDb);
    exec("DELETE FROM nomenclature");
    insertRows(mDb,
        "INSERT INTO nomenclature (id, parent_id, is_folder, code, name, full_name, "
        "article, type_id, unit_id, weight) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10) "
        "ON CONFLICT(id) DO UPDATE SET parent_id = excluded.parent_id, "
        "is_folder = excluded.is_folder, code = excluded.code, name = excluded.name, "
        "full_name = excluded.full_name, article = excluded.article, "
        "type_id = excluded.type_id, unit_id = excluded.unit_id, weight = excluded.weight",
        items, [](Statement& s, const NomenclatureItem& n) {
            s.bindText(1, n.id);
            s.bindText(2, n.parentId);
            s.bindInt64(3, n.isFolder ? 1 : 0);
            s.bindText(4, n.code);
            s.bindText(5, n.name);
            s.bindText(6, n.fullName);
            s.bindText(7, n.article);
            s.bindText(8, n.typeId);
            s.bindText(9, n.unitId);
            s.bindDouble(10, n.weight);
        });
    tx.commit();
    return countRows("nomenclature");
}

std::size_t SyncStore::replaceAll(const std::vector<Client>& clients) {
    Transaction tx(mDb);
    exec("DELETE FROM clients");
    insertRows(mDb,
        "INSERT INTO clients (id, name, inn) VALUES (?1, ?2, ?3) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name, inn = excluded.inn",
        clients, [](Statement& s, const Client& c) {
            s.bindText(1, c.id);
            s.bindText(2, c.name);
            s.bindText(3, c.inn);
        });
    tx.commit();
    return countRows("clients");
}

// =============================================================================
// Documents
// =============================================================================

std::size_t SyncStore::replaceWindow(const SyncWindow& window,
                                     const std::vector<PurchaseRecord>& rows) {
    Transaction tx(mDb);
    deleteWindow(mDb, "purchase_prices", window);
    insertRows(mDb,
        "INSERT INTO purchase_prices (doc_date, doc_number, contractor_id, "
        "contractor_name, nomenclature_id, nomenclature_name, quantity, price, sum_total) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)",
        rows, [](Statement& s, const PurchaseRecord& r) {
            s.bindText(1, r.date);
            s.bindText(2, r.number);
            s.bindText(3, r.contractorId);
            s.bindText(4, r.contractorName);
            s.bindText(5, r.nomenclatureId);
            s.bindText(6, r.nomenclatureName);
            s.bindDouble(7, r.quantity);
            s.bindDouble(8, r.price);
            s.bindDouble(9, r.sumTotal);
        });
    tx.commit();
    return rows.size();
}

std::size_t SyncStore::replaceWindow(const SyncWindow& window,
                                     const std::vector<SalesRecord>& rows) {
    Transaction tx(mDb);
    deleteWindow(mDb, "sales", window);
    insertRows(mDb,
        "INSERT INTO sales (doc_type, doc_date, doc_number, doc_id, client_id, "
        "client_name, consignee_id, consignee_name, nomenclature_id, nomenclature_name, "
        "quantity, price, sum_without_vat, sum_with_vat, pallets_count, "
        "logistics_cost_fact, logistics_cost_plan) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17)",
        rows, [](Statement& s, const SalesRecord& r) {
            s.bindText(1, docTypeTag(r.kind));
            s.bindText(2, r.date);
            s.bindText(3, r.number);
            s.bindText(4, r.documentId);
            s.bindText(5, r.clientId);
            s.bindText(6, r.clientName);
            s.bindText(7, r.consigneeId);
            s.bindText(8, r.consigneeName);
            s.bindText(9, r.nomenclatureId);
            s.bindText(10, r.nomenclatureName);
            s.bindDouble(11, r.quantity);
            s.bindDouble(12, r.price);
            s.bindDouble(13, r.sumWithoutVat);
            s.bindDouble(14, r.sumWithVat);
            s.bindDouble(15, r.pallets);
            s.bindDouble(16, r.logisticsFact);
            s.bindDouble(17, r.logisticsPlan);
        });
    tx.commit();
    return rows.size();
}

// =============================================================================
// Read side
// =============================================================================

std::vector<NomenclatureType> SyncStore::loadNomenclatureTypes() const {
    Statement stmt(mDb, "SELECT id, parent_id, name, is_folder "
                        "FROM nomenclature_types ORDER BY id");
    std::vector<NomenclatureType> result;
    while (stmt.step()) {
        NomenclatureType t;
        t.id       = stmt.getText(0);
        t.parentId = stmt.getOptionalText(1);
        t.name     = stmt.getText(2);
        t.isFolder = stmt.getInt64(3) != 0;
        result.push_back(std::move(t));
    }
    return result;
}

std::vector<NomenclatureItem> SyncStore::loadNomenclature() const {
    Statement stmt(mDb, "SELECT id, parent_id, is_folder, code, name, full_name, "
                        "article, type_id, unit_id, weight FROM nomenclature ORDER BY id");
    std::vector<NomenclatureItem> result;
    while (stmt.step()) {
        NomenclatureItem n;
        n.id       = stmt.getText(0);
        n.parentId = stmt.getOptionalText(1);
        n.isFolder = stmt.getInt64(2) != 0;
        n.code     = stmt.getText(3);
        n.name     = stmt.getText(4);
        n.fullName = stmt.getText(5);
        n.article  = stmt.getText(6);
        n.typeId   = stmt.getOptionalText(7);
        n.unitId   = stmt.getOptionalText(8);
        n.weight   = stmt.getOptionalDouble(9);
        result.push_back(std::move(n));
    }
    return result;
}

std::vector<Client> SyncStore::loadClients() const {
    Statement stmt(mDb, "SELECT id, name, inn FROM clients ORDER BY id");
    std::vector<Client> result;
    while (stmt.step()) {
        result.push_back({stmt.getText(0), stmt.getText(1), stmt.getText(2)});
    }
    return result;
}

std::vector<PurchaseRecord> SyncStore::loadPurchases(const SyncWindow& window) const {
    Statement stmt(mDb, "SELECT doc_date, doc_number, contractor_id, contractor_name, "
                        "nomenclature_id, nomenclature_name, quantity, price, sum_total "
                        "FROM purchase_prices WHERE doc_date BETWEEN ?1 AND ?2 "
                        "ORDER BY doc_date, doc_number, id");
    stmt.bindText(1, window.dateFrom);
    stmt.bindText(2, window.dateTo);

    std::vector<PurchaseRecord> result;
    while (stmt.step()) {
        PurchaseRecord r;
        r.date             = stmt.getText(0);
        r.number           = stmt.getText(1);
        r.contractorId     = stmt.getOptionalText(2);
        r.contractorName   = stmt.getOptionalText(3);
        r.nomenclatureId   = stmt.getText(4);
        r.nomenclatureName = stmt.getOptionalText(5);
        r.quantity         = stmt.getDouble(6);
        r.price            = stmt.getDouble(7);
        r.sumTotal         = stmt.getDouble(8);
        result.push_back(std::move(r));
    }
    return result;
}

std::vector<SalesRecord> SyncStore::loadSales(const SyncWindow& window) const {
    Statement stmt(mDb, "SELECT doc_type, doc_date, doc_number, doc_id, client_id, "
                        "client_name, consignee_id, consignee_name, nomenclature_id, "
                        "nomenclature_name, quantity, price, sum_without_vat, sum_with_vat, "
                        "pallets_count, logistics_cost_fact, logistics_cost_plan "
                        "FROM sales WHERE doc_date BETWEEN ?1 AND ?2 "
                        "ORDER BY doc_date, doc_number, id");
    stmt.bindText(1, window.dateFrom);
    stmt.bindText(2, window.dateTo);

    std::vector<SalesRecord> result;
    while (stmt.step()) {
        SalesRecord r;
        r.kind             = stmt.getText(0) == entities::kDocTypeCorrection
                                 ? SaleKind::Correction : SaleKind::Sale;
        r.date             = stmt.getText(1);
        r.number           = stmt.getText(2);
        r.documentId       = stmt.getText(3);
        r.clientId         = stmt.getOptionalText(4);
        r.clientName       = stmt.getOptionalText(5);
        r.consigneeId      = stmt.getOptionalText(6);
        r.consigneeName    = stmt.getOptionalText(7);
        r.nomenclatureId   = stmt.getText(8);
        r.nomenclatureName = stmt.getOptionalText(9);
        r.quantity         = stmt.getDouble(10);
        r.price            = stmt.getDouble(11);
        r.sumWithoutVat    = stmt.getDouble(12);
        r.sumWithVat       = stmt.getDouble(13);
        r.pallets          = stmt.getDouble(14);
        r.logisticsFact    = stmt.getDouble(15);
        r.logisticsPlan    = stmt.getDouble(16);
        result.push_back(std::move(r));
    }
    return result;
}

std::size_t SyncStore::countRows(const std::string& table) const {
    if (kTables.count(table) == 0) {
        throw std::invalid_argument("Unknown table: " + table);
    }
    Statement stmt(mDb, "SELECT COUNT(*) FROM " + table);
    stmt.step();
    return static_cast<std::size_t>(stmt.getInt64(0));
}

} // namespace erp_sync
