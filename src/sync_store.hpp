#pragma once

#include "models.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct sqlite3;

namespace erp_sync {

/// Relational store the reporting layer reads from. Every replace runs as a
/// single transaction: either the new rows are all visible or the previous
/// contents are untouched.
class SyncStore {
public:
    /// Open (or create) the database at @p path; ":memory:" for a private
    /// in-memory store. Creates missing tables.
    /// @throws std::runtime_error if the database cannot be opened.
    explicit SyncStore(const std::string& path);
    ~SyncStore();

    SyncStore(const SyncStore&) = delete;
    SyncStore& operator=(const SyncStore&) = delete;

    // ---- catalogs: delete all, upsert all; returns rows now in the table ----
    std::size_t replaceAll(const std::vector<NomenclatureType>& types);
    std::size_t replaceAll(const std::vector<NomenclatureItem>& items);
    std::size_t replaceAll(const std::vector<Client>& clients);

    // ---- documents: delete rows dated inside the window, insert ----
    std::size_t replaceWindow(const SyncWindow& window,
                              const std::vector<PurchaseRecord>& rows);
    std::size_t replaceWindow(const SyncWindow& window,
                              const std::vector<SalesRecord>& rows);

    // ---- read side ----
    std::vector<NomenclatureType> loadNomenclatureTypes() const;
    std::vector<NomenclatureItem> loadNomenclature() const;
    std::vector<Client>           loadClients() const;
    std::vector<PurchaseRecord>   loadPurchases(const SyncWindow& window) const;
    std::vector<SalesRecord>      loadSales(const SyncWindow& window) const;
    std::size_t                   countRows(const std::string& table) const;

private:
    sqlite3*    mDb = nullptr;
    std::string mPath;

    void exec(const std::string& sql) const;
    void createTables();
};

} // namespace erp_sync
