#pragma once

#include <optional>
#include <string>
#include <vector>

namespace erp_sync {

/// Reserved key meaning "no reference set".
inline const std::string kEmptyUuid = "00000000-0000-0000-0000-000000000000";

/// Inclusive [dateFrom, dateTo] window, dates in YYYY-MM-DD.
struct SyncWindow {
    std::string dateFrom;
    std::string dateTo;

    bool contains(const std::string& date) const {
        return date >= dateFrom && date <= dateTo;
    }
};

// ---------------------------------------------------------------------------
// Catalogs
// ---------------------------------------------------------------------------

struct NomenclatureType {
    std::string                id;
    std::optional<std::string> parentId;
    std::string                name;
    bool                       isFolder = false;
};

struct NomenclatureItem {
    std::string                id;
    std::optional<std::string> parentId;
    bool                       isFolder = false;
    std::string                code;
    std::string                name;
    std::string                fullName;
    std::string                article;
    std::optional<std::string> typeId;
    std::optional<std::string> unitId;
    std::optional<double>      weight;
};

struct Client {
    std::string id;
    std::string name;
    std::string inn;
};

// ---------------------------------------------------------------------------
// Documents as fetched
// ---------------------------------------------------------------------------

struct DocumentLine {
    std::string nomenclatureKey;
    double      quantity      = 0.0;
    double      price         = 0.0;
    double      sumWithoutVat = 0.0;
    double      sumWithVat    = 0.0;
};

struct RawDocument {
    std::string id;              // Ref_Key
    std::string date;            // YYYY-MM-DD, empty when unparsable
    std::string number;
    std::string partnerKey;
    std::string contractorKey;
    std::string consigneeKey;
    double      pallets          = 0.0;
    double      logisticsFact    = 0.0;
    double      logisticsPlan    = 0.0;
    std::vector<DocumentLine> lines;
};

// ---------------------------------------------------------------------------
// Flattened rows
// ---------------------------------------------------------------------------

struct PurchaseRecord {
    std::string                date;
    std::string                number;
    std::optional<std::string> contractorId;
    std::optional<std::string> contractorName;
    std::string                nomenclatureId;
    std::optional<std::string> nomenclatureName;
    double                     quantity = 0.0;
    double                     price    = 0.0;
    double                     sumTotal = 0.0;
};

enum class SaleKind { Sale, Correction };

struct SalesRecord {
    SaleKind                   kind = SaleKind::Sale;
    std::string                date;
    std::string                number;
    std::string                documentId;
    std::optional<std::string> clientId;
    std::optional<std::string> clientName;
    std::optional<std::string> consigneeId;
    std::optional<std::string> consigneeName;
    std::string                nomenclatureId;
    std::optional<std::string> nomenclatureName;
    double                     quantity      = 0.0;
    double                     price         = 0.0;
    double                     sumWithoutVat = 0.0;
    double                     sumWithVat    = 0.0;
    double                     pallets       = 0.0;
    double                     logisticsFact = 0.0;
    double                     logisticsPlan = 0.0;
};

// ---------------------------------------------------------------------------
// Pagination diagnostics
// ---------------------------------------------------------------------------

/// Identifiers of a document adjacent to a problem record.
struct DocumentSummary {
    std::string number;
    std::string date;
    std::string id;
};

/// An offset that could not be fetched even as a single-item page.
struct ProblemRecord {
    long long                      offset = 0;
    std::optional<DocumentSummary> before;
    std::optional<DocumentSummary> after;
};

} // namespace erp_sync
