#include "document_flattener.hpp"
#include "entities.hpp"
#include "util.hpp"

namespace erp_sync {

namespace {

std::optional<std::string> keyOrNull(const std::string& key) {
    if (isEmptyKey(key)) return std::nullopt;
    return key;
}

/// Sales documents name the buyer by partner, older ones by contractor.
std::string buyerKey(const RawDocument& doc) {
    return isEmptyKey(doc.partnerKey) ? doc.contractorKey : doc.partnerKey;
}

/// Header fields shared by every line of a sales document.
SalesRecord salesHeader(const RawDocument& doc,
                        SaleKind kind,
                        ReferenceResolver& resolver) {
    SalesRecord r;
    r.kind       = kind;
    r.date       = doc.date;
    r.number     = doc.number;
    r.documentId = doc.id;

    const std::string client = buyerKey(doc);
    r.clientId   = keyOrNull(client);
    r.clientName = resolver.resolveAny({entities::kPartners, entities::kContractors}, client);

    r.consigneeId   = keyOrNull(doc.consigneeKey);
    r.consigneeName = resolver.resolve(entities::kPartners, doc.consigneeKey);
    return r;
}

} // namespace

std::vector<PurchaseRecord> flattenPurchase(const RawDocument& doc,
                                            ReferenceResolver& resolver)
{
    std::vector<PurchaseRecord> records;
    const auto contractorName = resolver.resolve(entities::kContractors, doc.contractorKey);

    for (const auto& line : doc.lines) {
        if (isEmptyKey(line.nomenclatureKey) || line.quantity <= 0.0) continue;

        const double total = line.sumWithVat != 0.0 ? line.sumWithVat : line.sumWithoutVat;
        double price = line.price;
        if (price == 0.0 && total != 0.0) {
            price = total / line.quantity;
        }

        PurchaseRecord r;
        r.date             = doc.date;
        r.number           = doc.number;
        r.contractorId     = keyOrNull(doc.contractorKey);
        r.contractorName   = contractorName;
        r.nomenclatureId   = line.nomenclatureKey;
        r.nomenclatureName = resolver.resolve(entities::kNomenclature, line.nomenclatureKey);
        r.quantity         = roundTo(line.quantity, 3);
        r.price            = roundTo(price, 2);
        r.sumTotal         = roundTo(total, 2);
        records.push_back(std::move(r));
    }
    return records;
}

std::vector<SalesRecord> flattenSale(const RawDocument& doc,
                                     ReferenceResolver& resolver)
{
    std::vector<SalesRecord> records;
    const SalesRecord header = salesHeader(doc, SaleKind::Sale, resolver);

    for (const auto& line : doc.lines) {
        if (isEmptyKey(line.nomenclatureKey) || line.quantity == 0.0) continue;

        SalesRecord r = header;
        r.nomenclatureId   = line.nomenclatureKey;
        r.nomenclatureName = resolver.resolve(entities::kNomenclature, line.nomenclatureKey);
        r.quantity         = line.quantity;
        r.price            = line.price;
        r.sumWithoutVat    = line.sumWithoutVat;
        r.sumWithVat       = line.sumWithVat;
        r.pallets          = doc.pallets;
        r.logisticsFact    = doc.logisticsFact;
        r.logisticsPlan    = doc.logisticsPlan;
        records.push_back(std::move(r));
    }
    return records;
}

std::vector<SalesRecord> flattenCorrection(const RawDocument& doc,
                                           ReferenceResolver& resolver)
{
    std::vector<SalesRecord> records;
    const SalesRecord header = salesHeader(doc, SaleKind::Correction, resolver);

    for (const auto& line : doc.lines) {
        if (isEmptyKey(line.nomenclatureKey)) continue;

        SalesRecord r = header;
        r.nomenclatureId   = line.nomenclatureKey;
        r.nomenclatureName = resolver.resolve(entities::kNomenclature, line.nomenclatureKey);
        r.quantity         = line.quantity;
        r.price            = line.quantity != 0.0
                                 ? roundTo(line.sumWithVat / line.quantity, 2) : 0.0;
        r.sumWithoutVat    = line.sumWithoutVat;
        r.sumWithVat       = line.sumWithVat;
        records.push_back(std::move(r));
    }
    return records;
}

} // namespace erp_sync
