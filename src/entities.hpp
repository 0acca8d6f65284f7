#pragma once

#include <string>

namespace erp_sync {
namespace entities {

// Remote collections.
inline const std::string kNomenclatureTypes = "Catalog_ВидыНоменклатуры";
inline const std::string kNomenclature      = "Catalog_Номенклатура";
inline const std::string kPartners          = "Catalog_Партнеры";
inline const std::string kContractors       = "Catalog_Контрагенты";
inline const std::string kPurchases         = "Document_ПриобретениеТоваровУслуг";
inline const std::string kSales             = "Document_РеализацияТоваровУслуг";
inline const std::string kSaleCorrections   = "Document_КорректировкаРеализации";

/// Only posted documents are synced.
inline const std::string kPostedFilter = "Posted eq true";

// Line-item tables inside a document.
inline const std::string kGoodsLines       = "Товары";
inline const std::string kDiscrepancyLines = "Расхождения";

// Values of sales.doc_type read by the reporting layer.
inline const std::string kDocTypeSale       = "Реализация";
inline const std::string kDocTypeCorrection = "Корректировка";

} // namespace entities
} // namespace erp_sync
