#pragma once

#include "models.hpp"
#include "reference_resolver.hpp"

#include <vector>

namespace erp_sync {

// One record per usable line item. Names that cannot be resolved are left
// empty; none of these throw on missing or malformed fields.

/// Purchase document: price derived from total / quantity when absent,
/// lines with non-positive quantity dropped.
std::vector<PurchaseRecord> flattenPurchase(const RawDocument& doc,
                                            ReferenceResolver& resolver);

/// Primary sales document: values read from the line, pallets and
/// logistics replicated from the header, zero-quantity lines dropped.
std::vector<SalesRecord> flattenSale(const RawDocument& doc,
                                     ReferenceResolver& resolver);

/// Sales correction: lines carry deltas, so price is always total / quantity
/// and pallets/logistics are zero.
std::vector<SalesRecord> flattenCorrection(const RawDocument& doc,
                                           ReferenceResolver& resolver);

} // namespace erp_sync
