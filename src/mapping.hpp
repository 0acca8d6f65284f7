#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace erp_sync {

/// Numeric field as double. Numbers are taken as-is, numeric strings are
/// parsed, anything else (missing, null, garbage) is 0.
double readNumber(const nlohmann::json& node, const std::string& field);

/// String field, or "" when missing or not a string.
std::string readString(const nlohmann::json& node, const std::string& field);

/// Reference field, or nullopt when missing, empty or the sentinel UUID.
std::optional<std::string> readKey(const nlohmann::json& node, const std::string& field);

/// The "value" array of an OData collection response.
/// Returns nullopt if the body does not have that shape.
std::optional<std::vector<nlohmann::json>> extractPageValues(const nlohmann::json& body);

// Catalog entries; nullopt when the entry must not be stored.
std::optional<NomenclatureType> parseNomenclatureType(const nlohmann::json& node);
std::optional<NomenclatureItem> parseNomenclatureItem(const nlohmann::json& node);
std::optional<Client>           parseClient(const nlohmann::json& node);

/// Map a document header plus the line table named @p linesField.
RawDocument parseDocument(const nlohmann::json& node, const std::string& linesField);

/// Number, date and key of a document, for diagnostics.
DocumentSummary summarizeDocument(const nlohmann::json& node);

} // namespace erp_sync
