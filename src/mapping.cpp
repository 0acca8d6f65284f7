#include "mapping.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace erp_sync {

namespace {

/// First ten characters of an OData datetime ("2024-03-01T10:15:00").
std::string readDate(const nlohmann::json& node) {
    const std::string raw = readString(node, "Date");
    if (raw.size() < 10) return "";
    const std::string date = raw.substr(0, 10);
    return isIsoDate(date) ? date : "";
}

bool readFlag(const nlohmann::json& node, const std::string& field) {
    auto it = node.find(field);
    return it != node.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

double readNumber(const nlohmann::json& node, const std::string& field) {
    if (!node.is_object()) return 0.0;
    auto it = node.find(field);
    if (it == node.end()) return 0.0;

    if (it->is_number()) {
        const double value = it->get<double>();
        return std::isfinite(value) ? value : 0.0;
    }
    if (it->is_string()) {
        const std::string text = trim(it->get<std::string>());
        if (text.empty()) return 0.0;
        try {
            std::size_t used = 0;
            double value = std::stod(text, &used);
            // stod also accepts "nan" and "inf"
            return used == text.size() && std::isfinite(value) ? value : 0.0;
        } catch (const std::logic_error&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::string readString(const nlohmann::json& node, const std::string& field) {
    if (!node.is_object()) return "";
    auto it = node.find(field);
    if (it == node.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::optional<std::string> readKey(const nlohmann::json& node, const std::string& field) {
    std::string key = readString(node, field);
    if (isEmptyKey(key)) return std::nullopt;
    return key;
}

std::optional<std::vector<nlohmann::json>> extractPageValues(const nlohmann::json& body) {
    if (!body.is_object()) return std::nullopt;
    auto it = body.find("value");
    if (it == body.end() || !it->is_array()) return std::nullopt;
    return it->get<std::vector<nlohmann::json>>();
}

// ---------------------------------------------------------------------------
// Catalogs
// ---------------------------------------------------------------------------

std::optional<NomenclatureType> parseNomenclatureType(const nlohmann::json& node) {
    auto id = readKey(node, "Ref_Key");
    if (!id) return std::nullopt;

    NomenclatureType t;
    t.id       = *id;
    t.parentId = readKey(node, "Parent_Key");
    t.name     = readString(node, "Description");
    t.isFolder = readFlag(node, "IsFolder");
    return t;
}

std::optional<NomenclatureItem> parseNomenclatureItem(const nlohmann::json& node) {
    auto id = readKey(node, "Ref_Key");
    if (!id) return std::nullopt;

    NomenclatureItem item;
    item.id       = *id;
    item.parentId = readKey(node, "Parent_Key");
    item.isFolder = readFlag(node, "IsFolder");
    item.code     = trim(readString(node, "Code"));
    item.name     = readString(node, "Description");
    item.fullName = readString(node, "НаименованиеПолное");
    item.article  = readString(node, "Артикул");
    item.typeId   = readKey(node, "ВидНоменклатуры_Key");
    item.unitId   = readKey(node, "ЕдиницаИзмерения_Key");

    const double numerator   = readNumber(node, "ВесЧислитель");
    const double denominator = readNumber(node, "ВесЗнаменатель");
    if (numerator != 0.0 && denominator > 0.0) {
        item.weight = numerator / denominator;
    }
    return item;
}

std::optional<Client> parseClient(const nlohmann::json& node) {
    auto id = readKey(node, "Ref_Key");
    if (!id || readFlag(node, "IsFolder")) return std::nullopt;

    Client c;
    c.id   = *id;
    c.name = readString(node, "Description");
    if (c.name.empty()) {
        c.name = readString(node, "НаименованиеПолное");
    }
    c.inn = readString(node, "ИНН");
    return c;
}

// ---------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------

RawDocument parseDocument(const nlohmann::json& node, const std::string& linesField) {
    RawDocument doc;
    doc.id            = readString(node, "Ref_Key");
    doc.date          = readDate(node);
    doc.number        = trim(readString(node, "Number"));
    doc.partnerKey    = readString(node, "Партнер_Key");
    doc.contractorKey = readString(node, "Контрагент_Key");
    doc.consigneeKey  = readString(node, "Грузополучатель_Key");
    doc.pallets       = readNumber(node, "АгросервисИТ_КоличествоПаллетов");
    doc.logisticsFact = readNumber(node, "АгросервисИТ_ФактическаяСтоимостьТраспортныхРасходов");
    doc.logisticsPlan = readNumber(node, "АгросервисИТ_ПлановаяСтоимостьТраспортныхРасходов");

    auto it = node.find(linesField);
    if (it == node.end() || !it->is_array()) {
        return doc;
    }
    for (const auto& line : *it) {
        DocumentLine l;
        l.nomenclatureKey = readString(line, "Номенклатура_Key");
        l.quantity        = readNumber(line, "Количество");
        l.price           = readNumber(line, "Цена");
        l.sumWithoutVat   = readNumber(line, "Сумма");
        l.sumWithVat      = readNumber(line, "СуммаСНДС");
        doc.lines.push_back(std::move(l));
    }
    return doc;
}

DocumentSummary summarizeDocument(const nlohmann::json& node) {
    DocumentSummary s;
    s.number = trim(readString(node, "Number"));
    const std::string date = readString(node, "Date");
    s.date   = date.substr(0, std::min<std::size_t>(10, date.size()));
    s.id     = readString(node, "Ref_Key");
    if (s.number.empty()) s.number = "?";
    if (s.date.empty())   s.date   = "?";
    if (s.id.empty())     s.id     = "?";
    return s;
}

} // namespace erp_sync
