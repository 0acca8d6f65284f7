/// @file test_mapping.cpp
/// Unit tests for mapping.hpp: JSON-to-model mapping and field coercion.

#include "mapping.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <limits>

using namespace erp_sync;
using json = nlohmann::json;

static const std::string kKeyA = "11111111-aaaa-11ee-8000-000000000001";
static const std::string kKeyB = "22222222-bbbb-11ee-8000-000000000002";

// ============================================================================
// Field readers
// ============================================================================

TEST(ReadNumber, NumbersAndNumericStrings) {
    json node = {{"int", 10}, {"real", 2.5}, {"text", " 7.25 "}};
    EXPECT_DOUBLE_EQ(readNumber(node, "int"), 10.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "real"), 2.5);
    EXPECT_DOUBLE_EQ(readNumber(node, "text"), 7.25);
}

TEST(ReadNumber, MissingNullAndGarbageAreZero) {
    json node = {{"null", nullptr}, {"garbage", "12abc"}, {"empty", ""}, {"flag", true}};
    EXPECT_DOUBLE_EQ(readNumber(node, "absent"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "null"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "garbage"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "empty"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "flag"), 0.0);
}

TEST(ReadNumber, NonFiniteIsZero) {
    json node = {{"nan", "nan"}, {"inf", "inf"}, {"neg", "-Infinity"}, {"huge", "1e999"},
                 {"raw", std::numeric_limits<double>::quiet_NaN()},
                 {"rawInf", std::numeric_limits<double>::infinity()}};
    EXPECT_DOUBLE_EQ(readNumber(node, "nan"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "inf"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "neg"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "huge"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "raw"), 0.0);
    EXPECT_DOUBLE_EQ(readNumber(node, "rawInf"), 0.0);
}

TEST(ReadNumber, NonObjectIsZero) {
    EXPECT_DOUBLE_EQ(readNumber(json::array(), "x"), 0.0);
}

TEST(ReadKey, SentinelAndEmptyAreAbsent) {
    json node = {{"a", kKeyA}, {"zero", kEmptyUuid}, {"blank", ""}, {"num", 5}};
    EXPECT_EQ(readKey(node, "a").value_or(""), kKeyA);
    EXPECT_FALSE(readKey(node, "zero").has_value());
    EXPECT_FALSE(readKey(node, "blank").has_value());
    EXPECT_FALSE(readKey(node, "num").has_value());
    EXPECT_FALSE(readKey(node, "absent").has_value());
}

// ============================================================================
// extractPageValues
// ============================================================================

TEST(ExtractPageValues, ValueArray) {
    json body = {{"odata.metadata", "..."}, {"value", json::array({{{"Ref_Key", kKeyA}}})}};
    auto values = extractPageValues(body);
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values->size(), 1u);
    EXPECT_EQ((*values)[0]["Ref_Key"].get<std::string>(), kKeyA);
}

TEST(ExtractPageValues, EmptyArrayIsValid) {
    auto values = extractPageValues({{"value", json::array()}});
    ASSERT_TRUE(values.has_value());
    EXPECT_TRUE(values->empty());
}

TEST(ExtractPageValues, WrongShapeIsNullopt) {
    EXPECT_FALSE(extractPageValues(json()).has_value());
    EXPECT_FALSE(extractPageValues({{"value", "nope"}}).has_value());
    EXPECT_FALSE(extractPageValues({{"odata.error", {{"code", "-1"}}}}).has_value());
}

// ============================================================================
// Catalog entries
// ============================================================================

TEST(ParseNomenclatureType, SentinelParentBecomesNull) {
    json node = {{"Ref_Key", kKeyA}, {"Parent_Key", kEmptyUuid},
                 {"Description", "Fruit"}, {"IsFolder", true}};
    auto t = parseNomenclatureType(node);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->id, kKeyA);
    EXPECT_FALSE(t->parentId.has_value());
    EXPECT_EQ(t->name, "Fruit");
    EXPECT_TRUE(t->isFolder);
}

TEST(ParseNomenclatureType, SentinelOwnKeyIsDropped) {
    EXPECT_FALSE(parseNomenclatureType({{"Ref_Key", kEmptyUuid}}).has_value());
    EXPECT_FALSE(parseNomenclatureType(json::object()).has_value());
}

TEST(ParseNomenclatureItem, FullEntry) {
    json node = {
        {"Ref_Key", kKeyB},
        {"Parent_Key", kKeyA},
        {"Code", "  000123 "},
        {"Description", "Apples"},
        {"НаименованиеПолное", "Apples, red, 10 kg box"},
        {"Артикул", "AP-10"},
        {"ВидНоменклатуры_Key", kKeyA},
        {"ЕдиницаИзмерения_Key", kEmptyUuid},
        {"ВесЧислитель", 10},
        {"ВесЗнаменатель", 4},
    };
    auto item = parseNomenclatureItem(node);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->parentId.value_or(""), kKeyA);
    EXPECT_EQ(item->code, "000123");
    EXPECT_EQ(item->fullName, "Apples, red, 10 kg box");
    EXPECT_EQ(item->article, "AP-10");
    EXPECT_EQ(item->typeId.value_or(""), kKeyA);
    EXPECT_FALSE(item->unitId.has_value());
    ASSERT_TRUE(item->weight.has_value());
    EXPECT_DOUBLE_EQ(*item->weight, 2.5);
}

TEST(ParseNomenclatureItem, WeightNeedsPositiveDenominator) {
    json node = {{"Ref_Key", kKeyB}, {"ВесЧислитель", 10}, {"ВесЗнаменатель", 0}};
    auto item = parseNomenclatureItem(node);
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE(item->weight.has_value());
}

TEST(ParseClient, FoldersAreDropped) {
    json node = {{"Ref_Key", kKeyA}, {"IsFolder", true}, {"Description", "Group"}};
    EXPECT_FALSE(parseClient(node).has_value());
}

TEST(ParseClient, NameFallsBackToFullName) {
    json node = {{"Ref_Key", kKeyA}, {"Description", ""},
                 {"НаименованиеПолное", "ООО Ромашка"}, {"ИНН", "7701234567"}};
    auto c = parseClient(node);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->name, "ООО Ромашка");
    EXPECT_EQ(c->inn, "7701234567");
}

// ============================================================================
// Documents
// ============================================================================

TEST(ParseDocument, HeaderAndLines) {
    json node = {
        {"Ref_Key", "doc-1"},
        {"Number", "  00-000042 "},
        {"Date", "2024-03-05T14:30:00"},
        {"Партнер_Key", kKeyA},
        {"Контрагент_Key", kKeyB},
        {"АгросервисИТ_КоличествоПаллетов", "3"},
        {"АгросервисИТ_ФактическаяСтоимостьТраспортныхРасходов", 1200.5},
        {"Товары", json::array({
            {{"Номенклатура_Key", kKeyB}, {"Количество", 2}, {"Цена", "10.5"},
             {"Сумма", 21}, {"СуммаСНДС", 25.2}},
            {{"Номенклатура_Key", kKeyA}},
        })},
    };

    auto doc = parseDocument(node, "Товары");
    EXPECT_EQ(doc.id, "doc-1");
    EXPECT_EQ(doc.number, "00-000042");
    EXPECT_EQ(doc.date, "2024-03-05");
    EXPECT_EQ(doc.partnerKey, kKeyA);
    EXPECT_EQ(doc.contractorKey, kKeyB);
    EXPECT_DOUBLE_EQ(doc.pallets, 3.0);
    EXPECT_DOUBLE_EQ(doc.logisticsFact, 1200.5);
    EXPECT_DOUBLE_EQ(doc.logisticsPlan, 0.0);

    ASSERT_EQ(doc.lines.size(), 2u);
    EXPECT_DOUBLE_EQ(doc.lines[0].quantity, 2.0);
    EXPECT_DOUBLE_EQ(doc.lines[0].price, 10.5);
    EXPECT_DOUBLE_EQ(doc.lines[0].sumWithoutVat, 21.0);
    EXPECT_DOUBLE_EQ(doc.lines[0].sumWithVat, 25.2);
    EXPECT_DOUBLE_EQ(doc.lines[1].quantity, 0.0);
    EXPECT_DOUBLE_EQ(doc.lines[1].price, 0.0);
}

TEST(ParseDocument, ReadsNamedLineTable) {
    json node = {
        {"Date", "2024-03-05T00:00:00"},
        {"Товары", json::array({{{"Количество", 1}}})},
        {"Расхождения", json::array({{{"Количество", -2}}, {{"Количество", 3}}})},
    };
    EXPECT_EQ(parseDocument(node, "Расхождения").lines.size(), 2u);
    EXPECT_EQ(parseDocument(node, "Товары").lines.size(), 1u);
}

TEST(ParseDocument, MalformedDateIsEmpty) {
    EXPECT_EQ(parseDocument({{"Date", "05.03.2024"}}, "Товары").date, "");
    EXPECT_EQ(parseDocument({{"Date", 20240305}}, "Товары").date, "");
    EXPECT_EQ(parseDocument(json::object(), "Товары").date, "");
}

TEST(ParseDocument, MissingLineTableGivesNoLines) {
    EXPECT_TRUE(parseDocument({{"Товары", "broken"}}, "Товары").lines.empty());
}

TEST(SummarizeDocument, PlaceholdersForMissingFields) {
    auto s = summarizeDocument({{"Number", " 17 "}, {"Date", "2024-01-09T08:00:00"}});
    EXPECT_EQ(s.number, "17");
    EXPECT_EQ(s.date, "2024-01-09");
    EXPECT_EQ(s.id, "?");
}
