#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "portico/change_event.hpp"
#include "portico/errors.hpp"

using namespace portico;
using nlohmann::json;

// =============================================================================
// Operation Parsing Tests
// =============================================================================

TEST(ChangeEventTest, ParseOperation_KnownNames_ShouldMatchAnyCase) {
    EXPECT_EQ(parse_operation("INSERT"), Operation::Insert);
    EXPECT_EQ(parse_operation("update"), Operation::Update);
    EXPECT_EQ(parse_operation("Delete"), Operation::Delete);
    EXPECT_EQ(parse_operation("*"), Operation::Any);
}

TEST(ChangeEventTest, ParseOperation_UnknownName_ShouldReturnNullopt) {
    EXPECT_FALSE(parse_operation("UPSERT").has_value());
    EXPECT_FALSE(parse_operation("").has_value());
}

// =============================================================================
// Payload Decoding Tests
// =============================================================================

TEST(ChangeEventTest, FromPayload_WrappedInsert_ShouldDecodeTableOperationAndRecord) {
    json payload = {
        {"data", {
            {"table", "signals"},
            {"type", "INSERT"},
            {"record", {{"global_uuid", "g1"}}},
        }},
    };

    auto event = ChangeEvent::from_payload(payload);

    EXPECT_EQ(event.table, "signals");
    EXPECT_EQ(event.operation, Operation::Insert);
    EXPECT_EQ(event.record["global_uuid"], "g1");
    EXPECT_FALSE(event.old_record.has_value());
}

TEST(ChangeEventTest, FromPayload_BareFormWithAliases_ShouldDecode) {
    json payload = {
        {"table", "agents"},
        {"eventType", "UPDATE"},
        {"new", {{"global_uuid", "a1"}, {"name", "B"}}},
        {"old", {{"global_uuid", "a1"}, {"name", "A"}}},
    };

    auto event = ChangeEvent::from_payload(payload);

    EXPECT_EQ(event.operation, Operation::Update);
    EXPECT_EQ(event.record["name"], "B");
    ASSERT_TRUE(event.old_record.has_value());
    EXPECT_EQ((*event.old_record)["name"], "A");
}

TEST(ChangeEventTest, FromPayload_DeleteWithoutRecord_ShouldDefaultToEmptyObject) {
    json payload = {
        {"table", "steps"},
        {"type", "DELETE"},
        {"old_record", {{"global_uuid", "s1"}}},
    };

    auto event = ChangeEvent::from_payload(payload);

    EXPECT_TRUE(event.record.is_object());
    EXPECT_TRUE(event.record.empty());
    ASSERT_TRUE(event.old_record.has_value());
}

TEST(ChangeEventTest, FromPayload_MissingTable_ShouldThrowMissingField) {
    json payload = {{"type", "INSERT"}, {"record", json::object()}};

    try {
        ChangeEvent::from_payload(payload);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationError::Kind::MissingField);
        EXPECT_EQ(e.field(), "table");
    }
}

TEST(ChangeEventTest, FromPayload_UnknownType_ShouldThrowInvalidEnum) {
    json payload = {{"table", "signals"}, {"type", "TRUNCATE"}};

    try {
        ChangeEvent::from_payload(payload);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationError::Kind::InvalidEnum);
        EXPECT_EQ(e.field(), "type");
    }
}

TEST(ChangeEventTest, FromPayload_RecordNotObject_ShouldThrowInvalidValue) {
    json payload = {{"table", "signals"}, {"type", "INSERT"}, {"record", "oops"}};

    EXPECT_THROW(ChangeEvent::from_payload(payload), ValidationError);
}

TEST(ChangeEventTest, FromPayload_NotAnObject_ShouldThrowValidationError) {
    EXPECT_THROW(ChangeEvent::from_payload(json::array()), ValidationError);
}
