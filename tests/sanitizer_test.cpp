#include <gtest/gtest.h>
#include <string>
#include <nlohmann/json.hpp>
#include "portico/sanitizer.hpp"

using namespace portico;
using nlohmann::json;

namespace {

std::string with_nul(const std::string& before, const std::string& after) {
    std::string text = before;
    text.push_back('\0');
    text += after;
    return text;
}

bool contains_nul(const json& value) {
    if (value.is_string()) {
        return value.get_ref<const std::string&>().find('\0') != std::string::npos;
    }
    if (value.is_array() || value.is_object()) {
        for (const auto& element : value) {
            if (contains_nul(element)) return true;
        }
    }
    return false;
}

} // namespace

// =============================================================================
// String Tests
// =============================================================================

TEST(SanitizerTest, Sanitize_StringWithNul_ShouldRemoveIt) {
    EXPECT_EQ(sanitizer::sanitize(with_nul("ab", "cd")), "abcd");
}

TEST(SanitizerTest, Sanitize_CleanString_ShouldReturnUnchanged) {
    EXPECT_EQ(sanitizer::sanitize(std::string("hello")), "hello");
}

TEST(SanitizerTest, Sanitize_OnlyNuls_ShouldReturnEmpty) {
    EXPECT_EQ(sanitizer::sanitize(std::string(3, '\0')), "");
}

// =============================================================================
// Structured Value Tests
// =============================================================================

TEST(SanitizerTest, Sanitize_NestedValue_ShouldRemoveEveryNulAndKeepStructure) {
    json value = {
        {"name", with_nul("Ag", "ent")},
        {"count", 3},
        {"enabled", true},
        {"missing", nullptr},
        {"tags", json::array({json(with_nul("", "a")), json("b"), json(1.5)})},
        {"inner", {{"deep", json::array({json::object({{"x", with_nul("y", "")}})})}}},
    };

    auto clean = sanitizer::sanitize(value);

    EXPECT_FALSE(contains_nul(clean));
    EXPECT_EQ(clean["name"], "Agent");
    EXPECT_EQ(clean["count"], 3);
    EXPECT_EQ(clean["enabled"], true);
    EXPECT_TRUE(clean["missing"].is_null());
    EXPECT_EQ(clean["tags"], json::array({"a", "b", 1.5}));
    EXPECT_EQ(clean["inner"]["deep"][0]["x"], "y");
    EXPECT_EQ(clean.size(), value.size());
}

TEST(SanitizerTest, Sanitize_AppliedTwice_ShouldEqualAppliedOnce) {
    json value = {
        {"a", with_nul("x", "y")},
        {"b", json::array({json(with_nul("", "")), json::object({{"c", with_nul("1", "2")}})})},
        {"d", 42},
    };

    auto once = sanitizer::sanitize(value);
    auto twice = sanitizer::sanitize(once);

    EXPECT_EQ(once, twice);
}

TEST(SanitizerTest, Sanitize_Scalars_ShouldReturnUnchanged) {
    EXPECT_EQ(sanitizer::sanitize(json(7)), json(7));
    EXPECT_EQ(sanitizer::sanitize(json(false)), json(false));
    EXPECT_EQ(sanitizer::sanitize(json(nullptr)), json(nullptr));
}

// =============================================================================
// ChangeEvent Tests
// =============================================================================

TEST(SanitizerTest, Sanitize_ChangeEvent_ShouldCleanRecordAndOldRecord) {
    ChangeEvent event;
    event.table = "agents";
    event.operation = Operation::Update;
    event.record = {{"global_uuid", "a1"}, {"name", with_nul("new", "")}};
    event.old_record = json{{"global_uuid", "a1"}, {"name", with_nul("old", "")}};

    auto clean = sanitizer::sanitize(event);

    EXPECT_EQ(clean.table, "agents");
    EXPECT_EQ(clean.operation, Operation::Update);
    EXPECT_EQ(clean.record["name"], "new");
    ASSERT_TRUE(clean.old_record.has_value());
    EXPECT_EQ((*clean.old_record)["name"], "old");
}

TEST(SanitizerTest, Sanitize_ChangeEventWithoutOldRecord_ShouldKeepItAbsent) {
    ChangeEvent event;
    event.table = "signals";
    event.record = {{"global_uuid", "g1"}};

    auto clean = sanitizer::sanitize(event);

    EXPECT_FALSE(clean.old_record.has_value());
    EXPECT_EQ(clean.record, event.record);
}
