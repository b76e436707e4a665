// json_test.cpp — Tests for nlohmann/json interoperability

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

// =============================================================================
// ADL serialization tests — stays in jp:: namespace
// =============================================================================

TEST(JsonAdl, null_to_json) {
    json j = jp::Null{};
    EXPECT_TRUE(j.is_null());
}

TEST(JsonAdl, scalars_to_json) {
    EXPECT_EQ(json(jp::Value{true}), true);
    EXPECT_EQ(json(jp::Value{-42}), -42);
    EXPECT_EQ(json(jp::Value{2.5}), 2.5);
    EXPECT_EQ(json(jp::Value{"hi"}), "hi");
    EXPECT_TRUE(json(jp::Value{}).is_null());
}

TEST(JsonAdl, containers_to_json) {
    const auto v = jp::Value{jp::Object{
        {"list", jp::Array{1, "two", nullptr}},
        {"nested", jp::Object{{"ok", true}}},
    }};
    json j = v;
    EXPECT_EQ(j, json::parse(R"({"list": [1, "two", null], "nested": {"ok": true}})"));
}

TEST(JsonAdl, from_json_round_trip) {
    const auto j = json::parse(R"({"a": [1, 2.5, "x", false, null], "b": {"c": {}}})");
    auto v = j.get<jp::Value>();
    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(*v.get_key("a")->get_index(1), jp::Value{2.5});
    json back = v;
    EXPECT_EQ(back, j);
}

TEST(JsonAdl, from_json_infers_int_for_small_unsigned) {
    const auto j = json(std::uint64_t{42});
    auto v = jp::Value{};
    jp::from_json(j, v);
    ASSERT_NE(v.get_if<std::int64_t>(), nullptr);
    EXPECT_EQ(*v.get_if<std::int64_t>(), 42);
}

TEST(JsonAdl, from_json_keeps_large_unsigned) {
    const auto val = std::uint64_t{18446744073709551615ULL};
    auto v = jp::Value{};
    jp::from_json(json(val), v);
    ASSERT_NE(v.get_if<std::uint64_t>(), nullptr);
    EXPECT_EQ(*v.get_if<std::uint64_t>(), val);
    EXPECT_EQ(json(v), val);
}

TEST(JsonAdl, from_json_rejects_binary) {
    const auto j = json::binary({0x01, 0x02});
    auto v = jp::Value{};
    EXPECT_THROW(jp::from_json(j, v), jp::PatchError);
}

TEST(JsonAdl, ordered_json_keeps_member_order) {
    const auto j = nlohmann::ordered_json::parse(R"({"z": 1, "a": 2, "m": 3})");
    auto v = j.get<jp::Value>();
    EXPECT_EQ(v.as_object()->keys(), (std::vector<std::string>{"z", "a", "m"}));
    nlohmann::ordered_json back = v;
    EXPECT_EQ(back.dump(), R"({"z":1,"a":2,"m":3})");
}

TEST(JsonAdl, operation_to_json_omits_absent_fields) {
    json j = jp::Operation::remove("/a");
    EXPECT_EQ(j, json::parse(R"({"op": "remove", "path": "/a"})"));
    EXPECT_FALSE(j.contains("value"));
}

TEST(JsonAdl, operation_to_json_keeps_null_value) {
    json j = jp::Operation::add("/a", nullptr);
    ASSERT_TRUE(j.contains("value"));
    EXPECT_TRUE(j["value"].is_null());
}

TEST(JsonAdl, operation_from_json) {
    auto op = json::parse(R"({"op": "move", "from": "/a", "path": "/b"})").get<jp::Operation>();
    EXPECT_EQ(op, jp::Operation::move("/a", "/b"));
}

TEST(JsonAdl, operation_from_json_rejects_non_object) {
    const auto j = json::parse(R"(["add"])");
    auto op = jp::Operation{};
    try {
        jp::from_json(j, op);
        FAIL() << "expected PatchError";
    } catch (const jp::PatchError& e) {
        EXPECT_EQ(e.kind(), jp::ErrorKind::invalid_patch);
    }
}

TEST(JsonAdl, error_to_json) {
    auto error = jp::Error{jp::ErrorKind::test_failed, "value differs", "/x"};
    error.op = "test";
    json j = error;
    EXPECT_EQ(j, json::parse(R"({
        "kind": "test_failed",
        "message": "value differs",
        "path": "/x",
        "op": "test"
    })"));
}

TEST(JsonAdl, error_to_json_omits_empty_context) {
    json j = jp::Error{jp::ErrorKind::invalid_patch, "bad"};
    EXPECT_FALSE(j.contains("path"));
    EXPECT_FALSE(j.contains("op"));
}

TEST(JsonAdl, error_kind_to_json) {
    json j = jp::ErrorKind::index_out_of_bounds;
    EXPECT_EQ(j, "index_out_of_bounds");
}

// =============================================================================
// import_json / export_json
// =============================================================================

TEST(ImportJson, builds_value_tree) {
    auto v = jp::json::import_json(json::parse(R"({"n": -3, "s": "x"})"));
    EXPECT_EQ(v, (jp::Value{jp::Object{{"s", "x"}, {"n", -3}}}));
}

TEST(ExportJson, preserves_numeric_representation) {
    auto j = jp::json::export_json(jp::Value{jp::Array{1, 1.5, std::uint64_t{7}}});
    ASSERT_TRUE(j.is_array());
    EXPECT_TRUE(j[0].is_number_integer());
    EXPECT_TRUE(j[1].is_number_float());
    EXPECT_TRUE(j[2].is_number_unsigned());
}

TEST(ExportJson, ordered_variant_keeps_insertion_order) {
    auto obj = jp::Object{};
    obj.insert_or_assign("second", 2);
    obj.insert_or_assign("first", 1);
    auto j = jp::json::export_ordered_json(obj);
    EXPECT_EQ(j.dump(), R"({"second":2,"first":1})");
}

// =============================================================================
// parse_patch
// =============================================================================

TEST(ParsePatch, reads_operations) {
    auto ops = jp::json::parse_patch(json::parse(R"([
        {"op": "add", "path": "/a", "value": 1},
        {"op": "test", "path": "/a", "value": 1}
    ])"));
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0], jp::Operation::add("/a", 1));
    EXPECT_EQ(ops[1], jp::Operation::test("/a", 1));
}

TEST(ParsePatch, non_array_throws) {
    EXPECT_THROW(jp::json::parse_patch(json::parse(R"({"op": "add"})")), jp::PatchError);
}

// =============================================================================
// apply_json_patch
// =============================================================================

TEST(ApplyJsonPatch, rfc6902_example_add_member) {
    auto out = jp::json::apply_json_patch(
        json::parse(R"({"foo": "bar"})"),
        json::parse(R"([{"op": "add", "path": "/baz", "value": "qux"}])"));
    EXPECT_EQ(out, json::parse(R"({"baz": "qux", "foo": "bar"})"));
}

TEST(ApplyJsonPatch, rfc6902_example_add_array_element) {
    auto out = jp::json::apply_json_patch(
        json::parse(R"({"foo": ["bar", "baz"]})"),
        json::parse(R"([{"op": "add", "path": "/foo/1", "value": "qux"}])"));
    EXPECT_EQ(out, json::parse(R"({"foo": ["bar", "qux", "baz"]})"));
}

TEST(ApplyJsonPatch, rfc6902_example_move_array_element) {
    auto out = jp::json::apply_json_patch(
        json::parse(R"({"foo": ["all", "grass", "cows", "eat"]})"),
        json::parse(R"([{"op": "move", "from": "/foo/1", "path": "/foo/3"}])"));
    EXPECT_EQ(out, json::parse(R"({"foo": ["all", "cows", "eat", "grass"]})"));
}

TEST(ApplyJsonPatch, rfc6902_example_tilde_escape) {
    auto out = jp::json::apply_json_patch(
        json::parse(R"({"/": 9, "~1": 10})"),
        json::parse(R"([{"op": "test", "path": "/~01", "value": 10}])"));
    EXPECT_EQ(out, json::parse(R"({"/": 9, "~1": 10})"));
}

TEST(ApplyJsonPatch, query_expression) {
    auto out = jp::json::apply_json_patch(
        json::parse(R"({"users": [{"active": true}, {"active": true}]})"),
        json::parse(R"([{"op": "replace", "path": "$/users/*/active", "value": false}])"));
    EXPECT_EQ(out, json::parse(R"({"users": [{"active": false}, {"active": false}]})"));
}

TEST(ApplyJsonPatch, input_is_not_modified) {
    const auto doc = json::parse(R"({"a": 1})");
    jp::json::apply_json_patch(doc, json::parse(R"([{"op": "remove", "path": "/a"}])"));
    EXPECT_EQ(doc, json::parse(R"({"a": 1})"));
}

TEST(ApplyJsonPatch, failing_test_throws_patch_error) {
    try {
        jp::json::apply_json_patch(
            json::parse(R"({"a": 1})"),
            json::parse(R"([{"op": "test", "path": "/a", "value": 2}])"));
        FAIL() << "expected PatchError";
    } catch (const jp::PatchError& e) {
        EXPECT_EQ(e.error().kind, jp::ErrorKind::test_failed);
        EXPECT_EQ(e.error().op, "test");
        EXPECT_EQ(e.error().path, "/a");
        EXPECT_EQ(std::string{e.what()}, e.error().describe());
    }
}

TEST(ApplyJsonPatch, unknown_op_throws) {
    EXPECT_THROW(jp::json::apply_json_patch(
                     json::parse(R"({})"),
                     json::parse(R"([{"op": "merge", "path": "/a"}])")),
                 jp::PatchError);
}

TEST(ApplyJsonPatch, patch_error_is_a_runtime_error) {
    EXPECT_THROW(jp::json::apply_json_patch(
                     json::parse(R"({})"),
                     json::parse(R"([{"op": "remove", "path": "/missing"}])")),
                 std::runtime_error);
}

// =============================================================================
// query_json
// =============================================================================

TEST(QueryJson, returns_pointer_strings) {
    auto out = jp::json::query_json(json::parse(R"({"a": [5, 6, 7]})"), "$/a/*");
    EXPECT_EQ(out, (std::vector<std::string>{"/a/0", "/a/1", "/a/2"}));
}

TEST(QueryJson, malformed_query_throws) {
    try {
        jp::json::query_json(json::parse(R"({})"), "/a");
        FAIL() << "expected PatchError";
    } catch (const jp::PatchError& e) {
        EXPECT_EQ(e.kind(), jp::ErrorKind::invalid_path);
    }
}
