#include <jsonpatch-cpp/pointer.hpp>

#include <gtest/gtest.h>

using namespace jsonpatch_cpp;

namespace {

auto sample() -> Value {
    return Object{
        {"name", "widget"},
        {"tags", Array{"a", "b", "c"}},
        {"dims", Object{{"w", 3}, {"h", 4}}},
        {"count", 7},
    };
}

auto path(std::string_view pointer) -> Path {
    return parse_pointer(pointer).value();
}

}  // namespace

// -- get / exists ---------------------------------------------------------------

TEST(PointerGet, root_returns_the_document) {
    const auto doc = sample();
    auto found = pointer::get(doc, Path{});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, &doc);
}

TEST(PointerGet, nested_member_and_element) {
    const auto doc = sample();
    EXPECT_EQ(**pointer::get(doc, path("/dims/h")), Value{4});
    EXPECT_EQ(**pointer::get(doc, path("/tags/2")), Value{"c"});
}

TEST(PointerGet, missing_member_is_target_not_found) {
    const auto doc = sample();
    auto found = pointer::get(doc, path("/nope"));
    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().kind, ErrorKind::target_not_found);
    EXPECT_EQ(found.error().path, "/nope");
}

TEST(PointerGet, index_past_end_is_target_not_found) {
    const auto doc = sample();
    EXPECT_EQ(pointer::get(doc, path("/tags/3")).error().kind, ErrorKind::target_not_found);
}

TEST(PointerGet, append_never_resolves) {
    const auto doc = sample();
    EXPECT_EQ(pointer::get(doc, path("/tags/-")).error().kind, ErrorKind::target_not_found);
}

TEST(PointerGet, key_on_array_is_invalid_segment) {
    const auto doc = sample();
    EXPECT_EQ(pointer::get(doc, path("/tags/first")).error().kind,
              ErrorKind::invalid_path_segment);
}

TEST(PointerGet, index_on_object_selects_member_spelled_the_same) {
    const auto doc = Value{Object{{"codes", Object{{"404", "missing"}, {"-", "dash"}}}}};
    EXPECT_EQ(**pointer::get(doc, path("/codes/404")), Value{"missing"});
    EXPECT_EQ(**pointer::get(doc, path("/codes/-")), Value{"dash"});
    EXPECT_EQ(pointer::get(doc, path("/codes/500")).error().kind, ErrorKind::target_not_found);
}

TEST(PointerGet, index_on_scalar_is_invalid_segment) {
    const auto doc = sample();
    EXPECT_EQ(pointer::get(doc, path("/count/0")).error().kind,
              ErrorKind::invalid_path_segment);
    EXPECT_EQ(pointer::get(doc, path("/name/-")).error().kind,
              ErrorKind::invalid_path_segment);
}

TEST(PointerGet, key_and_index_spellings_reach_the_same_member) {
    const auto doc = Value{Object{{"0", "zero"}}};
    EXPECT_EQ(**pointer::get(doc, Path{Key{"0"}}), Value{"zero"});
    EXPECT_EQ(**pointer::get(doc, Path{Index{0}}), Value{"zero"});
}

TEST(PointerGet, descending_into_scalar_is_invalid_segment) {
    const auto doc = sample();
    EXPECT_EQ(pointer::get(doc, path("/count/x")).error().kind,
              ErrorKind::invalid_path_segment);
}

TEST(PointerGet, wildcard_is_rejected) {
    const auto doc = sample();
    const auto q = parse_query("$/tags/*").value();
    EXPECT_EQ(pointer::get(doc, q).error().kind, ErrorKind::invalid_path);
}

TEST(PointerExists, never_fails) {
    const auto doc = sample();
    EXPECT_TRUE(pointer::exists(doc, path("/tags/0")));
    EXPECT_TRUE(pointer::exists(doc, Path{}));
    EXPECT_FALSE(pointer::exists(doc, path("/tags/9")));
    EXPECT_FALSE(pointer::exists(doc, path("/count/x")));
}

// -- add ----------------------------------------------------------------------

TEST(PointerAdd, new_member_goes_last) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, path("/color"), "red").has_value());
    EXPECT_EQ(doc.as_object()->keys().back(), "color");
    EXPECT_EQ(*doc.get_key("color"), Value{"red"});
}

TEST(PointerAdd, existing_member_is_overwritten) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, path("/count"), 8).has_value());
    EXPECT_EQ(*doc.get_key("count"), Value{8});
    EXPECT_EQ(doc.size(), 4u);
}

TEST(PointerAdd, insert_shifts_right) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, path("/tags/1"), "x").has_value());
    EXPECT_EQ(*doc.get_key("tags"), (Value{Array{"a", "x", "b", "c"}}));
}

TEST(PointerAdd, index_equal_to_size_appends) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, path("/tags/3"), "d").has_value());
    EXPECT_EQ(*doc.get_key("tags"), (Value{Array{"a", "b", "c", "d"}}));
}

TEST(PointerAdd, dash_appends) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, path("/tags/-"), "z").has_value());
    EXPECT_EQ(*doc.get_key("tags")->get_index(3), Value{"z"});
}

TEST(PointerAdd, index_past_size_is_out_of_bounds) {
    auto doc = Value{Object{{"a", Array{1, 2}}}};
    auto ok = pointer::add(doc, path("/a/5"), 3);
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().kind, ErrorKind::index_out_of_bounds);
    EXPECT_EQ(doc, (Value{Object{{"a", Array{1, 2}}}}));
}

TEST(PointerAdd, key_into_array_is_invalid_index) {
    auto doc = sample();
    EXPECT_EQ(pointer::add(doc, path("/tags/x"), 1).error().kind, ErrorKind::invalid_index);
}

TEST(PointerAdd, index_into_object_adds_member_by_name) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, path("/dims/0"), 1).has_value());
    ASSERT_TRUE(pointer::add(doc, path("/dims/-"), 2).has_value());
    EXPECT_EQ(*doc.get_key("dims"), (Value{Object{{"w", 3}, {"h", 4}, {"0", 1}, {"-", 2}}}));
}

TEST(PointerAdd, missing_parent_is_target_not_found) {
    auto doc = sample();
    EXPECT_EQ(pointer::add(doc, path("/missing/child"), 1).error().kind,
              ErrorKind::target_not_found);
}

TEST(PointerAdd, scalar_parent_is_target_not_found) {
    auto doc = sample();
    EXPECT_EQ(pointer::add(doc, path("/count/child"), 1).error().kind,
              ErrorKind::target_not_found);
}

TEST(PointerAdd, root_replaces_document) {
    auto doc = sample();
    ASSERT_TRUE(pointer::add(doc, Path{}, Array{1}).has_value());
    EXPECT_EQ(doc, (Value{Array{1}}));
}

// -- replace ------------------------------------------------------------------

TEST(PointerReplace, existing_value) {
    auto doc = sample();
    ASSERT_TRUE(pointer::replace(doc, path("/tags/0"), "A").has_value());
    EXPECT_EQ(*doc.get_key("tags"), (Value{Array{"A", "b", "c"}}));
}

TEST(PointerReplace, missing_value_is_target_not_found) {
    auto doc = Value{Object{}};
    auto ok = pointer::replace(doc, path("/missing"), 1);
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().kind, ErrorKind::target_not_found);
    EXPECT_EQ(doc, Value{Object{}});
}

TEST(PointerReplace, dash_is_target_not_found) {
    auto doc = sample();
    EXPECT_EQ(pointer::replace(doc, path("/tags/-"), 1).error().kind,
              ErrorKind::target_not_found);
}

TEST(PointerReplace, numeric_member) {
    auto doc = Value{Object{{"404", "not found"}}};
    ASSERT_TRUE(pointer::replace(doc, path("/404"), "gone").has_value());
    EXPECT_EQ(doc, (Value{Object{{"404", "gone"}}}));
}

TEST(PointerReplace, root) {
    auto doc = sample();
    ASSERT_TRUE(pointer::replace(doc, Path{}, "flat").has_value());
    EXPECT_EQ(doc, Value{"flat"});
}

// -- remove -------------------------------------------------------------------

TEST(PointerRemove, member) {
    auto doc = sample();
    ASSERT_TRUE(pointer::remove(doc, path("/dims/w")).has_value());
    EXPECT_EQ(*doc.get_key("dims"), (Value{Object{{"h", 4}}}));
}

TEST(PointerRemove, element_shifts_left) {
    auto doc = sample();
    ASSERT_TRUE(pointer::remove(doc, path("/tags/0")).has_value());
    EXPECT_EQ(*doc.get_key("tags"), (Value{Array{"b", "c"}}));
}

TEST(PointerRemove, numeric_and_dash_members) {
    auto doc = Value{Object{{"7", 1}, {"-", 2}, {"k", 3}}};
    ASSERT_TRUE(pointer::remove(doc, path("/7")).has_value());
    ASSERT_TRUE(pointer::remove(doc, path("/-")).has_value());
    EXPECT_EQ(doc, (Value{Object{{"k", 3}}}));
}

TEST(PointerRemove, missing_is_target_not_found) {
    auto doc = sample();
    EXPECT_EQ(pointer::remove(doc, path("/tags/3")).error().kind, ErrorKind::target_not_found);
    EXPECT_EQ(pointer::remove(doc, path("/nope")).error().kind, ErrorKind::target_not_found);
    EXPECT_EQ(pointer::remove(doc, path("/tags/-")).error().kind, ErrorKind::target_not_found);
    EXPECT_EQ(doc, sample());
}

TEST(PointerRemove, root_is_invalid_path) {
    auto doc = sample();
    EXPECT_EQ(pointer::remove(doc, Path{}).error().kind, ErrorKind::invalid_path);
}

TEST(PointerRemove, add_then_remove_round_trips) {
    const auto original = sample();
    auto doc = original;
    ASSERT_TRUE(pointer::add(doc, path("/dims/d"), Array{1, 2}).has_value());
    ASSERT_TRUE(pointer::remove(doc, path("/dims/d")).has_value());
    EXPECT_EQ(doc, original);
}

// -- string conveniences --------------------------------------------------------

TEST(PointerStrings, get_pointer_copies) {
    const auto doc = sample();
    auto w = pointer::get_pointer(doc, "/dims/w");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(*w, Value{3});
}

TEST(PointerStrings, put_and_delete) {
    auto doc = sample();
    ASSERT_TRUE(pointer::put_pointer(doc, "/dims/d", 5).has_value());
    EXPECT_EQ(*doc.get_key("dims")->get_key("d"), Value{5});
    ASSERT_TRUE(pointer::delete_pointer(doc, "/dims/d").has_value());
    EXPECT_EQ(doc, sample());
}

TEST(PointerStrings, malformed_pointer_is_invalid_path) {
    auto doc = sample();
    EXPECT_EQ(pointer::get_pointer(doc, "dims").error().kind, ErrorKind::invalid_path);
    EXPECT_EQ(pointer::put_pointer(doc, "/a~9", 1).error().kind, ErrorKind::invalid_path);
    EXPECT_EQ(pointer::delete_pointer(doc, "//").error().kind, ErrorKind::invalid_path);
}
