#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string_view>

using namespace jsonpatch_cpp;
using json = nlohmann::json;

namespace {

auto unmarshal_error_of(std::string_view text) -> bool {
    try {
        (void)parse_patch(text);
    } catch (const PatchError& e) {
        return e.kind() == ErrorKind::unmarshal;
    }
    return false;
}

}  // anonymous namespace

TEST(OpType, wire_names) {
    EXPECT_EQ(parse_op_type("add"), OpType::add);
    EXPECT_EQ(parse_op_type("remove"), OpType::remove);
    EXPECT_EQ(parse_op_type("replace"), OpType::replace);
    EXPECT_EQ(parse_op_type("move"), OpType::move);
    EXPECT_EQ(parse_op_type("copy"), OpType::copy);
    EXPECT_EQ(parse_op_type("test"), OpType::test);
    EXPECT_FALSE(parse_op_type("Add").has_value());
    EXPECT_FALSE(parse_op_type("").has_value());
}

TEST(ParsePatch, full_document) {
    auto patch = parse_patch(std::string_view{R"([
        {"op": "add", "path": "/phones/-", "value": "8390240670"},
        {"op": "remove", "path": "/m/a"},
        {"op": "move", "from": "/a", "path": "/b"},
        {"op": "test", "path": "/age", "value": 100}
    ])"});

    ASSERT_EQ(patch.size(), 4u);
    EXPECT_EQ(patch[0].op, OpType::add);
    EXPECT_EQ(patch[0].path, "/phones/-");
    ASSERT_TRUE(patch[0].value.has_value());
    EXPECT_EQ(*patch[0].value, json("8390240670"));
    EXPECT_EQ(patch[1].op, OpType::remove);
    EXPECT_FALSE(patch[1].value.has_value());
    EXPECT_EQ(patch[2].from, "/a");
    ASSERT_TRUE(patch[3].value.has_value());
    EXPECT_EQ(*patch[3].value, json(100));
}

TEST(ParsePatch, empty_document) {
    EXPECT_TRUE(parse_patch(std::string_view{"[]"}).empty());
}

TEST(ParsePatch, explicit_null_value_is_present) {
    auto patch = parse_patch(std::string_view{R"([{"op": "add", "path": "/child", "value": null}])"});
    ASSERT_EQ(patch.size(), 1u);
    ASSERT_TRUE(patch[0].value.has_value());
    EXPECT_TRUE(patch[0].value->is_null());
}

TEST(ParsePatch, unknown_members_are_ignored) {
    auto patch = parse_patch(std::string_view{R"([{"op": "remove", "path": "/a", "note": 1}])"});
    EXPECT_EQ(patch.size(), 1u);
}

TEST(ParsePatch, malformed_documents) {
    EXPECT_TRUE(unmarshal_error_of("not json"));
    EXPECT_TRUE(unmarshal_error_of(R"({"op": "replace", "path": "/m/a", "value": "x"})"));
    EXPECT_TRUE(unmarshal_error_of(R"([1])"));
    EXPECT_TRUE(unmarshal_error_of(R"([{"path": "/a"}])"));
    EXPECT_TRUE(unmarshal_error_of(R"([{"op": 1, "path": "/a"}])"));
    EXPECT_TRUE(unmarshal_error_of(R"([{"op": "add"}])"));
    EXPECT_TRUE(unmarshal_error_of(R"([{"op": "add", "path": 3}])"));
    EXPECT_TRUE(unmarshal_error_of(R"([{"op": "frobnicate", "path": "/a"}])"));
    EXPECT_TRUE(unmarshal_error_of(R"([{"op": "copy", "from": 1, "path": "/a"}])"));
}

TEST(ParsePatch, from_parsed_json) {
    auto document = json::array({json{{"op", "test"}, {"path", "/name"}, {"value", "hobbes"}}});
    auto patch = parse_patch(document);
    ASSERT_EQ(patch.size(), 1u);
    EXPECT_EQ(patch[0].op, OpType::test);
}

TEST(Operation, to_json_omits_absent_members) {
    auto op = Operation{};
    op.op = OpType::remove;
    op.path = "/m/a";

    EXPECT_EQ(json(op), json::parse(R"({"op": "remove", "path": "/m/a"})"));
}

TEST(Operation, json_conversion_preserves_operation) {
    auto op = Operation{};
    op.op = OpType::copy;
    op.path = "/b";
    op.from = "/a";
    op.value = json{{"k", 1}};

    auto back = json(op).get<Operation>();
    EXPECT_TRUE(back == op);
}
