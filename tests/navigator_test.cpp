#include <jsonpatch-cpp/navigator.hpp>

#include "test_types.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace jsonpatch_cpp;
using fixtures::Inventory;
using fixtures::Item;
using fixtures::User;

namespace {

// Records what navigate() reached.
struct Probe {
    Kind kind{Kind::unsupported};
    std::string segment;
    const void* address{nullptr};
    int calls{0};

    template <typename C>
    void operator()(C& container, std::string_view seg) {
        kind = kind_of<C>();
        segment = std::string{seg};
        address = &container;
        ++calls;
    }
};

auto error_kind(auto&& fn) -> ErrorKind {
    try {
        fn();
    } catch (const PatchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected PatchError";
    return ErrorKind::unsupported;
}

}  // anonymous namespace

// -- Reaching containers ------------------------------------------------------

TEST(Navigate, single_segment_reaches_root) {
    auto user = User{};
    auto probe = Probe{};
    navigate(user, "/name", probe);

    EXPECT_EQ(probe.calls, 1);
    EXPECT_EQ(probe.kind, Kind::record);
    EXPECT_EQ(probe.segment, "name");
    EXPECT_EQ(probe.address, &user);
}

TEST(Navigate, surrounding_slashes_are_ignored) {
    auto user = User{};
    auto a = Probe{};
    auto b = Probe{};
    navigate(user, "phones/0", a);
    navigate(user, "/phones/0/", b);

    EXPECT_EQ(a.kind, Kind::sequence);
    EXPECT_EQ(a.segment, "0");
    EXPECT_EQ(a.address, b.address);
    EXPECT_EQ(a.segment, b.segment);
}

TEST(Navigate, empty_path_reaches_root_with_empty_segment) {
    auto user = User{};
    auto probe = Probe{};
    navigate(user, "", probe);

    EXPECT_EQ(probe.address, &user);
    EXPECT_EQ(probe.segment, "");
}

TEST(Navigate, sequence_index_then_field) {
    auto users = std::vector<std::unique_ptr<User>>{};
    users.push_back(std::make_unique<User>());
    auto probe = Probe{};
    navigate(users, "/0/name", probe);

    EXPECT_EQ(probe.kind, Kind::record);
    EXPECT_EQ(probe.address, users[0].get());
}

TEST(Navigate, map_key_then_field) {
    auto inv = Inventory{};
    inv.by_sku["A-1"].qty = 2;
    auto probe = Probe{};
    navigate(inv, "/by_sku/A-1/qty", probe);

    EXPECT_EQ(probe.kind, Kind::record);
    EXPECT_EQ(probe.address, &inv.by_sku["A-1"]);
    EXPECT_EQ(probe.segment, "qty");
}

TEST(Navigate, terminal_reference_is_unwrapped) {
    auto inv = Inventory{};
    inv.pinned = std::make_shared<Item>();
    auto probe = Probe{};
    navigate(inv, "/pinned/sku", probe);

    EXPECT_EQ(probe.kind, Kind::record);
    EXPECT_EQ(probe.address, inv.pinned.get());
}

TEST(Navigate, escaped_tokens) {
    auto user = User{};
    user.m["a/b"] = "x";
    auto probe = Probe{};
    navigate(user, "/m/a~1b", probe);

    EXPECT_EQ(probe.kind, Kind::keyed_map);
    EXPECT_EQ(probe.segment, "a/b");
}

TEST(Navigate, escaped_tokens_can_be_kept) {
    auto user = User{};
    auto opts = Options{};
    opts.unescape_tokens = false;
    auto probe = Probe{};
    navigate(user, "/m/a~1b", probe, opts);

    EXPECT_EQ(probe.segment, "a~1b");
}

// -- Side effects -------------------------------------------------------------

TEST(Navigate, materializes_null_references_on_the_way) {
    auto user = User{};
    auto probe = Probe{};
    navigate(user, "/child/child/name", probe);

    ASSERT_NE(user.child, nullptr);
    ASSERT_NE(user.child->child, nullptr);
    EXPECT_EQ(probe.address, user.child->child.get());
}

TEST(Navigate, materializes_optional_and_shared_ptr) {
    auto inv = Inventory{};
    auto probe = Probe{};
    navigate(inv, "/featured/sku", probe);
    navigate(inv, "/pinned/tags/0", probe);

    EXPECT_TRUE(inv.featured.has_value());
    EXPECT_NE(inv.pinned, nullptr);
}

TEST(Navigate, inserts_absent_map_keys_on_the_way) {
    auto inv = Inventory{};
    auto probe = Probe{};
    navigate(inv, "/reserved/new/sku", probe);

    ASSERT_EQ(inv.reserved.count("new"), 1u);
    EXPECT_NE(inv.reserved["new"], nullptr);
}

TEST(Navigate, terminal_map_key_is_not_inserted) {
    auto user = User{};
    auto probe = Probe{};
    navigate(user, "/m/a", probe);

    EXPECT_TRUE(user.m.empty());
}

// -- Errors -------------------------------------------------------------------

TEST(Navigate, index_out_of_range) {
    auto user = User{};
    user.phones = {"1"};
    EXPECT_EQ(error_kind([&] { navigate(user, "/phones/1/x", Probe{}); }),
              ErrorKind::incorrect_index);
    EXPECT_EQ(error_kind([&] { navigate(user, "/phones/-/x", Probe{}); }),
              ErrorKind::incorrect_index);
}

TEST(Navigate, unknown_field) {
    auto user = User{};
    EXPECT_EQ(error_kind([&] { navigate(user, "/address/street", Probe{}); }),
              ErrorKind::incorrect_index);
    EXPECT_EQ(error_kind([&] { navigate(user, "/secret/x", Probe{}); }),
              ErrorKind::incorrect_index);
}

TEST(Navigate, exact_matching_rejects_lowercase_names) {
    auto user = User{};
    auto opts = Options{};
    opts.field_matching = FieldMatching::exact;

    EXPECT_EQ(error_kind([&] { navigate(user, "/child/name", Probe{}, opts); }),
              ErrorKind::incorrect_index);
    EXPECT_NO_THROW(navigate(user, "/Child/name", Probe{}, opts));
}

TEST(Navigate, descending_past_a_primitive) {
    auto user = User{};
    EXPECT_EQ(error_kind([&] { navigate(user, "/name/first/letter", Probe{}); }),
              ErrorKind::garbage_value);
}

TEST(Navigate, descending_into_unsupported_member) {
    auto value = fixtures::WithCallback{};
    EXPECT_EQ(error_kind([&] { navigate(value, "/callback/x/y", Probe{}); }),
              ErrorKind::unsupported);
}
