// Fuzz target for apply() - feeds arbitrary bytes as patch text to a value
// covering every structural kind. Only PatchError may escape apply(); when it
// does, the value must be unchanged.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Leaf {
    std::string text;
    double number{};
    bool flag{};
};

struct Root {
    std::vector<std::unique_ptr<Leaf>> list;
    std::map<std::string, Leaf> map;
    std::optional<Leaf> maybe;
    std::shared_ptr<Root> next;
    std::array<int, 2> pair{};
};

}  // namespace

template <>
struct jsonpatch_cpp::record_traits<Leaf> {
    static constexpr auto fields() {
        return std::make_tuple(
            field("Text", &Leaf::text, "text"),
            field("Number", &Leaf::number, "number"),
            field("Flag", &Leaf::flag, "flag"));
    }
};

template <>
struct jsonpatch_cpp::record_traits<Root> {
    static constexpr auto fields() {
        return std::make_tuple(
            field("List", &Root::list, "list"),
            field("Map", &Root::map, "map"),
            field("Maybe", &Root::maybe, "maybe"),
            field("Next", &Root::next, "next"),
            field("Pair", &Root::pair, "pair"));
    }
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto root = Root{};
    root.list.push_back(std::make_unique<Leaf>());
    root.map["k"].text = "v";
    const auto before = jsonpatch_cpp::clone(root);

    try {
        jsonpatch_cpp::apply(text, root);
    } catch (const jsonpatch_cpp::PatchError&) {
        // Rejected patches must leave the value as it was
        if (!jsonpatch_cpp::deep_equal(before, root)) std::abort();
    }
    return 0;
}
