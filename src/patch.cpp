#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/log.hpp>

#include <array>
#include <utility>

namespace jsonpatch_cpp {

namespace {

constexpr auto all_op_types = std::array{
    OpType::add, OpType::remove, OpType::replace,
    OpType::move, OpType::copy, OpType::test,
};

auto require_string(const nlohmann::json& j, const char* key) -> const std::string& {
    auto it = j.find(key);
    if (it == j.end()) {
        throw PatchError{ErrorKind::unmarshal, std::string{"operation is missing \""} + key + "\""};
    }
    if (!it->is_string()) {
        throw PatchError{ErrorKind::unmarshal, std::string{"operation \""} + key + "\" must be a string"};
    }
    return it->get_ref<const std::string&>();
}

}  // anonymous namespace

auto parse_op_type(std::string_view name) -> std::optional<OpType> {
    for (auto op : all_op_types) {
        if (to_string_view(op) == name) return op;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"op", std::string{to_string_view(op.op)}},
        {"path", op.path},
    };
    if (!op.from.empty()) j["from"] = op.from;
    if (op.value) j["value"] = *op.value;
}

void from_json(const nlohmann::json& j, Operation& op) {
    if (!j.is_object()) {
        throw PatchError{ErrorKind::unmarshal, "operation must be an object"};
    }
    const auto& name = require_string(j, "op");
    auto kind = parse_op_type(name);
    if (!kind) {
        throw PatchError{ErrorKind::unmarshal, "unknown operation \"" + name + "\""};
    }
    op.op = *kind;
    op.path = require_string(j, "path");
    op.from.clear();
    if (j.contains("from")) op.from = require_string(j, "from");
    op.value.reset();
    if (auto it = j.find("value"); it != j.end()) op.value = *it;
}

auto parse_patch(const nlohmann::json& document) -> Patch {
    if (!document.is_array()) {
        throw PatchError{ErrorKind::unmarshal, "patch document must be an array"};
    }
    auto patch = Patch{};
    patch.reserve(document.size());
    for (const auto& item : document) {
        auto op = Operation{};
        from_json(item, op);
        patch.push_back(std::move(op));
    }
    logger().trace("parsed patch with {} operation(s)", patch.size());
    return patch;
}

auto parse_patch(std::string_view text) -> Patch {
    auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        throw PatchError{ErrorKind::unmarshal, "patch document is not valid JSON"};
    }
    return parse_patch(document);
}

}  // namespace jsonpatch_cpp
