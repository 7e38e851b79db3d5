// jsonpatch-cpp benchmarks - measures copy and patch throughput.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jp = jsonpatch_cpp;

namespace {

struct Contact {
    std::string name;
    int age{};
    std::vector<std::string> phones;
    std::map<std::string, std::string> labels;
    std::unique_ptr<Contact> manager;
};

}  // namespace

template <>
struct jsonpatch_cpp::record_traits<Contact> {
    static constexpr auto fields() {
        return std::make_tuple(
            field("Name", &Contact::name, "name"),
            field("Age", &Contact::age, "age"),
            field("Phones", &Contact::phones, "phones"),
            field("Labels", &Contact::labels, "labels"),
            field("Manager", &Contact::manager, "manager"));
    }
};

static auto make_contacts(std::size_t n) -> std::vector<std::unique_ptr<Contact>> {
    auto contacts = std::vector<std::unique_ptr<Contact>>{};
    for (std::size_t i = 0; i < n; ++i) {
        auto c = std::make_unique<Contact>();
        c->name = "contact-" + std::to_string(i);
        c->age = static_cast<int>(i % 90);
        c->phones = {"555-0100", "555-0101"};
        c->labels = {{"team", "core"}, {"site", "remote"}};
        c->manager = std::make_unique<Contact>();
        c->manager->name = "boss";
        contacts.push_back(std::move(c));
    }
    return contacts;
}

// =============================================================================
// Deep copy
// =============================================================================

static void bm_clone_contacts(benchmark::State& state) {
    const auto contacts = make_contacts(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto copy = jp::clone(contacts);
        benchmark::DoNotOptimize(copy);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_clone_contacts)->Range(8, 1024);

static void bm_deep_equal_contacts(benchmark::State& state) {
    const auto contacts = make_contacts(static_cast<std::size_t>(state.range(0)));
    const auto copy = jp::clone(contacts);
    for (auto _ : state) {
        benchmark::DoNotOptimize(jp::deep_equal(contacts, copy));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_deep_equal_contacts)->Range(8, 1024);

// =============================================================================
// Parsing
// =============================================================================

static void bm_parse_patch(benchmark::State& state) {
    const auto text = std::string{R"([
        {"op": "replace", "path": "/0/name", "value": "Calvin"},
        {"op": "add", "path": "/0/phones/-", "value": "555-0199"},
        {"op": "remove", "path": "/0/labels/site"},
        {"op": "test", "path": "/0/manager/name", "value": "boss"}
    ])"};
    for (auto _ : state) {
        auto patch = jp::parse_patch(std::string_view{text});
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations() * 4);
}
BENCHMARK(bm_parse_patch);

// =============================================================================
// Apply
// =============================================================================

static void bm_apply_patch(benchmark::State& state) {
    auto contacts = make_contacts(static_cast<std::size_t>(state.range(0)));
    const auto patch = jp::parse_patch(std::string_view{R"([
        {"op": "replace", "path": "/0/name", "value": "Calvin"},
        {"op": "add", "path": "/0/phones/0", "value": "555-0199"},
        {"op": "remove", "path": "/0/phones/0"},
        {"op": "test", "path": "/0/manager/name", "value": "boss"}
    ])"});
    for (auto _ : state) {
        jp::apply(patch, contacts);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(patch.size()));
}
BENCHMARK(bm_apply_patch)->Range(8, 1024);

static void bm_apply_operation_in_place(benchmark::State& state) {
    auto contacts = make_contacts(1);
    auto op = jp::Operation{};
    op.op = jp::OpType::replace;
    op.path = "/0/age";
    op.value = 42;
    for (auto _ : state) {
        jp::apply_operation(op, contacts);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_operation_in_place);
