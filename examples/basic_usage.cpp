// basic_usage - demonstrates the core jsonpatch-cpp API
//
// Registers two record types, applies patch documents to them, shows how a
// failing operation leaves the value untouched, and prints the result with
// the JSON encoder.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;

struct Address {
    std::string city;
    std::string zip;
};

struct Person {
    std::string name;
    int age{};
    std::vector<std::string> phones;
    std::map<std::string, std::string> labels;
    std::unique_ptr<Address> address;
};

template <>
struct jsonpatch_cpp::record_traits<Address> {
    static constexpr auto fields() {
        return std::make_tuple(
            field("City", &Address::city, "city"),
            field("Zip", &Address::zip, "zip,postal_code"));
    }
};

template <>
struct jsonpatch_cpp::record_traits<Person> {
    static constexpr auto fields() {
        return std::make_tuple(
            field("Name", &Person::name, "name"),
            field("Age", &Person::age, "age"),
            field("Phones", &Person::phones, "phones"),
            field("Labels", &Person::labels, "labels"),
            field("Address", &Person::address, "address"));
    }
};

int main() {
    auto person = Person{};
    person.name = "hobbes";
    person.age = 6;
    person.phones = {"555-0100"};

    // -- Apply a patch document -----------------------------------------------
    jp::apply(R"([
        {"op": "replace", "path": "/name", "value": "Calvin"},
        {"op": "add", "path": "/phones/-", "value": "555-0199"},
        {"op": "add", "path": "/labels/mood", "value": "mischievous"},
        {"op": "add", "path": "/address/city", "value": "Chagrin Falls"}
    ])", person);

    std::printf("After patch: %s\n", jp::encode(person).dump().c_str());

    // -- Aliases and normalized names resolve to the same field ---------------
    jp::apply(R"([
        {"op": "add", "path": "/address/postal_code", "value": "44022"},
        {"op": "test", "path": "/Address/ZIP", "value": "44022"}
    ])", person);
    std::printf("Zip: %s\n", person.address->zip.c_str());

    // -- A failing operation rolls the whole patch back -----------------------
    try {
        jp::apply(R"([
            {"op": "replace", "path": "/name", "value": "Susie"},
            {"op": "test", "path": "/age", "value": 7}
        ])", person);
    } catch (const jp::PatchError& e) {
        std::printf("Rejected (%s): %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }
    std::printf("Name is still: %s\n", person.name.c_str());

    // -- Deep copies share nothing --------------------------------------------
    auto snapshot = jp::clone(person);
    person.address->city = "Elsewhere";
    std::printf("Snapshot city: %s, equal: %s\n", snapshot.address->city.c_str(),
                jp::deep_equal(person, snapshot) ? "yes" : "no");

    // -- Debug logging traces each operation ----------------------------------
    jp::set_log_level(spdlog::level::debug);
    jp::apply(R"([{"op": "remove", "path": "/labels/mood"}])", person);

    std::printf("Done.\n");
    return 0;
}
