#include "type/ValueConverters.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

using namespace OC;

namespace {

struct Magnitude {
    double value = 0.0;
    std::string band;
};

struct Unregistered {
    int id = 0;
};

struct Catalogue {
    std::string code;
};

} // namespace

TEST_SUITE("type.converters") {
    TEST_CASE("Default converters encode type and value") {
        auto encoded = ValueToJson(Value{2.5});
        REQUIRE(encoded.has_value());
        CHECK((*encoded)["type"] == "double");
        CHECK((*encoded)["value"] == 2.5);

        auto text = ValueToJson(Value{"vega"});
        REQUIRE(text.has_value());
        CHECK((*text)["type"] == "std::string");

        auto null = ValueToJson(Value{});
        REQUIRE(null.has_value());
        CHECK((*null)["type"] == "null");
    }

    TEST_CASE("Decoding restores the registered type") {
        auto decoded = ValueFromJson(nlohmann::json{{"type", "int64_t"}, {"value", 12}});
        REQUIRE(decoded.has_value());
        CHECK(decoded->holds<std::int64_t>());
        CHECK(*decoded->get<std::int64_t>() == 12);

        auto vector = ValueFromJson(nlohmann::json{{"type", "std::vector<double>"}, {"value", {1.0, 2.0}}});
        REQUIRE(vector.has_value());
        CHECK(*vector == Value{std::vector<double>{1.0, 2.0}});

        auto null = ValueFromJson(nlohmann::json{{"type", "null"}});
        REQUIRE(null.has_value());
        CHECK(null->isNull());
    }

    TEST_CASE("Unknown and malformed input") {
        auto unknown = ValueToJson(Value{Unregistered{}});
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::UnserializableType);

        auto unnamed = ValueFromJson(nlohmann::json{{"value", 1}});
        REQUIRE_FALSE(unnamed.has_value());
        CHECK(unnamed.error().code == Error::Code::MalformedInput);

        auto unregistered = ValueFromJson(nlohmann::json{{"type", "Nope"}, {"value", 1}});
        REQUIRE_FALSE(unregistered.has_value());
        CHECK(unregistered.error().code == Error::Code::UnserializableType);

        auto mismatched = ValueFromJson(nlohmann::json{{"type", "double"}, {"value", "text"}});
        REQUIRE_FALSE(mismatched.has_value());
        CHECK(mismatched.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("Custom converter registration") {
        RegisterValueConverterAs<Magnitude>(
                "Magnitude",
                [](Magnitude const& magnitude) { return nlohmann::json{{"value", magnitude.value}, {"band", magnitude.band}}; },
                [](nlohmann::json const& json) { return Magnitude{json.at("value").get<double>(), json.at("band").get<std::string>()}; });

        auto encoded = ValueToJson(Value{Magnitude{12.5, "V"}});
        REQUIRE(encoded.has_value());
        CHECK((*encoded)["type"] == "Magnitude");
        CHECK(DescribeValueType(Value{Magnitude{}}) == "Magnitude");

        auto decoded = ValueFromJson(*encoded);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->get<Magnitude>() != nullptr);
        CHECK(decoded->get<Magnitude>()->band == "V");
        CHECK(decoded->get<Magnitude>()->value == doctest::Approx(12.5));
    }

    TEST_CASE("Throwing raw converters become errors") {
        detail::RegisterValueConverter(
                std::type_index(typeid(Catalogue)),
                "Catalogue",
                [](Value const&) -> std::optional<nlohmann::json> { return nlohmann::json::object().at("code"); },
                [](nlohmann::json const& json) -> Expected<Value> { return Value{Catalogue{json.at("code").get<std::string>()}}; });

        auto encoded = ValueToJson(Value{Catalogue{"HD"}});
        REQUIRE_FALSE(encoded.has_value());
        CHECK(encoded.error().code == Error::Code::UnserializableType);

        auto decoded = ValueFromJson(nlohmann::json{{"type", "Catalogue"}, {"value", nlohmann::json::object()}});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
}
