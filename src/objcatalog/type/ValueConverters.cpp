#include "ValueConverters.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace OC {

namespace {

using Json = nlohmann::json;

struct ConverterEntry {
    detail::ValueToJsonFn   toJson;
    detail::ValueFromJsonFn fromJson;
    std::string             typeName;
};

phmap::flat_hash_map<std::type_index, ConverterEntry> gConverters;
phmap::flat_hash_map<std::string, std::type_index>    gTypesByName;
std::mutex                                            gConverterMutex;
std::once_flag                                        gDefaultConvertersFlag;

void registerDefaultConverters() {
    std::call_once(gDefaultConvertersFlag, [] {
        RegisterValueConverterAs<bool>("bool");
        RegisterValueConverterAs<std::int8_t>("int8_t");
        RegisterValueConverterAs<std::uint8_t>("uint8_t");
        RegisterValueConverterAs<std::int16_t>("int16_t");
        RegisterValueConverterAs<std::uint16_t>("uint16_t");
        RegisterValueConverterAs<std::int32_t>("int32_t");
        RegisterValueConverterAs<std::uint32_t>("uint32_t");
        RegisterValueConverterAs<std::int64_t>("int64_t");
        RegisterValueConverterAs<std::uint64_t>("uint64_t");
        RegisterValueConverterAs<float>("float");
        RegisterValueConverterAs<double>("double");
        RegisterValueConverterAs<std::string>("std::string");
        RegisterValueConverterAs<std::vector<double>>("std::vector<double>");
        RegisterValueConverterAs<std::vector<std::int64_t>>("std::vector<int64_t>");
        RegisterValueConverterAs<std::vector<std::string>>("std::vector<std::string>");
    });
}

auto findEntry(std::type_index type) -> std::optional<ConverterEntry> {
    std::lock_guard<std::mutex> guard(gConverterMutex);
    if (auto it = gConverters.find(type); it != gConverters.end())
        return it->second;
    return std::nullopt;
}

} // namespace

namespace detail {

void RegisterValueConverter(std::type_index type, std::string_view typeName, ValueToJsonFn toJson, ValueFromJsonFn fromJson) {
    std::lock_guard<std::mutex> guard(gConverterMutex);
    gConverters[type] = ConverterEntry{.toJson = std::move(toJson), .fromJson = std::move(fromJson), .typeName = std::string(typeName)};
    gTypesByName.insert_or_assign(std::string(typeName), type);
}

auto DescribeRegisteredType(std::type_index type) -> std::string {
    std::lock_guard<std::mutex> guard(gConverterMutex);
    if (auto it = gConverters.find(type); it != gConverters.end())
        return it->second.typeName;
    return type.name();
}

} // namespace detail

auto ValueToJson(Value const& value) -> Expected<Json> {
    registerDefaultConverters();
    if (value.isNull())
        return Json{{"type", "null"}};

    auto entry = findEntry(std::type_index(*value.type()));
    if (!entry)
        return std::unexpected(Error{Error::Code::UnserializableType, "no converter registered for " + value.typeName()});
    std::optional<Json> encoded;
    try {
        encoded = entry->toJson(value);
    } catch (Json::exception const& error) {
        return std::unexpected(Error{Error::Code::UnserializableType, "converter for " + entry->typeName + " failed: " + error.what()});
    }
    if (!encoded)
        return std::unexpected(Error{Error::Code::UnserializableType, "converter for " + entry->typeName + " rejected value"});
    return Json{{"type", entry->typeName}, {"value", std::move(*encoded)}};
}

auto ValueFromJson(Json const& json) -> Expected<Value> {
    registerDefaultConverters();
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, "encoded value lacks a type name"});

    auto const typeName = json["type"].get<std::string>();
    if (typeName == "null")
        return Value{};
    if (!json.contains("value"))
        return std::unexpected(Error{Error::Code::MalformedInput, "encoded " + typeName + " lacks a value"});

    std::optional<ConverterEntry> entry;
    {
        std::lock_guard<std::mutex> guard(gConverterMutex);
        if (auto it = gTypesByName.find(typeName); it != gTypesByName.end())
            if (auto converter = gConverters.find(it->second); converter != gConverters.end())
                entry = converter->second;
    }
    if (!entry)
        return std::unexpected(Error{Error::Code::UnserializableType, "no converter registered under " + typeName});
    try {
        return entry->fromJson(json["value"]);
    } catch (Json::exception const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput, "encoded " + typeName + ": " + error.what()});
    }
}

auto DescribeValueType(Value const& value) -> std::string {
    registerDefaultConverters();
    if (value.isNull())
        return "null";
    return detail::DescribeRegisteredType(std::type_index(*value.type()));
}

} // namespace OC
