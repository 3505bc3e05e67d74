#pragma once

#include "core/Error.hpp"
#include "type/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <nlohmann/json.hpp>

namespace OC {

namespace detail {

using ValueToJsonFn   = std::function<std::optional<nlohmann::json>(Value const&)>;
using ValueFromJsonFn = std::function<Expected<Value>(nlohmann::json const&)>;

void RegisterValueConverter(std::type_index type, std::string_view typeName, ValueToJsonFn toJson, ValueFromJsonFn fromJson);

auto DescribeRegisteredType(std::type_index type) -> std::string;

} // namespace detail

/**
 * Registers the JSON conversion used by snapshots for values of type T.
 * typeName is the stable name written into snapshots and used to find the
 * reverse conversion, so it must be unique across registrations.
 */
template <typename T, typename ToJson, typename FromJson>
auto RegisterValueConverterAs(std::string_view typeName, ToJson&& toJson, FromJson&& fromJson) -> void {
    detail::RegisterValueConverter(
            std::type_index(typeid(T)),
            typeName,
            [fn = std::forward<ToJson>(toJson)](Value const& value) -> std::optional<nlohmann::json> {
                auto const* typed = value.get<T>();
                if (!typed)
                    return std::nullopt;
                return fn(*typed);
            },
            [fn = std::forward<FromJson>(fromJson)](nlohmann::json const& json) -> Expected<Value> {
                try {
                    return Value{fn(json)};
                } catch (nlohmann::json::exception const& ex) {
                    return std::unexpected(Error{Error::Code::MalformedInput, ex.what()});
                }
            });
}

// Uses nlohmann's own conversions for T in both directions.
template <typename T>
auto RegisterValueConverterAs(std::string_view typeName) -> void {
    RegisterValueConverterAs<T>(
            typeName,
            [](T const& value) { return nlohmann::json(value); },
            [](nlohmann::json const& json) { return json.get<T>(); });
}

/**
 * Encodes a value as {"type": <registered name>, "value": <json>}. A null value
 * encodes as {"type": "null"}. Unregistered types fail with UnserializableType.
 */
auto ValueToJson(Value const& value) -> Expected<nlohmann::json>;

auto ValueFromJson(nlohmann::json const& json) -> Expected<Value>;

// Registered name of a value's type, or the compiler's name when unregistered.
auto DescribeValueType(Value const& value) -> std::string;

} // namespace OC
