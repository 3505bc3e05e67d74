#pragma once
#include "core/Error.hpp"
#include "node/Traversal.hpp"
#include "type/Value.hpp"

#include <typeinfo>
#include <vector>

namespace OC {

// How FieldNode::value treats a field that exists but holds no value.
enum struct LookupMode {
    Lenient = 0, // null Value
    Strict       // EmptyField
};

// What extractAcrossTree does with a node lacking the field (or its value).
enum struct MissingPolicy {
    Fail = 0,
    Skip,
    Null
};

struct ExtractOptions {
    static auto Failing() -> ExtractOptions { return ExtractOptions{.missing = MissingPolicy::Fail}; }
    static auto Skipping() -> ExtractOptions { return ExtractOptions{.missing = MissingPolicy::Skip}; }
    static auto NullFilled() -> ExtractOptions { return ExtractOptions{.missing = MissingPolicy::Null}; }

    auto order(Traversal value) -> ExtractOptions& {
        traversal = value;
        return *this;
    }

    auto onMissing(MissingPolicy policy) -> ExtractOptions& {
        missing = policy;
        return *this;
    }

    template <typename T>
    auto elementsOf() -> ExtractOptions& {
        elementType = &typeid(StoredType<T>);
        return *this;
    }

    Traversal             traversal   = Traversal::PostOrder();
    MissingPolicy         missing     = MissingPolicy::Fail;
    std::type_info const* elementType = nullptr;
};

/**
 * Values of one field gathered across a subtree, in traversal order.
 * elementType is the explicit one from ExtractOptions, else the concrete type
 * of the first field constraint met, else the common type of the non-null
 * values; nullptr when none of these exists.
 */
struct FieldColumn {
    std::type_info const* elementType = nullptr;
    std::vector<Value>    values;

    [[nodiscard]] auto size() const -> std::size_t { return this->values.size(); }

    // Converts every value with Value::as<T>. Null entries fail with EmptyField.
    template <typename T>
    auto as() const -> Expected<std::vector<T>> {
        std::vector<T> out;
        out.reserve(this->values.size());
        for (auto const& value : this->values) {
            auto converted = value.template as<T>();
            if (!converted)
                return std::unexpected(converted.error());
            out.push_back(std::move(*converted));
        }
        return out;
    }
};

} // namespace OC
