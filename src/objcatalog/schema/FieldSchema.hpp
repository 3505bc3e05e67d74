#pragma once
#include "core/Error.hpp"
#include "field/FieldValue.hpp"
#include "source/Source.hpp"
#include "type/TypeConstraint.hpp"
#include "type/Value.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace OC {

// How a structured node builds a derived value for one of its fields.
struct DerivedRecipe {
    DerivedFunction          function;
    std::vector<std::string> dependencies;
    FailurePolicy            failurePolicy = FailurePolicy::Raise;
};

struct FieldDescriptor {
    static auto Named(std::string name) -> FieldDescriptor {
        FieldDescriptor descriptor;
        descriptor.name = std::move(name);
        return descriptor;
    }

    auto constrained(TypeConstraint value) -> FieldDescriptor& {
        constraint = std::move(value);
        return *this;
    }

    auto defaulting(Value value) -> FieldDescriptor& {
        defaultValue = std::move(value);
        return *this;
    }

    auto derivedBy(DerivedRecipe value) -> FieldDescriptor& {
        recipe = std::move(value);
        return *this;
    }

    std::string                   name;
    std::optional<TypeConstraint> constraint;
    Value                         defaultValue; // null: no default slot
    std::optional<DerivedRecipe>  recipe;
};

/**
 * Declared field layout of one structured node type.
 *
 * Descriptors keep their insertion order; adding a descriptor under an existing
 * name replaces it in place. A derived schema starts from a copy of its base.
 */
class FieldSchema {
public:
    explicit FieldSchema(std::string typeName)
        : name(std::move(typeName)) {}

    static auto Derive(FieldSchema const& base, std::string typeName) -> FieldSchema;

    auto add(FieldDescriptor descriptor) -> FieldSchema&;
    [[nodiscard]] auto find(std::string_view field) const -> FieldDescriptor const*;

    [[nodiscard]] auto typeName() const -> std::string const& { return this->name; }
    [[nodiscard]] auto descriptors() const -> std::vector<FieldDescriptor> const& { return this->fields; }
    [[nodiscard]] auto fieldNames() const -> std::vector<std::string>;

    // Every descriptor is named and every default satisfies its constraint.
    [[nodiscard]] auto validate() const -> std::optional<Error>;

private:
    std::string                  name;
    std::vector<FieldDescriptor> fields;
};

/**
 * Process-wide table of schemas by type name. Registering a type name again
 * replaces the previous schema; nodes already built keep the one they were
 * built from.
 */
class SchemaRegistry {
public:
    static auto instance() -> SchemaRegistry&;

    SchemaRegistry(SchemaRegistry const&)            = delete;
    SchemaRegistry& operator=(SchemaRegistry const&) = delete;

    auto registerSchema(FieldSchema schema) -> std::optional<Error>;
    [[nodiscard]] auto find(std::string_view typeName) const -> std::shared_ptr<FieldSchema const>;
    [[nodiscard]] auto contains(std::string_view typeName) const -> bool { return this->find(typeName) != nullptr; }
    auto unregisterSchema(std::string_view typeName) -> bool;

private:
    SchemaRegistry() = default;

    using Table = phmap::flat_hash_map<std::string, std::shared_ptr<FieldSchema const>, TransparentStringHash, std::equal_to<>>;

    mutable std::mutex mutex;
    Table              table;
};

} // namespace OC
