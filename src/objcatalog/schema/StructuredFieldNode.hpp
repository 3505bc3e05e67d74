#pragma once
#include "core/Error.hpp"
#include "field/FieldNode.hpp"
#include "schema/FieldSchema.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace OC {

/**
 * FieldNode whose fields are laid out by a registered FieldSchema.
 *
 * Every descriptor becomes a Field with the declared constraint, a default slot
 * when a default is declared, and a derived value built from the recipe (placed
 * first, so it is current) when one is declared. Adding or deleting fields
 * afterwards marks the structure altered; revert restores the schema layout,
 * keeping the fields that are still part of it.
 */
class StructuredFieldNode : public FieldNode {
public:
    explicit StructuredFieldNode(std::shared_ptr<FieldSchema const> schema)
        : layout(std::move(schema)) {}

    // Builds a node of a registered type; NotSupported when the type is unknown.
    static auto Create(std::string_view typeName, std::shared_ptr<Node> const& parent = nullptr)
            -> Expected<std::shared_ptr<StructuredFieldNode>>;

    [[nodiscard]] auto schema() const -> std::shared_ptr<FieldSchema const> const& { return this->layout; }
    [[nodiscard]] auto alteredStructure() const -> bool { return this->altered; }
    auto revert() -> std::optional<Error>;

    // Derived value built from the recipe of a field, nullptr when the field has none.
    [[nodiscard]] auto recipeValue(std::string_view field) const -> FieldValuePtr;

    [[nodiscard]] auto typeName() const -> std::string override { return this->layout->typeName(); }

protected:
    auto initialize() -> void override;
    auto onFieldsChanged() -> void override;

private:
    auto build(FieldDescriptor const& descriptor) -> Expected<std::shared_ptr<Field>>;

    std::shared_ptr<FieldSchema const> layout;
    bool                               altered  = false;
    bool                               building = false;
};

} // namespace OC
