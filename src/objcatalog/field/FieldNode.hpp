#pragma once
#include "core/Error.hpp"
#include "field/ExtractOptions.hpp"
#include "field/Field.hpp"
#include "node/Node.hpp"
#include "source/Source.hpp"
#include "type/TypeConstraint.hpp"
#include "type/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace OC {

/**
 * A Node owning an ordered set of uniquely named Fields.
 *
 * Notes:
 * - A Field belongs to at most one FieldNode; addField rejects a field that is
 *   owned elsewhere or whose name is taken.
 * - The node is the path node of every derived value its fields hold, so
 *   dependency paths resolve relative to it. Moving the node drops every
 *   path-resolved reference and invalidates those values.
 * - A FieldNode matches a name in dependency paths when the name is its type
 *   name or the current value of its "name" field.
 */
class FieldNode : public Node {
public:
    FieldNode() = default;
    ~FieldNode() override;

    // ########### Field set ###########
    auto addField(std::shared_ptr<Field> const& field) -> std::optional<Error>;
    // Creates an empty Field and adds it.
    auto addField(std::string name, std::optional<TypeConstraint> constraint = std::nullopt) -> Expected<std::shared_ptr<Field>>;
    // Detaches and returns the named Field.
    auto delField(std::string_view name) -> Expected<std::shared_ptr<Field>>;

    [[nodiscard]] auto field(std::string_view name) const -> Expected<std::shared_ptr<Field>>;
    [[nodiscard]] auto field(std::size_t index) const -> Expected<std::shared_ptr<Field>>;
    [[nodiscard]] auto fields() const -> std::vector<std::shared_ptr<Field>> const& { return this->fieldList; }
    [[nodiscard]] auto fieldNames() const -> std::vector<std::string>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return this->fieldList.size(); }

    // ########### Values ###########
    auto value(std::string_view name, LookupMode mode = LookupMode::Lenient) const -> Expected<Value>;
    auto value(std::size_t index, LookupMode mode = LookupMode::Lenient) const -> Expected<Value>;
    // Current value of every field in order; fields without a readable value give null.
    auto currentValues() const -> std::vector<Value>;

    auto setValue(std::string_view name, FieldValuePtr value) -> std::optional<Error>;
    auto setValue(std::size_t index, FieldValuePtr value) -> std::optional<Error>;
    auto setValue(std::string_view name, Value const& literal, Source const& source) -> std::optional<Error>;

    /**
     * Collects the current value of the named field on every node of this
     * subtree, in the order given by options.traversal. Nodes without the field,
     * and fields without a value, are handled according to options.missing.
     */
    auto extractAcrossTree(std::string_view name, ExtractOptions const& options = {}) -> Expected<FieldColumn>;

    template <typename T>
    auto extractAs(std::string_view name, ExtractOptions options = {}) -> Expected<std::vector<T>> {
        auto column = this->extractAcrossTree(name, options.template elementsOf<T>());
        if (!column)
            return std::unexpected(column.error());
        return column->template as<T>();
    }

    // ########### Identity ###########
    [[nodiscard]] auto typeName() const -> std::string override { return "FieldNode"; }
    [[nodiscard]] auto matchesName(std::string_view name) const -> bool override;
    [[nodiscard]] auto label() const -> std::string override;

    friend auto operator==(FieldNode const& lhs, FieldNode const& rhs) -> bool { return lhs.currentValues() == rhs.currentValues(); }

protected:
    auto onLocationChanged() -> void override;
    // Runs after addField or delField changed the field set.
    virtual auto onFieldsChanged() -> void {}
    // Drops path references and invalidates the derived values of one field.
    auto refreshDerived(Field& field) -> void;

    std::vector<std::shared_ptr<Field>> fieldList;
};

} // namespace OC
