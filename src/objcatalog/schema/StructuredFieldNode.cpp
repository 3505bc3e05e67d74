#include "StructuredFieldNode.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace OC {

auto StructuredFieldNode::Create(std::string_view typeName, std::shared_ptr<Node> const& parent)
        -> Expected<std::shared_ptr<StructuredFieldNode>> {
    auto schema = SchemaRegistry::instance().find(typeName);
    if (!schema)
        return std::unexpected(Error{Error::Code::NotSupported, "no schema registered for " + std::string{typeName}});
    if (!parent)
        return Node::make<StructuredFieldNode>(std::move(schema));
    return Node::makeChild<StructuredFieldNode>(parent, std::move(schema));
}

auto StructuredFieldNode::initialize() -> void {
    this->building = true;
    for (auto const& descriptor : this->layout->descriptors()) {
        auto field = this->build(descriptor);
        if (!field) {
            oc_log("Building " + this->layout->typeName() + "." + descriptor.name + " failed: " + describeError(field.error()), "WARN");
            continue;
        }
        if (auto error = this->addField(*field))
            oc_log("Adding " + this->layout->typeName() + "." + descriptor.name + " failed: " + describeError(*error), "WARN");
    }
    this->building = false;
    this->altered  = false;
}

auto StructuredFieldNode::build(FieldDescriptor const& descriptor) -> Expected<std::shared_ptr<Field>> {
    auto field = Field::Create(descriptor.name, descriptor.constraint);
    if (!descriptor.defaultValue.isNull())
        if (auto error = field->setDefault(descriptor.defaultValue))
            return std::unexpected(*error);
    if (descriptor.recipe) {
        std::vector<DependencyArg> dependencies(descriptor.recipe->dependencies.begin(), descriptor.recipe->dependencies.end());
        auto derived = FieldValue::Derived(descriptor.recipe->function, dependencies,
                                           DerivedOptions{}.onFailure(descriptor.recipe->failurePolicy));
        if (auto error = field->insert(0, derived))
            return std::unexpected(*error);
    }
    return field;
}

auto StructuredFieldNode::onFieldsChanged() -> void {
    if (!this->building)
        this->altered = true;
}

auto StructuredFieldNode::revert() -> std::optional<Error> {
    auto const expected = this->layout->fieldNames();

    for (auto const& name : this->fieldNames())
        if (std::find(expected.begin(), expected.end(), name) == expected.end())
            if (auto removed = this->delField(name); !removed)
                return removed.error();

    this->building = true;
    for (auto const& descriptor : this->layout->descriptors()) {
        if (this->contains(descriptor.name))
            continue;
        auto field = this->build(descriptor);
        if (!field) {
            this->building = false;
            return field.error();
        }
        if (auto error = this->addField(*field)) {
            this->building = false;
            return error;
        }
    }
    this->building = false;

    std::stable_sort(this->fieldList.begin(), this->fieldList.end(), [&expected](auto const& lhs, auto const& rhs) {
        return std::find(expected.begin(), expected.end(), lhs->name()) < std::find(expected.begin(), expected.end(), rhs->name());
    });
    this->altered = false;
    return std::nullopt;
}

auto StructuredFieldNode::recipeValue(std::string_view field) const -> FieldValuePtr {
    auto const* descriptor = this->layout->find(field);
    if (!descriptor || !descriptor->recipe)
        return nullptr;
    auto found = this->field(field);
    if (!found)
        return nullptr;
    auto derived = (*found)->derived();
    return derived.empty() ? nullptr : derived.front();
}

} // namespace OC
