#include "FieldNode.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace OC {

FieldNode::~FieldNode() {
    for (auto const& field : this->fieldList)
        field->container.reset();
}

auto FieldNode::addField(std::shared_ptr<Field> const& field) -> std::optional<Error> {
    if (!field)
        return Error{Error::Code::MalformedInput, "null Field"};
    if (field->node())
        return Error{Error::Code::DuplicateOwnership, "Field " + field->name() + " already belongs to a FieldNode"};
    if (this->contains(field->name()))
        return Error{Error::Code::DuplicateOwnership, "Field " + field->name() + " already present"};
    auto self = std::dynamic_pointer_cast<FieldNode>(this->weak_from_this().lock());
    if (!self)
        return Error{Error::Code::NotSupported, "FieldNode is not shared-owned; create it with Node::make"};

    this->fieldList.push_back(field);
    field->setNode(self);
    this->refreshDerived(*field);
    this->onFieldsChanged();
    return std::nullopt;
}

auto FieldNode::addField(std::string name, std::optional<TypeConstraint> constraint) -> Expected<std::shared_ptr<Field>> {
    auto field = Field::Create(std::move(name), std::move(constraint));
    if (auto error = this->addField(field))
        return std::unexpected(*error);
    return field;
}

auto FieldNode::delField(std::string_view name) -> Expected<std::shared_ptr<Field>> {
    auto it = std::find_if(this->fieldList.begin(), this->fieldList.end(), [name](auto const& field) { return field->name() == name; });
    if (it == this->fieldList.end())
        return std::unexpected(Error{Error::Code::NoSuchField, "Field " + std::string{name} + " not present"});
    auto field = *it;
    this->fieldList.erase(it);
    field->setNode(nullptr);
    this->refreshDerived(*field);
    this->onFieldsChanged();
    return field;
}

auto FieldNode::field(std::string_view name) const -> Expected<std::shared_ptr<Field>> {
    for (auto const& field : this->fieldList)
        if (field->name() == name)
            return field;
    return std::unexpected(Error{Error::Code::NoSuchField, this->label() + " has no field " + std::string{name}});
}

auto FieldNode::field(std::size_t index) const -> Expected<std::shared_ptr<Field>> {
    if (index >= this->fieldList.size())
        return std::unexpected(Error{Error::Code::NoSuchField,
                                     "field index " + std::to_string(index) + " out of range for " + std::to_string(this->fieldList.size())});
    return this->fieldList[index];
}

auto FieldNode::fieldNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(this->fieldList.size());
    for (auto const& field : this->fieldList)
        names.push_back(field->name());
    return names;
}

auto FieldNode::contains(std::string_view name) const -> bool {
    return std::any_of(this->fieldList.begin(), this->fieldList.end(), [name](auto const& field) { return field->name() == name; });
}

namespace {

auto readCurrent(Field const& field, LookupMode mode) -> Expected<Value> {
    if (field.empty()) {
        if (mode == LookupMode::Strict)
            return std::unexpected(Error{Error::Code::EmptyField, "Field " + field.name() + " empty"});
        return Value{};
    }
    return field.currentValue();
}

} // namespace

auto FieldNode::value(std::string_view name, LookupMode mode) const -> Expected<Value> {
    auto found = this->field(name);
    if (!found)
        return std::unexpected(found.error());
    return readCurrent(**found, mode);
}

auto FieldNode::value(std::size_t index, LookupMode mode) const -> Expected<Value> {
    auto found = this->field(index);
    if (!found)
        return std::unexpected(found.error());
    return readCurrent(**found, mode);
}

auto FieldNode::currentValues() const -> std::vector<Value> {
    std::vector<Value> values;
    values.reserve(this->fieldList.size());
    for (auto const& field : this->fieldList)
        values.push_back(field->currentValue().value_or(Value{}));
    return values;
}

auto FieldNode::setValue(std::string_view name, FieldValuePtr value) -> std::optional<Error> {
    auto found = this->field(name);
    if (!found)
        return found.error();
    return (*found)->setCurrent(std::move(value));
}

auto FieldNode::setValue(std::size_t index, FieldValuePtr value) -> std::optional<Error> {
    auto found = this->field(index);
    if (!found)
        return found.error();
    return (*found)->setCurrent(std::move(value));
}

auto FieldNode::setValue(std::string_view name, Value const& literal, Source const& source) -> std::optional<Error> {
    auto found = this->field(name);
    if (!found)
        return found.error();
    return (*found)->setCurrent(literal, source);
}

auto FieldNode::extractAcrossTree(std::string_view name, ExtractOptions const& options) -> Expected<FieldColumn> {
    FieldColumn           column;
    std::type_info const* declared = options.elementType;

    for (auto const& node : this->collect(options.traversal)) {
        Expected<std::shared_ptr<Field>> found = std::unexpected(Error{Error::Code::NoSuchField, node->label() + " has no fields"});
        if (auto const* container = dynamic_cast<FieldNode const*>(node.get()))
            found = container->field(name);
        if (!found || (*found)->empty()) {
            switch (options.missing) {
            case MissingPolicy::Fail:
                if (!found)
                    return std::unexpected(found.error());
                return std::unexpected(Error{Error::Code::EmptyField, "Field " + std::string{name} + " of " + node->label() + " empty"});
            case MissingPolicy::Skip:
                continue;
            case MissingPolicy::Null:
                column.values.emplace_back();
                continue;
            }
        }

        if (!declared)
            if (auto const& constraint = (*found)->constraint())
                declared = constraint->concreteType();

        auto current = (*found)->currentValue();
        if (!current)
            return std::unexpected(current.error());
        if (current->isNull() && options.missing == MissingPolicy::Skip)
            continue;
        column.values.push_back(std::move(*current));
    }

    column.elementType = declared;
    if (!column.elementType) {
        for (auto const& value : column.values) {
            if (value.isNull())
                continue;
            if (!column.elementType) {
                column.elementType = value.type();
            } else if (*column.elementType != *value.type()) {
                column.elementType = nullptr;
                break;
            }
        }
    }
    return column;
}

auto FieldNode::matchesName(std::string_view name) const -> bool {
    if (name == this->typeName())
        return true;
    auto own = this->value("name");
    if (!own)
        return false;
    auto const* text = own->get<std::string>();
    return text && *text == name;
}

auto FieldNode::label() const -> std::string {
    std::string out = this->typeName() + " with fields [";
    for (std::size_t i = 0; i < this->fieldList.size(); ++i) {
        if (i > 0)
            out.append(", ");
        out.append(this->fieldList[i]->name());
    }
    out.push_back(']');
    return out;
}

auto FieldNode::onLocationChanged() -> void {
    auto self = this->weak_from_this().lock();
    for (auto const& field : this->fieldList) {
        for (auto const& entry : field->entries())
            if (auto* computed = entry->derived())
                computed->setPathNode(self);
        this->refreshDerived(*field);
    }
}

auto FieldNode::refreshDerived(Field& field) -> void {
    for (auto const& entry : field.derived()) {
        auto* computed = entry->derived();
        computed->dependencies().dropPathReferences();
        if (auto error = computed->invalidate())
            oc_log("Invalidating " + computed->source().name() + " of Field " + field.name() + " failed: " + describeError(*error), "WARN");
    }
}

} // namespace OC
