#include "FieldSchema.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace OC {

auto FieldSchema::Derive(FieldSchema const& base, std::string typeName) -> FieldSchema {
    FieldSchema derived{std::move(typeName)};
    derived.fields = base.fields;
    return derived;
}

auto FieldSchema::add(FieldDescriptor descriptor) -> FieldSchema& {
    auto it = std::find_if(this->fields.begin(), this->fields.end(), [&descriptor](auto const& existing) {
        return existing.name == descriptor.name;
    });
    if (it != this->fields.end())
        *it = std::move(descriptor);
    else
        this->fields.push_back(std::move(descriptor));
    return *this;
}

auto FieldSchema::find(std::string_view field) const -> FieldDescriptor const* {
    for (auto const& descriptor : this->fields)
        if (descriptor.name == field)
            return &descriptor;
    return nullptr;
}

auto FieldSchema::fieldNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(this->fields.size());
    for (auto const& descriptor : this->fields)
        names.push_back(descriptor.name);
    return names;
}

auto FieldSchema::validate() const -> std::optional<Error> {
    if (this->name.empty())
        return Error{Error::Code::MalformedInput, "schema without a type name"};
    for (auto const& descriptor : this->fields) {
        if (descriptor.name.empty())
            return Error{Error::Code::MalformedInput, "schema " + this->name + " has an unnamed field"};
        if (descriptor.constraint)
            if (auto error = descriptor.constraint->check(descriptor.defaultValue))
                return Error{Error::Code::TypeMismatch, "default of " + this->name + "." + descriptor.name + ": " + error->message.value_or("")};
        if (descriptor.recipe && !descriptor.recipe->function)
            return Error{Error::Code::MalformedInput, "recipe of " + this->name + "." + descriptor.name + " has no function"};
    }
    return std::nullopt;
}

auto SchemaRegistry::instance() -> SchemaRegistry& {
    static SchemaRegistry registry;
    return registry;
}

auto SchemaRegistry::registerSchema(FieldSchema schema) -> std::optional<Error> {
    if (auto error = schema.validate())
        return error;
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        name = schema.typeName();
    oc_log("Registering schema " + name, "INFO");
    this->table.insert_or_assign(std::move(name), std::make_shared<FieldSchema const>(std::move(schema)));
    return std::nullopt;
}

auto SchemaRegistry::find(std::string_view typeName) const -> std::shared_ptr<FieldSchema const> {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->table.find(typeName);
    return it == this->table.end() ? nullptr : it->second;
}

auto SchemaRegistry::unregisterSchema(std::string_view typeName) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->table.find(typeName);
    if (it == this->table.end())
        return false;
    this->table.erase(it);
    return true;
}

} // namespace OC
