#include "Snapshot.hpp"
#include "field/FieldNode.hpp"
#include "log/TaggedLogger.hpp"
#include "node/Catalog.hpp"
#include "node/Node.hpp"
#include "schema/StructuredFieldNode.hpp"
#include "type/ValueConverters.hpp"

#include <algorithm>

namespace OC {

namespace {

using Json = nlohmann::json;

auto malformed(std::string const& message) -> Error {
    return Error{Error::Code::MalformedInput, "snapshot: " + message};
}

auto saveField(Field const& field, StructuredFieldNode const* structured, SnapshotOptions const& options) -> Expected<Json> {
    Json entry{{"name", field.name()}, {"values", Json::array()}};
    auto recipe = structured ? structured->recipeValue(field.name()) : nullptr;

    std::size_t kept = 0;
    for (auto const& value : field.entries()) {
        if (value->isDerived()) {
            if (value == recipe) {
                entry["currentDerivedIndex"] = kept++;
                continue;
            }
            if (options.derived == DerivedPolicy::Fail)
                return std::unexpected(Error{Error::Code::UnserializableType,
                                             "Field " + field.name() + " holds a derived value that cannot be saved"});
            oc_log("Dropping derived value " + value->source().name() + " of Field " + field.name() + " from snapshot", "WARN");
            continue;
        }

        auto encoded = ValueToJson(value->observed()->value());
        if (!encoded)
            return std::unexpected(encoded.error());
        Json source = value->source().isNone() ? Json(nullptr) : Json(value->source().key());
        entry["values"].push_back(Json{{"source", std::move(source)}, {"value", std::move(*encoded)}});
        ++kept;
    }
    return entry;
}

auto saveNode(Node const& node, SnapshotOptions const& options) -> Expected<Json> {
    Json out;
    auto const* structured = dynamic_cast<StructuredFieldNode const*>(&node);
    auto const* container  = dynamic_cast<FieldNode const*>(&node);
    if (auto const* catalog = dynamic_cast<Catalog const*>(&node)) {
        out["kind"] = "Catalog";
        out["name"] = catalog->name();
    } else if (structured) {
        out["kind"] = "Structured";
        out["type"] = structured->typeName();
    } else if (container) {
        out["kind"] = "FieldNode";
    } else {
        out["kind"] = "Node";
    }

    if (container) {
        Json fields = Json::array();
        for (auto const& field : container->fields()) {
            auto saved = saveField(*field, structured, options);
            if (!saved)
                return std::unexpected(saved.error());
            fields.push_back(std::move(*saved));
        }
        out["fields"] = std::move(fields);
    }

    if (options.includeChildren) {
        Json children = Json::array();
        for (auto const& child : node.children()) {
            auto saved = saveNode(*child, options);
            if (!saved)
                return std::unexpected(saved.error());
            children.push_back(std::move(*saved));
        }
        out["children"] = std::move(children);
    }
    return out;
}

auto loadValues(Field& field, Json const& values) -> std::optional<Error> {
    if (!values.is_array())
        return malformed("values of " + field.name() + " must be an array");
    for (auto const& saved : values) {
        if (!saved.is_object() || !saved.contains("value"))
            return malformed("value entry of " + field.name() + " must be an object with a value");
        auto decoded = ValueFromJson(saved["value"]);
        if (!decoded)
            return decoded.error();

        auto const source = saved.value("source", Json(nullptr));
        if (!source.is_null() && !source.is_string())
            return malformed("source of " + field.name() + " must be a string or null");
        auto error = source.is_null() ? field.setDefault(*decoded) : field.set(Source{source.get<std::string>()}, *decoded);
        if (error)
            return error;
    }
    return std::nullopt;
}

auto loadStructuredField(StructuredFieldNode& node, Json const& saved) -> std::optional<Error> {
    auto const name = saved["name"].get<std::string>();
    auto       found = node.field(name);
    if (!found) {
        auto added = node.addField(name);
        if (!added)
            return added.error();
        found = std::move(added);
    }
    auto& field  = **found;
    auto  recipe = node.recipeValue(name);

    // Keep the recipe value aside, restore the observed values, then put it back in place.
    while (!field.empty())
        if (auto removed = field.remove(field.size() - 1); !removed)
            return removed.error();
    if (auto error = loadValues(field, saved.value("values", Json::array())))
        return error;
    if (recipe && saved.contains("currentDerivedIndex")) {
        auto const& index = saved["currentDerivedIndex"];
        if (!index.is_number_unsigned())
            return malformed("currentDerivedIndex of " + name + " must be an unsigned integer");
        if (auto error = field.insert(index.get<std::size_t>(), recipe))
            return error;
    }
    return std::nullopt;
}

auto loadNode(Json const& json) -> Expected<std::shared_ptr<Node>> {
    if (!json.is_object() || !json.contains("kind") || !json["kind"].is_string())
        return std::unexpected(malformed("node entry must be an object with a kind"));
    auto const kind = json["kind"].get<std::string>();

    std::shared_ptr<Node> node;
    if (kind == "Catalog") {
        node = Node::make<Catalog>(json.value("name", std::string{"default Catalog"}));
    } else if (kind == "Node") {
        node = Node::make<Node>();
    } else if (kind == "FieldNode") {
        node = Node::make<FieldNode>();
    } else if (kind == "Structured") {
        auto created = StructuredFieldNode::Create(json.value("type", std::string{}));
        if (!created)
            return std::unexpected(created.error());
        node = std::move(*created);
    } else {
        return std::unexpected(malformed("unknown node kind " + kind));
    }

    if (auto* structured = dynamic_cast<StructuredFieldNode*>(node.get())) {
        auto const fields = json.value("fields", Json::array());
        std::vector<std::string> names;
        for (auto const& saved : fields) {
            if (!saved.is_object() || !saved.contains("name") || !saved["name"].is_string())
                return std::unexpected(malformed("field entry must be an object with a name"));
            names.push_back(saved["name"].get<std::string>());
            if (auto error = loadStructuredField(*structured, saved))
                return std::unexpected(*error);
        }
        for (auto const& name : structured->fieldNames())
            if (std::find(names.begin(), names.end(), name) == names.end())
                if (auto removed = structured->delField(name); !removed)
                    return std::unexpected(removed.error());
    } else if (auto* container = dynamic_cast<FieldNode*>(node.get())) {
        for (auto const& saved : json.value("fields", Json::array())) {
            if (!saved.is_object() || !saved.contains("name") || !saved["name"].is_string())
                return std::unexpected(malformed("field entry must be an object with a name"));
            auto field = container->addField(saved["name"].get<std::string>());
            if (!field)
                return std::unexpected(field.error());
            if (auto error = loadValues(**field, saved.value("values", Json::array())))
                return std::unexpected(*error);
        }
    }

    for (auto const& child : json.value("children", Json::array())) {
        auto loaded = loadNode(child);
        if (!loaded)
            return std::unexpected(loaded.error());
        if (auto error = node->addChild(*loaded))
            return std::unexpected(*error);
    }
    return node;
}

} // namespace

auto Snapshot::save(Node const& node, SnapshotOptions const& options) -> Expected<nlohmann::json> {
    oc_log("Saving snapshot of " + node.label(), "INFO");
    return saveNode(node, options);
}

auto Snapshot::load(nlohmann::json const& json) -> Expected<std::shared_ptr<Node>> {
    try {
        return loadNode(json);
    } catch (nlohmann::json::exception const& error) {
        return std::unexpected(malformed(error.what()));
    }
}

auto Snapshot::dump(Node const& node, SnapshotOptions const& options, int indent) -> Expected<std::string> {
    auto json = save(node, options);
    if (!json)
        return std::unexpected(json.error());
    try {
        return json->dump(indent);
    } catch (nlohmann::json::exception const& error) {
        return std::unexpected(malformed(error.what()));
    }
}

auto Snapshot::parse(std::string_view text) -> Expected<std::shared_ptr<Node>> {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(malformed("invalid JSON"));
    return load(json);
}

} // namespace OC
