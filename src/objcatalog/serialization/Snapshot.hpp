#pragma once
#include "core/Error.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace OC {

class Node;

// What Snapshot::save does with derived values it cannot rebuild on load.
enum struct DerivedPolicy {
    Fail = 0, // UnserializableType
    Drop      // left out with a WARN diagnostic
};

struct SnapshotOptions {
    static auto Deep() -> SnapshotOptions { return SnapshotOptions{.includeChildren = true}; }
    static auto Shallow() -> SnapshotOptions { return SnapshotOptions{.includeChildren = false}; }

    auto withChildren(bool value) -> SnapshotOptions& {
        includeChildren = value;
        return *this;
    }

    auto onDerived(DerivedPolicy policy) -> SnapshotOptions& {
        derived = policy;
        return *this;
    }

    bool          includeChildren = true;
    DerivedPolicy derived         = DerivedPolicy::Fail;
};

/**
 * JSON snapshot of a node subtree.
 *
 * Structure:
 *   {
 *     "kind": "Node" | "Catalog" | "FieldNode" | "Structured",
 *     "name": <catalog name>,            (Catalog)
 *     "type": <schema type name>,        (Structured)
 *     "fields": [
 *       { "name": "...",
 *         "values": [ { "source": "X" | "X//code" | null, "value": {"type": ..., "value": ...} } ],
 *         "currentDerivedIndex": <index> (Structured, field with a recipe) }
 *     ],
 *     "children": [ ... ]
 *   }
 *
 * Notes:
 * - The parent is never part of a snapshot; load returns a detached node.
 * - A null source marks the default slot.
 * - Derived values of a structured node that come from its schema recipe are
 *   recorded by position and rebuilt from the recipe on load. Any other derived
 *   value is handled according to SnapshotOptions::derived.
 * - Field type constraints of plain FieldNodes are not recorded.
 */
class Snapshot {
public:
    static auto save(Node const& node, SnapshotOptions const& options = {}) -> Expected<nlohmann::json>;
    static auto load(nlohmann::json const& json) -> Expected<std::shared_ptr<Node>>;

    static auto dump(Node const& node, SnapshotOptions const& options = {}, int indent = 2) -> Expected<std::string>;
    static auto parse(std::string_view text) -> Expected<std::shared_ptr<Node>>;
};

} // namespace OC
