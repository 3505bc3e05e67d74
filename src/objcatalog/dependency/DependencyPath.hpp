#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace OC {

class Field;
class Node;

/**
 * Location of a Field relative to a node of the catalog tree.
 *
 * Grammar: segments separated by '/', the last one names the field. Every other
 * segment moves the cursor:
 * - "^"      the parent
 * - "^name"  the nearest ancestor matching name (searching from the parent up)
 * - "."      the first child
 * - "k"      the child at position k
 * - "name"   the first child matching name
 * A leading '/' starts at the root of the tree instead of the origin node.
 *
 *   "^/parallax"            field parallax of the parent
 *   "^Catalog/0/./redshift"  first child of the first child of the catalog
 */
class DependencyPath {
public:
    struct Step {
        enum struct Kind {
            Parent = 0,
            Ancestor,
            FirstChild,
            ChildIndex,
            ChildNamed
        };

        Kind        kind  = Kind::Parent;
        std::string name;
        std::size_t index = 0;
    };

    static auto Parse(std::string_view text) -> Expected<DependencyPath>;

    // Walks the steps from origin and returns the named Field of the node reached.
    [[nodiscard]] auto resolve(Node const& origin) const -> Expected<std::shared_ptr<Field>>;
    // Node reached by the steps, before the field lookup.
    [[nodiscard]] auto locate(Node const& origin) const -> Expected<std::shared_ptr<Node>>;

    [[nodiscard]] auto steps() const -> std::vector<Step> const& { return this->route; }
    [[nodiscard]] auto fieldName() const -> std::string const& { return this->field; }
    [[nodiscard]] auto anchored() const -> bool { return this->fromRoot; }
    [[nodiscard]] auto str() const -> std::string const& { return this->text; }

private:
    std::string       text;
    std::vector<Step> route;
    std::string       field;
    bool              fromRoot = false;
};

} // namespace OC
