#pragma once
#include <string>

namespace OC {

class Node;

/**
 * Graphviz rendering of a catalog subtree.
 *
 * Nodes are emitted in pre-order with one edge from each parent to each child.
 * With graphFields, field containers are drawn as records listing the current
 * value of every field; otherwise as boxes. Other nodes use the default ellipse.
 */
class GraphExport {
public:
    [[nodiscard]] static auto isFieldContainer(Node const& node) -> bool;
    [[nodiscard]] static auto nodeShape(Node const& node, bool graphFields = true) -> std::string;
    [[nodiscard]] static auto toDot(Node& node, bool graphFields = true) -> std::string;
};

} // namespace OC
