#include "GraphExport.hpp"
#include "field/FieldNode.hpp"
#include "node/Node.hpp"

#include <sstream>
#include <unordered_map>
#include <vector>

namespace OC {

namespace {

// Escapes characters that are structural inside a quoted record label.
auto escapeLabel(std::string const& text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"':
        case '\\':
        case '{':
        case '}':
        case '|':
        case '<':
        case '>':
            out.push_back('\\');
            [[fallthrough]];
        default:
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

auto GraphExport::isFieldContainer(Node const& node) -> bool {
    return dynamic_cast<FieldNode const*>(&node) != nullptr;
}

auto GraphExport::nodeShape(Node const& node, bool graphFields) -> std::string {
    if (!isFieldContainer(node))
        return "ellipse";
    return graphFields ? "record" : "box";
}

auto GraphExport::toDot(Node& node, bool graphFields) -> std::string {
    std::unordered_map<Node const*, std::string> ids;
    std::vector<std::string>                     edges;

    auto statements = node.traverse(Traversal::PreOrder(), [&](Node& visited) -> std::string {
        auto id = "n" + std::to_string(ids.size());
        ids.emplace(&visited, id);
        if (auto parent = visited.parent(); parent && ids.contains(parent.get()))
            edges.push_back("  " + ids[parent.get()] + " -> " + id + ";");

        std::string label = escapeLabel(visited.label());
        if (auto const* container = dynamic_cast<FieldNode const*>(&visited); container && graphFields) {
            std::string fields;
            for (auto const& field : container->fields()) {
                if (!fields.empty())
                    fields.push_back('|');
                fields.append(escapeLabel(field->describeCurrent()));
            }
            label = "{" + label + "| | " + fields + "}";
        }
        return "  " + id + " [shape=" + nodeShape(visited, graphFields) + ", label=\"" + label + "\"];";
    });

    std::ostringstream dot;
    dot << "digraph catalog {\n";
    for (auto const& statement : statements)
        dot << statement << '\n';
    for (auto const& edge : edges)
        dot << edge << '\n';
    dot << "}\n";
    return dot.str();
}

} // namespace OC
