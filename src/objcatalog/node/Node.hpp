#pragma once
#include "core/Error.hpp"
#include "node/Traversal.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace OC {

struct ReverseOrder {};
inline constexpr ReverseOrder Reverse{};

/**
 * Element of a catalog tree.
 *
 * Structure:
 * - children: owned, ordered
 * - parent: non-owning; an expired or empty parent means the node is a root
 *
 * Notes:
 * - Nodes are always shared-owned. Create them with Node::make or Node::makeChild.
 * - Invariant: no node is its own ancestor. setParent rejects any move that would
 *   close a loop and leaves the tree untouched.
 * - Moving a subtree calls onLocationChanged on every node in it so that
 *   location-dependent state (path-resolved dependencies) can be refreshed.
 */
class Node : public std::enable_shared_from_this<Node> {
public:
    using ChildList = std::vector<std::shared_ptr<Node>>;

    Node()          = default;
    virtual ~Node() = default;

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;

    template <typename T, typename... Args>
    static auto make(Args&&... args) -> std::shared_ptr<T> {
        static_assert(std::is_base_of_v<Node, T>, "Node::make requires a Node type");
        auto node = std::make_shared<T>(std::forward<Args>(args)...);
        static_cast<Node*>(node.get())->initialize();
        return node;
    }

    template <typename T, typename... Args>
    static auto makeChild(std::shared_ptr<Node> const& parent, Args&&... args) -> Expected<std::shared_ptr<T>> {
        auto node = make<T>(std::forward<Args>(args)...);
        if (auto error = node->setParent(parent))
            return std::unexpected(*error);
        return node;
    }

    // ########### Structure ###########
    [[nodiscard]] auto parent() const -> std::shared_ptr<Node> { return this->parentNode.lock(); }
    [[nodiscard]] auto isRoot() const -> bool { return this->parentNode.expired(); }
    [[nodiscard]] auto root() -> std::shared_ptr<Node>;

    /**
     * Moves this node under newParent, appending it after the existing
     * children. nullptr detaches it.
     * Fails with Cycle when newParent is this node or one of its descendants and
     * with NotSupported when this node never takes a parent.
     */
    auto setParent(std::shared_ptr<Node> const& newParent) -> std::optional<Error>;
    // Orphans this subtree; the caller keeps ownership through its own handle.
    auto detach() -> std::shared_ptr<Node>;
    auto addChild(std::shared_ptr<Node> const& child) -> std::optional<Error>;

    [[nodiscard]] auto children() const -> std::span<std::shared_ptr<Node> const> { return this->childList; }
    [[nodiscard]] auto childCount() const -> std::size_t { return this->childList.size(); }
    [[nodiscard]] auto child(std::size_t index) const -> Expected<std::shared_ptr<Node>>;
    [[nodiscard]] auto indexOf(Node const& child) const -> std::optional<std::size_t>;
    [[nodiscard]] auto isAncestorOf(Node const& other) const -> bool;

    /**
     * Reorders the children. A permutation must name every current index
     * exactly once; otherwise nothing changes and MalformedInput is returned.
     * A comparator returns <0 when its first argument sorts first; the sort
     * is stable.
     */
    auto reorderChildren(std::vector<std::size_t> const& permutation) -> std::optional<Error>;
    auto reorderChildren(ReverseOrder) -> void;
    auto reorderChildren(std::function<int(Node const&, Node const&)> const& compare) -> void;

    // 1 + the count of every child subtree.
    [[nodiscard]] auto countNodes() const -> std::size_t;

    // ########### Traversal ###########
    [[nodiscard]] auto collect(Traversal const& traversal = Traversal::PostOrder()) -> std::vector<std::shared_ptr<Node>>;

    auto forEach(Traversal const& traversal, std::function<void(Node&)> const& visit) -> void;

    template <typename Visit, typename R = std::invoke_result_t<Visit&, Node&>>
    auto traverse(Traversal const& traversal, Visit&& visit, VisitFilter<R> const& filter = {}) -> std::vector<R> {
        std::vector<R> results;
        for (auto const& node : this->collect(traversal)) {
            if (filter.predicate && !filter.predicate(*node))
                continue;
            R result = visit(*node);
            if (filter.sentinel && result == *filter.sentinel)
                continue;
            results.push_back(std::move(result));
        }
        return results;
    }

    // ########### Identity ###########
    [[nodiscard]] virtual auto typeName() const -> std::string { return "Node"; }
    // Used by dependency paths to find ancestors and children by name.
    [[nodiscard]] virtual auto matchesName(std::string_view name) const -> bool { return name == this->typeName(); }
    [[nodiscard]] virtual auto label() const -> std::string { return this->typeName(); }
    [[nodiscard]] virtual auto acceptsParent() const -> bool { return true; }

protected:
    // Runs once, right after construction through make().
    virtual auto initialize() -> void {}
    // Runs on every node of a subtree after the subtree moved.
    virtual auto onLocationChanged() -> void {}

private:
    auto collectInto(Traversal const& traversal, std::vector<std::shared_ptr<Node>>& out) -> void;
    auto removeChild(Node const* child) -> void;

    ChildList          childList;
    std::weak_ptr<Node> parentNode;
};

} // namespace OC
