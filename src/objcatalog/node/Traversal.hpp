#pragma once
#include <cstddef>
#include <functional>
#include <optional>

namespace OC {

class Node;

/**
 * Order in which a subtree is walked.
 *
 * RootAt(k) visits a node after its first k children; PreOrder and PostOrder
 * are RootAt(0) and RootAt(-1). Negative indices count from the end, -1 being
 * after every child. Indices past either end put the node last.
 *
 * RootAtFraction(f) scales f in [-1, 1] to the child count: f >= 0 maps to
 * trunc(f * n), f < 0 counts from the end over the n + 1 slots so that a
 * small negative fraction is post-order and -1 is pre-order.
 */
struct Traversal {
    enum struct Order {
        Pre = 0,
        Post,
        Level,
        RootIndex,
        RootFraction
    };

    static auto PreOrder() -> Traversal { return Traversal{Order::Pre}; }
    static auto PostOrder() -> Traversal { return Traversal{Order::Post}; }
    static auto LevelOrder() -> Traversal { return Traversal{Order::Level}; }
    static auto BreadthFirst() -> Traversal { return LevelOrder(); }
    static auto RootAt(int index) -> Traversal {
        Traversal traversal{Order::RootIndex};
        traversal.rootIndex = index;
        return traversal;
    }
    static auto RootAtFraction(double fraction) -> Traversal {
        Traversal traversal{Order::RootFraction};
        traversal.rootFraction = fraction < -1.0 ? -1.0 : (fraction > 1.0 ? 1.0 : fraction);
        return traversal;
    }

    // Position among childCount children at which the node itself is visited.
    [[nodiscard]] auto rootPosition(std::size_t childCount) const -> std::size_t;

    Order  order        = Order::Post;
    int    rootIndex    = 0;
    double rootFraction = 0.0;
};

/**
 * Filter applied by Node::traverse.
 * - predicate: nodes for which it returns false are not visited; their children still are
 * - sentinel: results equal to it are dropped from the output
 */
template <typename R>
struct VisitFilter {
    static auto Only(std::function<bool(Node const&)> predicate) -> VisitFilter {
        VisitFilter filter;
        filter.predicate = std::move(predicate);
        return filter;
    }
    static auto Dropping(R sentinel) -> VisitFilter {
        VisitFilter filter;
        filter.sentinel = std::move(sentinel);
        return filter;
    }

    std::function<bool(Node const&)> predicate;
    std::optional<R>                 sentinel;
};

} // namespace OC
