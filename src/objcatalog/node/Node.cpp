#include "Node.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <deque>

namespace OC {

auto Node::root() -> std::shared_ptr<Node> {
    auto current = this->shared_from_this();
    while (auto up = current->parent())
        current = std::move(up);
    return current;
}

auto Node::isAncestorOf(Node const& other) const -> bool {
    for (auto up = other.parent(); up; up = up->parent())
        if (up.get() == this)
            return true;
    return false;
}

auto Node::setParent(std::shared_ptr<Node> const& newParent) -> std::optional<Error> {
    auto oldParent = this->parent();
    if (oldParent == newParent)
        return std::nullopt;
    if (newParent && !this->acceptsParent())
        return Error{Error::Code::NotSupported, this->typeName() + " cannot have a parent"};
    if (newParent && (newParent.get() == this || this->isAncestorOf(*newParent)))
        return Error{Error::Code::Cycle, "cycle detected in graph assignment attempt"};

    auto self = this->weak_from_this().lock();
    if (!self)
        return Error{Error::Code::NotSupported, "node is not shared-owned; create it with Node::make"};

    if (oldParent)
        oldParent->removeChild(this);
    if (newParent)
        newParent->childList.push_back(self);
    this->parentNode = newParent;

    for (auto const& node : this->collect(Traversal::PreOrder()))
        node->onLocationChanged();
    return std::nullopt;
}

auto Node::detach() -> std::shared_ptr<Node> {
    auto self = this->weak_from_this().lock();
    if (auto error = this->setParent(nullptr))
        oc_log("detach failed: " + describeError(*error), "WARN");
    return self;
}

auto Node::addChild(std::shared_ptr<Node> const& child) -> std::optional<Error> {
    if (!child)
        return Error{Error::Code::MalformedInput, "null child"};
    return child->setParent(this->shared_from_this());
}

auto Node::child(std::size_t index) const -> Expected<std::shared_ptr<Node>> {
    if (index >= this->childList.size())
        return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                     "child index " + std::to_string(index) + " out of range for " + std::to_string(this->childList.size())});
    return this->childList[index];
}

auto Node::indexOf(Node const& child) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < this->childList.size(); ++i)
        if (this->childList[i].get() == &child)
            return i;
    return std::nullopt;
}

auto Node::removeChild(Node const* child) -> void {
    auto it = std::find_if(this->childList.begin(), this->childList.end(), [child](auto const& candidate) {
        return candidate.get() == child;
    });
    if (it != this->childList.end())
        this->childList.erase(it);
}

auto Node::reorderChildren(std::vector<std::size_t> const& permutation) -> std::optional<Error> {
    auto const count = this->childList.size();
    if (permutation.size() != count)
        return Error{Error::Code::MalformedInput,
                     "input sequence has " + std::to_string(permutation.size()) + " elements, expected " + std::to_string(count)};

    std::vector<bool> seen(count, false);
    ChildList         reordered;
    reordered.reserve(count);
    for (auto index : permutation) {
        if (index >= count)
            return Error{Error::Code::MalformedInput, "index " + std::to_string(index) + " out of range"};
        if (seen[index])
            return Error{Error::Code::MalformedInput, "input sequence repeats index " + std::to_string(index)};
        seen[index] = true;
        reordered.push_back(this->childList[index]);
    }
    this->childList = std::move(reordered);
    return std::nullopt;
}

auto Node::reorderChildren(ReverseOrder) -> void {
    std::reverse(this->childList.begin(), this->childList.end());
}

auto Node::reorderChildren(std::function<int(Node const&, Node const&)> const& compare) -> void {
    std::stable_sort(this->childList.begin(), this->childList.end(), [&compare](auto const& lhs, auto const& rhs) {
        return compare(*lhs, *rhs) < 0;
    });
}

auto Node::countNodes() const -> std::size_t {
    std::size_t total = 1;
    for (auto const& child : this->childList)
        total += child->countNodes();
    return total;
}

auto Node::collect(Traversal const& traversal) -> std::vector<std::shared_ptr<Node>> {
    std::vector<std::shared_ptr<Node>> out;
    if (traversal.order == Traversal::Order::Level) {
        std::deque<std::shared_ptr<Node>> queue{this->shared_from_this()};
        while (!queue.empty()) {
            auto node = std::move(queue.front());
            queue.pop_front();
            queue.insert(queue.end(), node->childList.begin(), node->childList.end());
            out.push_back(std::move(node));
        }
        return out;
    }
    this->collectInto(traversal, out);
    return out;
}

auto Node::collectInto(Traversal const& traversal, std::vector<std::shared_ptr<Node>>& out) -> void {
    auto const position = traversal.rootPosition(this->childList.size());
    for (std::size_t i = 0; i <= this->childList.size(); ++i) {
        if (i == position)
            out.push_back(this->shared_from_this());
        if (i < this->childList.size())
            this->childList[i]->collectInto(traversal, out);
    }
}

auto Node::forEach(Traversal const& traversal, std::function<void(Node&)> const& visit) -> void {
    for (auto const& node : this->collect(traversal))
        visit(*node);
}

} // namespace OC
