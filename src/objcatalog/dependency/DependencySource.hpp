#pragma once
#include "core/Error.hpp"
#include "type/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace OC {

class Field;
class Node;
struct FieldNotifier;

// A declared argument of a derived value: a Field directly, or a path to one.
using DependencyArg = std::variant<std::shared_ptr<Field>, std::string>;

/**
 * Argument list of a derived value.
 *
 * Each slot holds a weak reference to a Field and, when declared by path, the
 * path string. A path slot whose reference died (or was dropped because the
 * path node changed) is resolved again against the path node on the next
 * populateReferences. Every Field found that way gets the owner's notifier.
 */
class DependencySource {
public:
    struct Slot {
        std::optional<std::string> path;
        std::weak_ptr<Field>       field;
    };

    DependencySource(std::vector<DependencyArg> const& arguments, std::weak_ptr<FieldNotifier> notifier);

    [[nodiscard]] auto size() const -> std::size_t { return this->slots.size(); }
    [[nodiscard]] auto paths() const -> std::vector<std::optional<std::string>>;
    [[nodiscard]] auto slot(std::size_t index) const -> Slot const& { return this->slots.at(index); }
    // Live Field currently referenced by a slot, nullptr when dead or unresolved.
    [[nodiscard]] auto reference(std::size_t index) const -> std::shared_ptr<Field>;
    [[nodiscard]] auto isResolved() const -> bool;

    [[nodiscard]] auto pathNode() const -> std::shared_ptr<Node> { return this->origin.lock(); }
    // Changes the resolution origin and forgets every path-resolved reference.
    auto setPathNode(std::shared_ptr<Node> const& node) -> void;
    auto dropPathReferences() -> void;

    // Registers or withdraws the owner's notifier on every live reference.
    auto subscribe() -> void;
    auto unsubscribe() -> void;
    [[nodiscard]] auto isSubscribed() const -> bool { return this->listening; }

    /**
     * Resolves every dead slot. Fails with UnresolvedDependency carrying the
     * failing slot indices; slots that did resolve keep their new reference.
     */
    auto populateReferences() -> Expected<std::vector<std::shared_ptr<Field>>>;

    // Current value of every dependency in declaration order.
    auto dependencyValues() -> Expected<std::vector<Value>>;

private:
    std::vector<Slot>            slots;
    std::weak_ptr<Node>          origin;
    std::weak_ptr<FieldNotifier> notifier;
    bool                         listening = true;
};

} // namespace OC
