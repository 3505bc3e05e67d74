#pragma once
#include "core/Error.hpp"
#include "field/FieldNotifier.hpp"
#include "field/FieldValue.hpp"
#include "field/InvalidationScope.hpp"
#include "source/Source.hpp"
#include "type/TypeConstraint.hpp"
#include "type/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace OC {

class FieldNode;

// Selects the nth DerivedValue of a Field, counting derived values only.
struct DerivedIndex {
    std::size_t index = 0;
};

// Whether an inserted value must carry a Source not yet present in the Field.
enum struct SourceCheck {
    Unique = 0,
    Bypass
};

/**
 * One attribute of a FieldNode: an ordered, source-keyed list of values.
 *
 * Invariants:
 * - index 0 is the current value
 * - at most one value per Source (unless inserted with SourceCheck::Bypass)
 * - every attached value satisfies the type constraint, except derived values,
 *   which are marked unusable instead
 *
 * Any change of the current value is announced to the registered notifiers
 * before it is committed. A notifier error aborts the change and leaves the
 * Field exactly as it was.
 */
class Field : public std::enable_shared_from_this<Field> {
public:
    explicit Field(std::string name, std::optional<TypeConstraint> constraint = std::nullopt);
    ~Field();

    Field(Field const&)            = delete;
    Field& operator=(Field const&) = delete;

    static auto Create(std::string name, std::optional<TypeConstraint> constraint = std::nullopt) -> std::shared_ptr<Field>;

    [[nodiscard]] auto name() const -> std::string const& { return this->fieldName; }
    [[nodiscard]] auto size() const -> std::size_t { return this->entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->entries_.empty(); }
    [[nodiscard]] auto node() const -> std::shared_ptr<FieldNode> { return this->container.lock(); }

    // ########### Type constraint ###########
    [[nodiscard]] auto constraint() const -> std::optional<TypeConstraint> const& { return this->typeConstraint; }
    // Re-validates every observed value first; on a mismatch nothing changes.
    auto setConstraint(std::optional<TypeConstraint> constraint) -> std::optional<Error>;

    // ########### Lookup ###########
    [[nodiscard]] auto at(std::size_t index) const -> Expected<FieldValuePtr>;
    [[nodiscard]] auto at(Source const& source) const -> Expected<FieldValuePtr>;
    // "derived" / "derivedN" select derived values; any other string names a Source.
    [[nodiscard]] auto at(std::string_view key) const -> Expected<FieldValuePtr>;
    [[nodiscard]] auto at(DerivedIndex selector) const -> Expected<FieldValuePtr>;

    [[nodiscard]] auto contains(Source const& source) const -> bool { return this->indexOf(source).has_value(); }
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return this->at(key).has_value(); }
    [[nodiscard]] auto indexOf(Source const& source) const -> std::optional<std::size_t>;
    [[nodiscard]] auto indexOf(FieldValue const& value) const -> std::optional<std::size_t>;

    // ########### Mutation ###########
    /**
     * Replaces an existing slot. The incoming value must carry the slot's
     * Source. Writing index 0 notifies (old, new) first.
     */
    auto set(std::size_t index, FieldValuePtr value) -> std::optional<Error>;
    // Same as above, keeping the slot's Source.
    auto set(std::size_t index, Value const& literal) -> std::optional<Error>;
    // Replaces the slot of source, or appends value when the source is new.
    auto set(Source const& source, FieldValuePtr value) -> std::optional<Error>;
    // Replaces or appends an ObservedValue(literal, source).
    auto set(Source const& source, Value const& literal) -> std::optional<Error>;
    auto set(std::string_view source, Value const& literal) -> std::optional<Error>;

    // Removing index 0 notifies (removed, promoted or null) first.
    auto remove(std::size_t index) -> Expected<FieldValuePtr>;
    auto remove(Source const& source) -> Expected<FieldValuePtr>;
    auto remove(std::string_view key) -> Expected<FieldValuePtr>;

    // Inserts before position (clamped to size()). Inserting at 0 notifies (old current or null, new).
    auto insert(std::size_t position, FieldValuePtr value, SourceCheck check = SourceCheck::Unique) -> std::optional<Error>;
    auto append(FieldValuePtr value) -> std::optional<Error> { return this->insert(this->size(), std::move(value)); }

    // ########### Current value ###########
    [[nodiscard]] auto current() const -> Expected<FieldValuePtr>;
    // Value at index 0; EmptyField when there is none.
    auto currentValue() const -> Expected<Value>;
    /**
     * Makes value current. A value already in the Field is moved to the front;
     * a new one is validated and inserted at the front.
     */
    auto setCurrent(FieldValuePtr value) -> std::optional<Error>;
    // Moves the slot of source to the front; NoSuchSource if absent.
    auto setCurrent(Source const& source) -> std::optional<Error>;
    // Stores literal under source (replacing that source's slot) and makes it current.
    auto setCurrent(Value const& literal, Source const& source) -> std::optional<Error>;

    // ########### Default slot ###########
    auto setDefault(Value const& literal) -> std::optional<Error>;
    [[nodiscard]] auto defaultValue() const -> Expected<Value>;
    auto clearDefault() -> std::optional<Error>;
    [[nodiscard]] auto hasDefault() const -> bool { return this->contains(Source::None()); }

    // ########### Notification ###########
    // Notifiers are held weakly and called in registration order; dead ones are pruned on the next round.
    auto registerNotifier(std::shared_ptr<FieldNotifier> const& notifier) -> void;
    auto unregisterNotifier(std::shared_ptr<FieldNotifier> const& notifier) -> void;
    auto notifyValueChange(FieldValuePtr const& oldValue, FieldValuePtr const& newValue) -> std::optional<Error>;
    auto notifyValueChange(FieldValuePtr const& oldValue, FieldValuePtr const& newValue, InvalidationScope& scope)
            -> std::optional<Error>;
    [[nodiscard]] auto notifierCount() const -> std::size_t { return this->notifiers.size(); }

    // ########### Views ###########
    [[nodiscard]] auto entries() const -> std::vector<FieldValuePtr> const& { return this->entries_; }
    auto values() const -> Expected<std::vector<Value>>;
    [[nodiscard]] auto sources() const -> std::vector<Source>;
    [[nodiscard]] auto sourceNames() const -> std::vector<std::string>;
    // Observed values other than the default.
    [[nodiscard]] auto observed() const -> std::vector<FieldValuePtr>;
    [[nodiscard]] auto derived() const -> std::vector<FieldValuePtr>;

    auto describe() const -> std::string;
    auto describeCurrent() const -> std::string;

private:
    friend class FieldNode;

    enum struct Notify {
        No = 0,
        Always
    };

    // Source expected of an incoming value replacing a slot, or uniqueness against other slots.
    struct Expectation {
        std::optional<Source>      source;
        std::optional<std::size_t> replacing;
        SourceCheck                check = SourceCheck::Unique;
    };

    auto validateIncoming(FieldValuePtr const& value, Expectation const& expectation) const -> std::optional<Error>;
    // Notifies when the current value changes, then swaps in next and attaches new derived values.
    auto commit(std::vector<FieldValuePtr> next, Notify notify) -> std::optional<Error>;
    auto attachDerived(FieldValuePtr const& value) -> void;
    auto setNode(std::shared_ptr<FieldNode> const& node) -> void;

    std::string                               fieldName;
    std::optional<TypeConstraint>             typeConstraint;
    std::vector<FieldValuePtr>                entries_;
    std::vector<std::weak_ptr<FieldNotifier>> notifiers;
    std::weak_ptr<FieldNode>                  container;
};

} // namespace OC
