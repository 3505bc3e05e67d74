#pragma once
#include "core/Error.hpp"
#include "dependency/DependencySource.hpp"
#include "field/FieldNotifier.hpp"
#include "field/InvalidationScope.hpp"
#include "source/Source.hpp"
#include "type/TypeConstraint.hpp"
#include "type/Value.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace OC {

class Field;
class Node;

/**
 * What a derived value does when it cannot be computed:
 * - Raise: the read fails with the error
 * - Warn: a WARN diagnostic is logged, the read yields null, the value stays invalid
 * - Skip: the read yields null, the value stays invalid and retries on the next read
 * - Ignore: the read yields null and the null is cached as valid
 */
enum struct FailurePolicy {
    Raise = 0,
    Warn,
    Skip,
    Ignore
};

[[nodiscard]] auto failurePolicyToString(FailurePolicy policy) -> std::string_view;

struct DerivedOptions {
    static auto Raising() -> DerivedOptions { return DerivedOptions{.failurePolicy = FailurePolicy::Raise}; }
    static auto Warning() -> DerivedOptions { return DerivedOptions{.failurePolicy = FailurePolicy::Warn}; }
    static auto Skipping() -> DerivedOptions { return DerivedOptions{.failurePolicy = FailurePolicy::Skip}; }
    static auto Ignoring() -> DerivedOptions { return DerivedOptions{.failurePolicy = FailurePolicy::Ignore}; }

    auto onFailure(FailurePolicy policy) -> DerivedOptions& {
        failurePolicy = policy;
        return *this;
    }

    auto pathNode(std::shared_ptr<Node> node) -> DerivedOptions& {
        initialPathNode = std::move(node);
        return *this;
    }

    FailurePolicy         failurePolicy = FailurePolicy::Raise;
    std::shared_ptr<Node> initialPathNode;
};

using DerivedFunction = std::function<Expected<Value>(std::span<Value const>)>;

namespace detail {

template <typename T>
struct is_expected : std::false_type {};

template <typename T, typename E>
struct is_expected<std::expected<T, E>> : std::true_type {};

} // namespace detail

/**
 * Adapts a plain callable over typed arguments to a DerivedFunction.
 * Each argument is read with Value::as<Args>, so arithmetic arguments convert.
 * The callable may return R or Expected<R>.
 *
 *   auto plusOne = derive<int, int>([](int f) { return f + 1; });
 */
template <typename R, typename... Args, typename F>
auto derive(F&& function) -> DerivedFunction {
    return [fn = std::forward<F>(function)](std::span<Value const> arguments) -> Expected<Value> {
        if (arguments.size() != sizeof...(Args))
            return std::unexpected(Error{Error::Code::DerivationFailed,
                                         "expected " + std::to_string(sizeof...(Args)) + " arguments, got "
                                                 + std::to_string(arguments.size())});
        return [&]<std::size_t... I>(std::index_sequence<I...>) -> Expected<Value> {
            std::tuple<Expected<Args>...> converted{arguments[I].template as<Args>()...};
            std::optional<Error>          failure;
            ((failure || std::get<I>(converted) ? void() : void(failure = std::get<I>(converted).error())), ...);
            if (failure)
                return std::unexpected(*failure);
            using Result = std::invoke_result_t<std::decay_t<F> const&, Args...>;
            if constexpr (detail::is_expected<Result>::value) {
                auto result = fn(*std::get<I>(converted)...);
                if (!result)
                    return std::unexpected(result.error());
                return Value{static_cast<R>(std::move(*result))};
            } else {
                return Value{static_cast<R>(fn(*std::get<I>(converted)...))};
            }
        }(std::index_sequence_for<Args...>{});
    };
}

// Immutable literal tagged with its Source.
class ObservedValue {
public:
    ObservedValue(Value value, Source source)
        : literal(std::move(value)), origin(std::move(source)) {}

    [[nodiscard]] auto value() const -> Value const& { return this->literal; }
    [[nodiscard]] auto source() const -> Source const& { return this->origin; }

private:
    Value  literal;
    Source origin;
};

class FieldValue;

/**
 * Lazily computed value of a function over other Fields' current values.
 *
 * State:
 * - attached: set once the value is placed in a Field; it then belongs to that
 *   Field for as long as the Field lives
 * - resident: the value currently sits in its Field. Only a resident value
 *   listens to its dependencies and notifies its Field
 * - valid: the cached result is current; cleared by invalidate
 * - usable: cleared when the last computed result failed the owning Field's type
 *   constraint
 *
 * The value listens to every Field it depends on. Any change of their current
 * value invalidates it, which in turn notifies the listeners of its own Field.
 */
class DerivedValue {
public:
    DerivedValue(DerivedFunction function, std::vector<DependencyArg> const& dependencies, DerivedOptions const& options);

    DerivedValue(DerivedValue const&)            = delete;
    DerivedValue& operator=(DerivedValue const&) = delete;

    // Cached result, computing it when invalid. policy overrides the configured one for this read.
    auto value(std::optional<FailurePolicy> policy = std::nullopt) -> Expected<Value>;
    [[nodiscard]] auto source() const -> Source const& { return this->identity; }

    [[nodiscard]] auto isValid() const -> bool { return this->valid; }
    [[nodiscard]] auto isUsable() const -> bool { return this->usable; }
    [[nodiscard]] auto isAttached() const -> bool { return this->attached; }
    [[nodiscard]] auto isResident() const -> bool { return this->resident; }
    [[nodiscard]] auto field() const -> std::shared_ptr<Field> { return this->owner.lock(); }

    /**
     * Marks the value stale and re-fires the owning Field's notification with
     * this value as both old and new. Re-entering an invalidation already in
     * flight within scope fails with Cycle. A value that is not resident only
     * marks itself stale.
     */
    auto invalidate(InvalidationScope& scope) -> std::optional<Error>;
    auto invalidate() -> std::optional<Error>;

    [[nodiscard]] auto dependencies() -> DependencySource& { return this->inputs; }
    [[nodiscard]] auto dependencies() const -> DependencySource const& { return this->inputs; }
    [[nodiscard]] auto pathNode() const -> std::shared_ptr<Node> { return this->inputs.pathNode(); }
    auto setPathNode(std::shared_ptr<Node> const& node) -> void { this->inputs.setPathNode(node); }

    [[nodiscard]] auto options() const -> DerivedOptions const& { return this->config; }
    auto setFailurePolicy(FailurePolicy policy) -> void { this->config.failurePolicy = policy; }
    [[nodiscard]] auto lastFailure() const -> std::optional<Error> const& { return this->failure; }
    [[nodiscard]] auto function() const -> DerivedFunction const& { return this->compute; }

    auto describe() -> std::string;

private:
    friend class Field;
    friend class FieldValue;

    class Invalidator final : public FieldNotifier {
    public:
        explicit Invalidator(DerivedValue& owner)
            : owner(owner) {}
        auto notify(FieldValuePtr const&, FieldValuePtr const&, InvalidationScope& scope) -> std::optional<Error> override {
            return this->owner.invalidate(scope);
        }

    private:
        DerivedValue& owner;
    };

    auto attachTo(std::shared_ptr<Field> const& field) -> void;
    auto detach() -> void;
    auto fail(Error error, FailurePolicy policy) -> Expected<Value>;

    DerivedFunction                compute;
    DerivedOptions                 config;
    Source                         identity;
    std::shared_ptr<FieldNotifier> invalidator;
    DependencySource               inputs;
    Value                          cached;
    std::optional<Error>           failure;
    std::weak_ptr<Field>           owner;
    FieldValue*                    holder    = nullptr;
    bool                           valid     = false;
    bool                           usable    = true;
    bool                           attached  = false;
    bool                           resident  = false;
    bool                           computing = false;
};

/**
 * The element stored in a Field: an ObservedValue or a DerivedValue behind the
 * same value()/source() contract. Always handled through FieldValuePtr.
 */
class FieldValue : public std::enable_shared_from_this<FieldValue> {
public:
    template <typename T, typename... Args>
    explicit FieldValue(std::in_place_type_t<T> tag, Args&&... args)
        : data(tag, std::forward<Args>(args)...) {}

    FieldValue(FieldValue const&)            = delete;
    FieldValue& operator=(FieldValue const&) = delete;

    static auto Observed(Value value, Source source) -> FieldValuePtr;
    static auto Observed(Value value, std::string_view source) -> FieldValuePtr;
    static auto Derived(DerivedFunction function, std::vector<DependencyArg> const& dependencies, DerivedOptions const& options = {})
            -> FieldValuePtr;

    auto value(std::optional<FailurePolicy> policy = std::nullopt) -> Expected<Value>;
    [[nodiscard]] auto source() const -> Source const&;

    [[nodiscard]] auto isObserved() const -> bool { return std::holds_alternative<ObservedValue>(this->data); }
    [[nodiscard]] auto isDerived() const -> bool { return std::holds_alternative<DerivedValue>(this->data); }
    [[nodiscard]] auto observed() const -> ObservedValue const* { return std::get_if<ObservedValue>(&this->data); }
    [[nodiscard]] auto derived() -> DerivedValue* { return std::get_if<DerivedValue>(&this->data); }
    [[nodiscard]] auto derived() const -> DerivedValue const* { return std::get_if<DerivedValue>(&this->data); }

    // Checks the value against a constraint. Derived values are computed without raising.
    auto checkType(TypeConstraint const& constraint) -> std::optional<Error>;

    auto describe() -> std::string;

private:
    std::variant<ObservedValue, DerivedValue> data;
};

} // namespace OC
