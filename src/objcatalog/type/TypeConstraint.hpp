#pragma once
#include "core/Error.hpp"
#include "type/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>

namespace OC {

/**
 * Restriction on the values a Field accepts.
 *
 * Kinds:
 * - Of<T>: the stored type must be exactly T
 * - AnyOf<Ts...>: the stored type must be one of Ts
 * - ArrayOf<E>: a std::vector whose elements are E
 * - Numeric(): any arithmetic value other than bool
 * - Satisfying(description, predicate): an arbitrary check
 *
 * A null Value passes every constraint; absence is never a type error.
 */
class TypeConstraint {
public:
    enum struct Kind {
        Exact = 0,
        OneOf,
        ArrayElement,
        Predicate
    };

    using Predicate = std::function<bool(Value const&)>;

    template <typename T>
    static auto Of() -> TypeConstraint {
        TypeConstraint constraint{Kind::Exact};
        constraint.types.push_back(&typeid(StoredType<T>));
        constraint.description = typeid(StoredType<T>).name();
        return constraint;
    }

    template <typename... Ts>
    static auto AnyOf() -> TypeConstraint {
        TypeConstraint constraint{Kind::OneOf};
        (constraint.types.push_back(&typeid(StoredType<Ts>)), ...);
        constraint.description = "one of (";
        bool first             = true;
        for (auto const* type : constraint.types) {
            if (!first)
                constraint.description.append(", ");
            constraint.description.append(type->name());
            first = false;
        }
        constraint.description.push_back(')');
        return constraint;
    }

    template <typename E>
    static auto ArrayOf() -> TypeConstraint {
        TypeConstraint constraint{Kind::ArrayElement};
        constraint.types.push_back(&typeid(std::vector<E>));
        constraint.element     = &typeid(E);
        constraint.description = std::string{"array of "} + typeid(E).name();
        return constraint;
    }

    static auto Numeric() -> TypeConstraint;
    static auto Satisfying(std::string description, Predicate predicate) -> TypeConstraint;

    [[nodiscard]] auto check(Value const& value) const -> std::optional<Error>;
    [[nodiscard]] auto accepts(Value const& value) const -> bool { return !this->check(value).has_value(); }

    [[nodiscard]] auto kind() const -> Kind { return this->constraintKind; }
    [[nodiscard]] auto describe() const -> std::string const& { return this->description; }

    // The single concrete type a value must have, when the constraint names one.
    [[nodiscard]] auto concreteType() const -> std::type_info const*;
    [[nodiscard]] auto elementType() const -> std::type_info const* { return this->element; }

private:
    explicit TypeConstraint(Kind kind)
        : constraintKind(kind) {}

    Kind                               constraintKind;
    std::vector<std::type_info const*> types;
    std::type_info const*              element = nullptr;
    Predicate                          predicate;
    std::string                        description;
};

} // namespace OC
