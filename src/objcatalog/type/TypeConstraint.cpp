#include "TypeConstraint.hpp"

#include <algorithm>

namespace OC {

auto TypeConstraint::Numeric() -> TypeConstraint {
    TypeConstraint constraint{Kind::Predicate};
    constraint.description = "numeric";
    constraint.predicate   = [](Value const& value) {
        auto const category = value.category();
        return category == ValueCategory::Integral || category == ValueCategory::FloatingPoint;
    };
    return constraint;
}

auto TypeConstraint::Satisfying(std::string description, Predicate predicate) -> TypeConstraint {
    TypeConstraint constraint{Kind::Predicate};
    constraint.description = std::move(description);
    constraint.predicate   = std::move(predicate);
    return constraint;
}

auto TypeConstraint::check(Value const& value) const -> std::optional<Error> {
    if (value.isNull())
        return std::nullopt;

    bool accepted = false;
    switch (this->constraintKind) {
    case Kind::Exact:
    case Kind::OneOf:
    case Kind::ArrayElement: {
        auto const* stored = value.type();
        accepted           = std::any_of(this->types.begin(), this->types.end(), [stored](std::type_info const* type) {
            return *type == *stored;
        });
        break;
    }
    case Kind::Predicate:
        accepted = this->predicate && this->predicate(value);
        break;
    }

    if (accepted)
        return std::nullopt;
    return Error{Error::Code::TypeMismatch,
                 "value " + value.describe() + " of type " + value.typeName() + " does not satisfy " + this->description};
}

auto TypeConstraint::concreteType() const -> std::type_info const* {
    if ((this->constraintKind == Kind::Exact || this->constraintKind == Kind::ArrayElement) && this->types.size() == 1)
        return this->types.front();
    return nullptr;
}

} // namespace OC
