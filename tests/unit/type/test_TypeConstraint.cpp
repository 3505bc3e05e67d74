#include "type/TypeConstraint.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace OC;

TEST_SUITE("type.constraint") {
    TEST_CASE("Exact type") {
        auto constraint = TypeConstraint::Of<double>();
        CHECK(constraint.kind() == TypeConstraint::Kind::Exact);
        CHECK(constraint.accepts(Value{1.5}));
        CHECK_FALSE(constraint.accepts(Value{1}));
        CHECK(*constraint.concreteType() == typeid(double));

        auto error = constraint.check(Value{"one"});
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::TypeMismatch);
    }

    TEST_CASE("String constraint accepts literals") {
        auto constraint = TypeConstraint::Of<char const*>();
        CHECK(constraint.accepts(Value{"abc"}));
        CHECK(*constraint.concreteType() == typeid(std::string));
    }

    TEST_CASE("One of several types") {
        auto constraint = TypeConstraint::AnyOf<int, double>();
        CHECK(constraint.accepts(Value{1}));
        CHECK(constraint.accepts(Value{1.0}));
        CHECK_FALSE(constraint.accepts(Value{1.0f}));
        CHECK(constraint.concreteType() == nullptr);
        CHECK(constraint.describe().starts_with("one of ("));
    }

    TEST_CASE("Array of elements") {
        auto constraint = TypeConstraint::ArrayOf<double>();
        CHECK(constraint.accepts(Value{std::vector<double>{1.0}}));
        CHECK_FALSE(constraint.accepts(Value{std::vector<int>{1}}));
        CHECK_FALSE(constraint.accepts(Value{1.0}));
        CHECK(*constraint.elementType() == typeid(double));
    }

    TEST_CASE("Numeric rejects text and booleans") {
        auto numeric = TypeConstraint::Numeric();
        CHECK(numeric.accepts(Value{3}));
        CHECK(numeric.accepts(Value{3.5}));
        CHECK_FALSE(numeric.accepts(Value{"3"}));
        CHECK_FALSE(numeric.accepts(Value{true}));
    }

    TEST_CASE("Predicate constraint") {
        auto positive = TypeConstraint::Satisfying("positive", [](Value const& value) {
            auto number = value.toNumber();
            return number && *number > 0;
        });
        CHECK(positive.accepts(Value{2}));
        CHECK_FALSE(positive.accepts(Value{-2}));
        auto error = positive.check(Value{-2});
        REQUIRE(error.has_value());
        CHECK(error->message->find("positive") != std::string::npos);
    }

    TEST_CASE("Null passes every constraint") {
        CHECK(TypeConstraint::Of<int>().accepts(Value{}));
        CHECK(TypeConstraint::Numeric().accepts(Value{}));
        CHECK(TypeConstraint::ArrayOf<int>().accepts(Value{}));
    }
}
