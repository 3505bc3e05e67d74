#include "node/Catalog.hpp"
#include "schema/FieldSchema.hpp"
#include "schema/StructuredFieldNode.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace OC;

namespace {

auto starSchema(std::string typeName) -> FieldSchema {
    FieldSchema schema{std::move(typeName)};
    schema.add(FieldDescriptor::Named("name").constrained(TypeConstraint::Of<std::string>()))
            .add(FieldDescriptor::Named("mass").constrained(TypeConstraint::Numeric()).defaulting(1.0))
            .add(FieldDescriptor::Named("luminosity")
                         .derivedBy(DerivedRecipe{derive<double, double>([](double m) { return m * m * m; }), {"mass"}}));
    return schema;
}

auto currentDouble(StructuredFieldNode const& node, std::string_view field) -> double {
    return node.value(field).value().as<double>().value();
}

} // namespace

TEST_SUITE("schema.structured") {
    TEST_CASE("Schemas are validated on registration") {
        auto& registry = SchemaRegistry::instance();

        CHECK(registry.registerSchema(FieldSchema{""})->code == Error::Code::MalformedInput);

        FieldSchema unnamed{"SchemaTestUnnamed"};
        unnamed.add(FieldDescriptor{});
        CHECK(registry.registerSchema(unnamed)->code == Error::Code::MalformedInput);

        FieldSchema badDefault{"SchemaTestBadDefault"};
        badDefault.add(FieldDescriptor::Named("count").constrained(TypeConstraint::Of<int>()).defaulting(std::string{"many"}));
        CHECK(registry.registerSchema(badDefault)->code == Error::Code::TypeMismatch);

        FieldSchema noFunction{"SchemaTestNoFunction"};
        noFunction.add(FieldDescriptor::Named("luminosity").derivedBy(DerivedRecipe{}));
        CHECK(registry.registerSchema(noFunction)->code == Error::Code::MalformedInput);

        CHECK_FALSE(registry.contains("SchemaTestUnnamed"));
        CHECK_FALSE(registry.contains("SchemaTestBadDefault"));
    }

    TEST_CASE("Adding a descriptor twice replaces it in place") {
        auto schema = starSchema("SchemaTestReplace");
        schema.add(FieldDescriptor::Named("mass").defaulting(2.0));
        CHECK(schema.fieldNames() == std::vector<std::string>{"name", "mass", "luminosity"});
        CHECK_FALSE(schema.find("mass")->constraint.has_value());
        CHECK(schema.find("radius") == nullptr);
    }

    TEST_CASE("Unknown types cannot be created") {
        auto created = StructuredFieldNode::Create("SchemaTestNeverRegistered");
        REQUIRE_FALSE(created.has_value());
        CHECK(created.error().code == Error::Code::NotSupported);
    }

    TEST_CASE("A structured node is built from its schema") {
        REQUIRE_FALSE(SchemaRegistry::instance().registerSchema(starSchema("SchemaTestStar")).has_value());
        auto catalog = Node::make<Catalog>("SchemaTest");
        auto created = StructuredFieldNode::Create("SchemaTestStar", catalog);
        REQUIRE(created.has_value());
        auto star = *created;

        CHECK(star->parent() == catalog);
        CHECK(star->typeName() == "SchemaTestStar");
        CHECK(star->matchesName("SchemaTestStar"));
        CHECK(star->fieldNames() == std::vector<std::string>{"name", "mass", "luminosity"});
        CHECK_FALSE(star->alteredStructure());

        CHECK(star->value("name").value().isNull());
        CHECK(star->field("mass").value()->hasDefault());
        CHECK(currentDouble(*star, "mass") == doctest::Approx(1.0));
        CHECK(currentDouble(*star, "luminosity") == doctest::Approx(1.0));

        auto recipe = star->recipeValue("luminosity");
        REQUIRE(recipe != nullptr);
        CHECK(star->field("luminosity").value()->current().value() == recipe);
        CHECK(star->recipeValue("mass") == nullptr);

        REQUIRE_FALSE(star->setValue("mass", Value{2.0}, Source{"SchemaTestSurvey"}).has_value());
        CHECK(currentDouble(*star, "luminosity") == doctest::Approx(8.0));

        CHECK(star->setValue("mass", Value{std::string{"heavy"}}, Source{"SchemaTestSurvey"})->code == Error::Code::TypeMismatch);
    }

    TEST_CASE("Structural changes can be reverted") {
        REQUIRE_FALSE(SchemaRegistry::instance().registerSchema(starSchema("SchemaTestRevert")).has_value());
        auto star = StructuredFieldNode::Create("SchemaTestRevert").value();
        REQUIRE_FALSE(star->setValue("mass", Value{3.0}, Source{"SchemaTestSurvey"}).has_value());

        REQUIRE(star->addField("colour").has_value());
        CHECK(star->alteredStructure());
        REQUIRE(star->delField("name").has_value());

        REQUIRE_FALSE(star->revert().has_value());
        CHECK_FALSE(star->alteredStructure());
        CHECK(star->fieldNames() == std::vector<std::string>{"name", "mass", "luminosity"});
        CHECK(currentDouble(*star, "mass") == doctest::Approx(3.0));
        CHECK(currentDouble(*star, "luminosity") == doctest::Approx(27.0));
    }

    TEST_CASE("Derived schemas extend their base") {
        auto giant = FieldSchema::Derive(starSchema("SchemaTestBase"), "SchemaTestGiant");
        giant.add(FieldDescriptor::Named("radius").defaulting(100.0));
        REQUIRE_FALSE(SchemaRegistry::instance().registerSchema(giant).has_value());

        auto node = StructuredFieldNode::Create("SchemaTestGiant").value();
        CHECK(node->fieldNames() == std::vector<std::string>{"name", "mass", "luminosity", "radius"});
        CHECK(currentDouble(*node, "radius") == doctest::Approx(100.0));
    }

    TEST_CASE("Registering a type again affects new nodes only") {
        auto& registry = SchemaRegistry::instance();
        REQUIRE_FALSE(registry.registerSchema(FieldSchema{"SchemaTestVersioned"}.add(FieldDescriptor::Named("first"))).has_value());
        auto older = StructuredFieldNode::Create("SchemaTestVersioned").value();

        REQUIRE_FALSE(registry.registerSchema(FieldSchema{"SchemaTestVersioned"}.add(FieldDescriptor::Named("second"))).has_value());
        auto newer = StructuredFieldNode::Create("SchemaTestVersioned").value();

        CHECK(older->fieldNames() == std::vector<std::string>{"first"});
        CHECK(newer->fieldNames() == std::vector<std::string>{"second"});

        CHECK(registry.unregisterSchema("SchemaTestVersioned"));
        CHECK_FALSE(registry.unregisterSchema("SchemaTestVersioned"));
        CHECK_FALSE(StructuredFieldNode::Create("SchemaTestVersioned").has_value());
        CHECK(older->schema()->typeName() == "SchemaTestVersioned");
    }

    TEST_CASE("Recipe failure policy applies to the built value") {
        FieldSchema schema{"SchemaTestUnresolved"};
        schema.add(FieldDescriptor::Named("luminosity")
                           .derivedBy(DerivedRecipe{derive<double, double>([](double m) { return m; }), {"missing"}, FailurePolicy::Skip}));
        REQUIRE_FALSE(SchemaRegistry::instance().registerSchema(schema).has_value());

        auto node  = StructuredFieldNode::Create("SchemaTestUnresolved").value();
        auto value = node->value("luminosity");
        REQUIRE(value.has_value());
        CHECK(value->isNull());
        CHECK(node->recipeValue("luminosity")->derived()->options().failurePolicy == FailurePolicy::Skip);
    }
}
