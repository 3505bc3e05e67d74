#include "field/FieldNode.hpp"
#include "field/FieldValue.hpp"
#include "node/Catalog.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <typeinfo>
#include <vector>

using namespace OC;

namespace {

auto makeStar(std::shared_ptr<Node> const& parent, std::string const& name, double magnitude) -> std::shared_ptr<FieldNode> {
    auto star = Node::makeChild<FieldNode>(parent).value();
    REQUIRE_FALSE(star->addField("name").value()->set(Source{"FieldNodeTestSurvey"}, name).has_value());
    REQUIRE_FALSE(star->addField("magnitude").value()->set(Source{"FieldNodeTestSurvey"}, magnitude).has_value());
    return star;
}

} // namespace

TEST_SUITE("field.fieldnode") {
    TEST_CASE("Fields are unique by name and owned once") {
        auto node = Node::make<FieldNode>();
        auto ra   = node->addField("ra");
        REQUIRE(ra.has_value());
        CHECK((*ra)->node() == node);

        CHECK(node->addField("ra").error().code == Error::Code::DuplicateOwnership);
        CHECK(node->addField(std::shared_ptr<Field>{})->code == Error::Code::MalformedInput);

        auto other = Node::make<FieldNode>();
        CHECK(other->addField(*ra)->code == Error::Code::DuplicateOwnership);

        REQUIRE(node->addField("dec").has_value());
        CHECK(node->fieldNames() == std::vector<std::string>{"ra", "dec"});
        CHECK(node->size() == 2);
        CHECK(node->contains("dec"));
        CHECK(node->field(1).value()->name() == "dec");
        CHECK(node->field(7).error().code == Error::Code::NoSuchField);
        CHECK(node->label() == "FieldNode with fields [ra, dec]");

        auto removed = node->delField("ra");
        REQUIRE(removed.has_value());
        CHECK((*removed)->node() == nullptr);
        CHECK(node->delField("ra").error().code == Error::Code::NoSuchField);
        REQUIRE_FALSE(other->addField(*removed).has_value());
    }

    TEST_CASE("A FieldNode created on the stack cannot hold fields") {
        FieldNode loose;
        CHECK(loose.addField("ra").error().code == Error::Code::NotSupported);
    }

    TEST_CASE("Value lookup modes") {
        auto node = Node::make<FieldNode>();
        REQUIRE(node->addField("empty").has_value());
        CHECK(node->setValue("missing", Value{1}, Source{"FieldNodeTestSurvey"})->code == Error::Code::NoSuchField);

        auto lenient = node->value("empty");
        REQUIRE(lenient.has_value());
        CHECK(lenient->isNull());
        CHECK(node->value("empty", LookupMode::Strict).error().code == Error::Code::EmptyField);
        CHECK(node->value("missing").error().code == Error::Code::NoSuchField);

        REQUIRE_FALSE(node->setValue("empty", Value{7}, Source{"FieldNodeTestSurvey"}).has_value());
        CHECK(node->value(0).value() == Value{7});
        CHECK(node->currentValues() == std::vector<Value>{Value{7}});

        REQUIRE_FALSE(node->setValue(0, FieldValue::Observed(8, "FieldNodeTestOther")).has_value());
        CHECK(node->value("empty").value() == Value{8});
        CHECK(node->field("empty").value()->size() == 2);
    }

    TEST_CASE("Names and equality") {
        auto catalog = Node::make<Catalog>("FieldNodeTest");
        auto vega    = makeStar(catalog, "Vega", 0.03);
        auto deneb   = makeStar(catalog, "Deneb", 1.25);

        CHECK(vega->matchesName("Vega"));
        CHECK(vega->matchesName("FieldNode"));
        CHECK_FALSE(vega->matchesName("Deneb"));
        CHECK_FALSE(*vega == *deneb);

        auto copy = Node::make<FieldNode>();
        REQUIRE_FALSE(copy->addField("name").value()->set(Source{"FieldNodeTestElsewhere"}, std::string{"Vega"}).has_value());
        REQUIRE_FALSE(copy->addField("magnitude").value()->set(Source{"FieldNodeTestElsewhere"}, 0.03).has_value());
        CHECK(*copy == *vega);
    }

    TEST_CASE("Extracting a field across a subtree") {
        auto root = Node::make<FieldNode>();
        auto vega = makeStar(root, "Vega", 0.03);
        auto group = Node::makeChild<Node>(root).value();
        auto deneb = makeStar(group, "Deneb", 1.25);
        auto blank = Node::makeChild<FieldNode>(root).value();
        REQUIRE(blank->addField("magnitude").has_value());

        SUBCASE("Fail") {
            auto column = root->extractAcrossTree("magnitude");
            REQUIRE_FALSE(column.has_value());
            CHECK(column.error().code == Error::Code::NoSuchField);
        }

        SUBCASE("Skip") {
            auto values = root->extractAs<double>("magnitude", ExtractOptions::Skipping().order(Traversal::PreOrder()));
            REQUIRE(values.has_value());
            CHECK(*values == std::vector<double>{0.03, 1.25});
        }

        SUBCASE("Null") {
            auto column = root->extractAcrossTree("magnitude", ExtractOptions::NullFilled().order(Traversal::PreOrder()));
            REQUIRE(column.has_value());
            // root, Vega, group, Deneb, blank
            REQUIRE(column->size() == 5);
            CHECK(column->values[0].isNull());
            CHECK(column->values[1] == Value{0.03});
            CHECK(column->values[2].isNull());
            CHECK(column->values[3] == Value{1.25});
            CHECK(column->values[4].isNull());
            CHECK(*column->elementType == typeid(double));
            CHECK(column->as<double>().error().code == Error::Code::EmptyField);
        }

        SUBCASE("Mixed types have no element type") {
            REQUIRE_FALSE(vega->setValue("magnitude", Value{2}, Source{"FieldNodeTestOther"}).has_value());
            auto column = root->extractAcrossTree("magnitude", ExtractOptions::Skipping());
            REQUIRE(column.has_value());
            CHECK(column->size() == 2);
            CHECK(column->elementType == nullptr);
        }

        SUBCASE("A field constraint decides the element type") {
            REQUIRE_FALSE(vega->setValue("magnitude", Value{2}, Source{"FieldNodeTestOther"}).has_value());
            REQUIRE_FALSE(deneb->field("magnitude").value()->setConstraint(TypeConstraint::Of<double>()).has_value());
            auto column = root->extractAcrossTree("magnitude", ExtractOptions::Skipping());
            REQUIRE(column.has_value());
            CHECK(*column->elementType == typeid(double));
        }

        SUBCASE("An explicit element type wins") {
            auto column = root->extractAcrossTree("magnitude", ExtractOptions::Skipping().elementsOf<int>());
            REQUIRE(column.has_value());
            CHECK(*column->elementType == typeid(int));
            CHECK(column->as<int>().value() == std::vector<int>{0, 1});
        }
    }

    TEST_CASE("Moving a node re-resolves path dependencies") {
        auto first  = Node::make<FieldNode>();
        auto second = Node::make<FieldNode>();
        REQUIRE_FALSE(first->addField("z").value()->set(Source{"FieldNodeTestSurvey"}, 1).has_value());
        REQUIRE_FALSE(second->addField("z").value()->set(Source{"FieldNodeTestSurvey"}, 10).has_value());

        auto child    = Node::makeChild<FieldNode>(first).value();
        auto distance = child->addField("distance").value();
        auto derived  = FieldValue::Derived(derive<int, int>([](int z) { return z + 1; }), {"^/z"});
        REQUIRE_FALSE(distance->insert(0, derived).has_value());
        CHECK(child->value("distance").value() == Value{2});

        REQUIRE(child->setParent(second) == std::nullopt);
        CHECK_FALSE(derived->derived()->isValid());
        CHECK(child->value("distance").value() == Value{11});

        REQUIRE_FALSE(second->field("z").value()->set(0, 20).has_value());
        CHECK(child->value("distance").value() == Value{21});

        child->detach();
        auto orphaned = child->value("distance");
        REQUIRE_FALSE(orphaned.has_value());
        CHECK(orphaned.error().code == Error::Code::UnresolvedDependency);
    }
}
