#include "dependency/DependencyPath.hpp"
#include "field/FieldNode.hpp"
#include "node/Catalog.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>

using namespace OC;

namespace {

auto namedNode(std::shared_ptr<Node> const& parent, std::string const& name) -> std::shared_ptr<FieldNode> {
    auto node = Node::makeChild<FieldNode>(parent).value();
    REQUIRE_FALSE(node->addField("name").value()->set(Source{"PathTestSurvey"}, name).has_value());
    return node;
}

auto valueAt(std::shared_ptr<Field> const& field) -> std::string {
    return field->currentValue().value().as<std::string>().value();
}

} // namespace

TEST_SUITE("dependency.path") {
    TEST_CASE("Parsing") {
        auto path = DependencyPath::Parse("^/^cluster/./2/members/mass");
        REQUIRE(path.has_value());
        CHECK_FALSE(path->anchored());
        CHECK(path->fieldName() == "mass");
        CHECK(path->str() == "^/^cluster/./2/members/mass");

        auto const& steps = path->steps();
        REQUIRE(steps.size() == 5);
        CHECK(steps[0].kind == DependencyPath::Step::Kind::Parent);
        CHECK(steps[1].kind == DependencyPath::Step::Kind::Ancestor);
        CHECK(steps[1].name == "cluster");
        CHECK(steps[2].kind == DependencyPath::Step::Kind::FirstChild);
        CHECK(steps[3].kind == DependencyPath::Step::Kind::ChildIndex);
        CHECK(steps[3].index == 2);
        CHECK(steps[4].kind == DependencyPath::Step::Kind::ChildNamed);
        CHECK(steps[4].name == "members");

        auto bare = DependencyPath::Parse("mass");
        REQUIRE(bare.has_value());
        CHECK(bare->steps().empty());

        auto anchored = DependencyPath::Parse("/0/mass");
        REQUIRE(anchored.has_value());
        CHECK(anchored->anchored());
        CHECK(anchored->steps().size() == 1);
    }

    TEST_CASE("Malformed paths") {
        for (auto text : {"", "/", "^", "a//mass", "a/", "a/.", "a/^b", "//mass"}) {
            CAPTURE(text);
            auto path = DependencyPath::Parse(text);
            REQUIRE_FALSE(path.has_value());
            CHECK(path.error().code == Error::Code::InvalidPath);
        }
    }

    TEST_CASE("Resolution") {
        auto catalog = Node::make<Catalog>("PathTest");
        auto cluster = namedNode(catalog, "Pleiades");
        auto alcyone = namedNode(cluster, "Alcyone");
        auto maia    = namedNode(cluster, "Maia");
        auto orphan  = Node::makeChild<Node>(catalog).value();

        auto resolve = [](std::string_view text, Node const& origin) { return DependencyPath::Parse(text).value().resolve(origin); };

        CHECK(valueAt(resolve("name", *maia).value()) == "Maia");
        CHECK(valueAt(resolve("^/name", *maia).value()) == "Pleiades");
        CHECK(valueAt(resolve("^/./name", *maia).value()) == "Alcyone");
        CHECK(valueAt(resolve("^/1/name", *alcyone).value()) == "Maia");
        CHECK(valueAt(resolve("Maia/name", *cluster).value()) == "Maia");
        CHECK(valueAt(resolve("^Pleiades/name", *maia).value()) == "Pleiades");
        CHECK(valueAt(resolve("/0/1/name", *alcyone).value()) == "Maia");
        CHECK(valueAt(resolve("/Pleiades/Alcyone/name", *orphan).value()) == "Alcyone");

        auto located = DependencyPath::Parse("^Catalog/x").value().locate(*alcyone);
        REQUIRE(located.has_value());
        CHECK(*located == catalog);

        CHECK(resolve("^/^/^/name", *maia).error().code == Error::Code::InvalidPath);
        CHECK(resolve("^Hyades/name", *maia).error().code == Error::Code::InvalidPath);
        CHECK(resolve("Electra/name", *cluster).error().code == Error::Code::InvalidPath);
        CHECK(resolve("5/name", *cluster).error().code == Error::Code::IndexOutOfRange);
        CHECK(resolve("mass", *maia).error().code == Error::Code::NoSuchField);
        CHECK(resolve("/1/name", *maia).error().code == Error::Code::NoSuchField);
        CHECK(resolve("^Maia/name", *maia).error().code == Error::Code::InvalidPath);
    }
}
