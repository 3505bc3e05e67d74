#include "field/Field.hpp"
#include "field/FieldValue.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace OC;

namespace {

struct Recorded {
    FieldValuePtr oldValue;
    FieldValuePtr newValue;
};

auto recorder(std::vector<Recorded>& calls) -> std::shared_ptr<FieldNotifier> {
    return FieldNotifier::FromCallback([&calls](FieldValuePtr const& oldValue, FieldValuePtr const& newValue) {
        calls.push_back(Recorded{oldValue, newValue});
    });
}

auto currentDouble(Field const& field) -> double {
    return field.currentValue().value().as<double>().value();
}

} // namespace

TEST_SUITE("field.field") {
    TEST_CASE("Values are keyed by source and the first one is current") {
        auto field = Field::Create("parallax");
        CHECK(field->empty());

        REQUIRE_FALSE(field->set(Source{"FieldTestHipparcos"}, 1.5).has_value());
        REQUIRE_FALSE(field->set(Source{"FieldTestGaia"}, 2.5).has_value());
        REQUIRE_FALSE(field->set("FieldTestTycho", 3.5).has_value());

        CHECK(field->size() == 3);
        CHECK(currentDouble(*field) == doctest::Approx(1.5));
        CHECK(field->sourceNames() == std::vector<std::string>{"FieldTestHipparcos", "FieldTestGaia", "FieldTestTycho"});
        CHECK(field->contains(Source{"FieldTestGaia"}));
        CHECK(field->contains("FieldTestGaia"));
        CHECK(field->indexOf(Source{"FieldTestTycho"}).value() == 2);

        auto gaia = field->at("FieldTestGaia");
        REQUIRE(gaia.has_value());
        CHECK((*gaia)->value().value() == Value{2.5});

        REQUIRE_FALSE(field->set(Source{"FieldTestGaia"}, 2.75).has_value());
        CHECK(field->size() == 3);
        CHECK(field->at(1).value()->value().value() == Value{2.75});

        auto values = field->values();
        REQUIRE(values.has_value());
        CHECK(values->size() == 3);
    }

    TEST_CASE("Lookup failures") {
        auto field = Field::Create("mass");
        auto empty = field->currentValue();
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::EmptyField);

        CHECK(field->at(0).error().code == Error::Code::IndexOutOfRange);
        CHECK(field->at(Source{"FieldTestNowhere"}).error().code == Error::Code::NoSuchSource);
        CHECK(field->at("FieldTestNeverInterned").error().code == Error::Code::NoSuchSource);
        CHECK(field->at("derived").error().code == Error::Code::IndexOutOfRange);
        CHECK(field->remove(Source{"FieldTestNowhere"}).error().code == Error::Code::NoSuchSource);
    }

    TEST_CASE("Writing the current slot notifies before committing") {
        auto field = Field::Create("flux");
        REQUIRE_FALSE(field->set(Source{"FieldTestSurvey"}, 1.0).has_value());

        std::vector<Recorded> calls;
        double                seenDuringNotify = 0.0;
        auto                  notifier         = FieldNotifier::FromCallback([&](FieldValuePtr const& oldValue, FieldValuePtr const& newValue) {
            calls.push_back(Recorded{oldValue, newValue});
            seenDuringNotify = currentDouble(*field);
        });
        field->registerNotifier(notifier);
        field->registerNotifier(notifier);
        CHECK(field->notifierCount() == 1);

        REQUIRE_FALSE(field->set(0, 9.0).has_value());
        REQUIRE(calls.size() == 1);
        CHECK(seenDuringNotify == doctest::Approx(1.0));
        CHECK(calls[0].oldValue->value().value() == Value{1.0});
        CHECK(calls[0].newValue->value().value() == Value{9.0});
        CHECK(calls[0].newValue->source() == Source{"FieldTestSurvey"});
        CHECK(currentDouble(*field) == doctest::Approx(9.0));

        REQUIRE_FALSE(field->set(Source{"FieldTestOther"}, 4.0).has_value());
        CHECK(calls.size() == 1);
    }

    TEST_CASE("A failing notifier aborts the change") {
        auto field = Field::Create("flux");
        REQUIRE_FALSE(field->set(Source{"FieldTestSurvey"}, 1.0).has_value());

        std::vector<Recorded> later;
        auto veto = FieldNotifier::FromCallback([](FieldValuePtr const&, FieldValuePtr const&) -> std::optional<Error> {
            return Error{Error::Code::MalformedInput, "vetoed"};
        });
        auto after = recorder(later);
        field->registerNotifier(veto);
        field->registerNotifier(after);

        auto error = field->set(0, 2.0);
        REQUIRE(error.has_value());
        CHECK(error->message.value() == "vetoed");
        CHECK(currentDouble(*field) == doctest::Approx(1.0));
        CHECK(later.empty());

        CHECK(field->remove(std::size_t{0}).error().code == Error::Code::MalformedInput);
        CHECK(field->size() == 1);
    }

    TEST_CASE("Dead notifiers are pruned") {
        auto                  field = Field::Create("flux");
        std::vector<Recorded> calls;
        auto                  notifier = recorder(calls);
        field->registerNotifier(notifier);
        CHECK(field->notifierCount() == 1);

        notifier.reset();
        REQUIRE_FALSE(field->set(Source{"FieldTestSurvey"}, 1.0).has_value());
        CHECK(calls.empty());
        CHECK(field->notifierCount() == 0);
    }

    TEST_CASE("Removing the current value promotes the next one") {
        auto field = Field::Create("radius");
        REQUIRE_FALSE(field->set(Source{"FieldTestFirst"}, 1.0).has_value());
        REQUIRE_FALSE(field->set(Source{"FieldTestSecond"}, 2.0).has_value());

        std::vector<Recorded> calls;
        auto                  notifier = recorder(calls);
        field->registerNotifier(notifier);

        auto removed = field->remove(std::size_t{0});
        REQUIRE(removed.has_value());
        CHECK((*removed)->source() == Source{"FieldTestFirst"});
        REQUIRE(calls.size() == 1);
        CHECK(calls[0].oldValue == *removed);
        CHECK(calls[0].newValue->source() == Source{"FieldTestSecond"});
        CHECK(currentDouble(*field) == doctest::Approx(2.0));

        REQUIRE(field->remove("FieldTestSecond").has_value());
        REQUIRE(calls.size() == 2);
        CHECK(calls[1].newValue == nullptr);
        CHECK(field->empty());
    }

    TEST_CASE("Inserting") {
        auto field = Field::Create("radius");
        REQUIRE_FALSE(field->set(Source{"FieldTestFirst"}, 1.0).has_value());

        std::vector<Recorded> calls;
        auto                  notifier = recorder(calls);
        field->registerNotifier(notifier);

        auto front = FieldValue::Observed(0.5, "FieldTestFront");
        REQUIRE_FALSE(field->insert(0, front).has_value());
        REQUIRE(calls.size() == 1);
        CHECK(calls[0].oldValue->source() == Source{"FieldTestFirst"});
        CHECK(calls[0].newValue == front);

        REQUIRE_FALSE(field->insert(99, FieldValue::Observed(3.0, "FieldTestBack")).has_value());
        CHECK(field->at(2).value()->source() == Source{"FieldTestBack"});
        CHECK(calls.size() == 1);

        auto duplicate = field->insert(1, FieldValue::Observed(7.0, "FieldTestFirst"));
        REQUIRE(duplicate.has_value());
        CHECK(duplicate->code == Error::Code::DuplicateSource);

        REQUIRE_FALSE(field->insert(1, FieldValue::Observed(7.0, "FieldTestFirst"), SourceCheck::Bypass).has_value());
        CHECK(field->size() == 4);

        CHECK(field->insert(0, nullptr)->code == Error::Code::MalformedInput);
        CHECK(field->insert(0, front, SourceCheck::Bypass)->code == Error::Code::DuplicateSource);
    }

    TEST_CASE("Replacing a slot requires its source") {
        auto field = Field::Create("radius");
        REQUIRE_FALSE(field->set(Source{"FieldTestFirst"}, 1.0).has_value());

        auto error = field->set(0, FieldValue::Observed(2.0, "FieldTestIntruder"));
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::MalformedInput);

        REQUIRE_FALSE(field->set(0, FieldValue::Observed(2.0, "FieldTestFirst")).has_value());
        CHECK(currentDouble(*field) == doctest::Approx(2.0));
        CHECK(field->set(5, 1.0)->code == Error::Code::IndexOutOfRange);
    }

    TEST_CASE("Making a value current") {
        auto field = Field::Create("color");
        REQUIRE_FALSE(field->set(Source{"FieldTestFirst"}, 1.0).has_value());
        REQUIRE_FALSE(field->set(Source{"FieldTestSecond"}, 2.0).has_value());

        std::vector<Recorded> calls;
        auto                  notifier = recorder(calls);
        field->registerNotifier(notifier);

        REQUIRE_FALSE(field->setCurrent(Source{"FieldTestSecond"}).has_value());
        CHECK(currentDouble(*field) == doctest::Approx(2.0));
        CHECK(field->size() == 2);
        CHECK(calls.size() == 1);

        REQUIRE_FALSE(field->setCurrent(5.0, Source{"FieldTestFirst"}).has_value());
        CHECK(currentDouble(*field) == doctest::Approx(5.0));
        CHECK(field->size() == 2);
        CHECK(field->sourceNames() == std::vector<std::string>{"FieldTestFirst", "FieldTestSecond"});

        REQUIRE_FALSE(field->setCurrent(FieldValue::Observed(8.0, "FieldTestThird")).has_value());
        CHECK(field->size() == 3);
        CHECK(calls.size() == 3);

        CHECK(field->setCurrent(Source{"FieldTestAbsent"})->code == Error::Code::NoSuchSource);
    }

    TEST_CASE("Type constraints") {
        auto numeric = Field::Create("distance", TypeConstraint::Numeric());
        auto error   = numeric->set(Source{"FieldTestSurvey"}, "abc");
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::TypeMismatch);
        CHECK(numeric->empty());
        REQUIRE_FALSE(numeric->set(Source{"FieldTestSurvey"}, 12).has_value());

        auto open = Field::Create("note");
        REQUIRE_FALSE(open->set(Source{"FieldTestSurvey"}, "abc").has_value());

        auto tightened = open->setConstraint(TypeConstraint::Numeric());
        REQUIRE(tightened.has_value());
        CHECK(tightened->code == Error::Code::TypeMismatch);
        CHECK_FALSE(open->constraint().has_value());

        REQUIRE_FALSE(numeric->setConstraint(TypeConstraint::Of<int>()).has_value());
        CHECK(numeric->constraint().has_value());
        REQUIRE_FALSE(numeric->setConstraint(std::nullopt).has_value());
        REQUIRE_FALSE(numeric->set(Source{"FieldTestOther"}, "now fine").has_value());
    }

    TEST_CASE("Default slot") {
        auto field = Field::Create("epoch");
        CHECK_FALSE(field->hasDefault());
        CHECK(field->defaultValue().error().code == Error::Code::NoSuchSource);

        REQUIRE_FALSE(field->setDefault(2000.0).has_value());
        REQUIRE_FALSE(field->set(Source{"FieldTestSurvey"}, 2015.5).has_value());
        CHECK(field->hasDefault());
        CHECK(field->defaultValue().value() == Value{2000.0});
        CHECK(currentDouble(*field) == doctest::Approx(2000.0));
        CHECK(field->at("None").value()->source().isNone());

        auto observed = field->observed();
        REQUIRE(observed.size() == 1);
        CHECK(observed[0]->source() == Source{"FieldTestSurvey"});

        REQUIRE_FALSE(field->clearDefault().has_value());
        CHECK_FALSE(field->hasDefault());
        CHECK(currentDouble(*field) == doctest::Approx(2015.5));
        CHECK(field->clearDefault()->code == Error::Code::NoSuchSource);
    }

    TEST_CASE("Default slot reached by its name") {
        auto field = Field::Create("distance");
        REQUIRE_FALSE(field->set(std::string_view{"None"}, 7).has_value());
        CHECK(field->hasDefault());
        CHECK(field->at("None").value()->value().value() == Value{7});
        CHECK(field->defaultValue().value() == Value{7});
        CHECK(field->observed().empty());

        auto removed = field->remove(std::string_view{"None"});
        REQUIRE(removed.has_value());
        CHECK((*removed)->source().isNone());
        CHECK_FALSE(field->hasDefault());
    }

    TEST_CASE("Descriptions") {
        auto field = Field::Create("name");
        CHECK(field->describeCurrent() == "Field name empty");
        REQUIRE_FALSE(field->set(Source{"FieldTestSurvey"}, "Vega").has_value());
        CHECK(field->describeCurrent() == "Field name: Vega");
        CHECK(field->describe() == "Field name:[Value Vega:Source FieldTestSurvey]");
    }
}
