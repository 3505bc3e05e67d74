#include "FieldValue.hpp"
#include "field/Field.hpp"
#include "field/FieldNode.hpp"
#include "log/TaggedLogger.hpp"

namespace OC {

auto failurePolicyToString(FailurePolicy policy) -> std::string_view {
    switch (policy) {
    case FailurePolicy::Raise:
        return "raise";
    case FailurePolicy::Warn:
        return "warn";
    case FailurePolicy::Skip:
        return "skip";
    case FailurePolicy::Ignore:
        return "ignore";
    }
    return "raise";
}

DerivedValue::DerivedValue(DerivedFunction function, std::vector<DependencyArg> const& dependencies, DerivedOptions const& options)
    : compute(std::move(function)),
      config(options),
      identity(Source::Dependent()),
      invalidator(std::make_shared<Invalidator>(*this)),
      inputs(dependencies, invalidator) {
    // The path node is held weakly by the dependencies only.
    if (this->config.initialPathNode) {
        this->inputs.setPathNode(this->config.initialPathNode);
        this->config.initialPathNode.reset();
    }
}

auto DerivedValue::value(std::optional<FailurePolicy> policy) -> Expected<Value> {
    auto const effective = policy.value_or(this->config.failurePolicy);
    if (this->valid)
        return this->cached;
    if (this->computing)
        return this->fail(Error{Error::Code::Cycle, this->identity.name() + " depends on its own value"}, effective);
    if (!this->compute)
        return this->fail(Error{Error::Code::DerivationFailed, this->identity.name() + " has no function"}, effective);

    struct ComputingGuard {
        bool& flag;
        ~ComputingGuard() { flag = false; }
    } guard{this->computing};
    this->computing = true;

    oc_log("Computing " + this->identity.name(), "Resolve");
    auto arguments = this->inputs.dependencyValues();
    if (!arguments)
        return this->fail(arguments.error(), effective);

    auto result = this->compute(std::span<Value const>{*arguments});
    if (!result)
        return this->fail(result.error(), effective);

    if (auto field = this->owner.lock()) {
        if (auto const& constraint = field->constraint()) {
            if (auto error = constraint->check(*result)) {
                this->usable = false;
                return this->fail(*error, effective);
            }
        }
    }

    this->cached = std::move(*result);
    this->valid  = true;
    this->usable = true;
    this->failure.reset();
    return this->cached;
}

auto DerivedValue::fail(Error error, FailurePolicy policy) -> Expected<Value> {
    this->failure = error;
    this->cached  = Value{};
    switch (policy) {
    case FailurePolicy::Raise:
        this->valid = false;
        return std::unexpected(std::move(error));
    case FailurePolicy::Warn:
        oc_log("Problem encountered while deriving " + this->identity.name() + ": " + describeError(error), "WARN");
        this->valid = false;
        return Value{};
    case FailurePolicy::Skip:
        this->valid = false;
        return Value{};
    case FailurePolicy::Ignore:
        this->valid = true;
        return Value{};
    }
    return std::unexpected(std::move(error));
}

auto DerivedValue::invalidate(InvalidationScope& scope) -> std::optional<Error> {
    if (!this->resident) {
        this->valid = false;
        return std::nullopt;
    }
    auto entry = scope.enter(this);
    if (!entry)
        return entry.error();

    this->valid = false;
    auto field  = this->owner.lock();
    if (!field || !this->holder)
        return std::nullopt;
    auto self = this->holder->shared_from_this();
    return field->notifyValueChange(self, self, scope);
}

auto DerivedValue::invalidate() -> std::optional<Error> {
    InvalidationScope scope;
    return this->invalidate(scope);
}

auto DerivedValue::attachTo(std::shared_ptr<Field> const& field) -> void {
    this->owner    = field;
    this->attached = true;
    this->resident = true;
    if (auto node = field->node())
        this->inputs.setPathNode(node);
    this->inputs.subscribe();
}

auto DerivedValue::detach() -> void {
    this->resident = false;
    this->valid    = false;
    this->inputs.unsubscribe();
}

auto DerivedValue::describe() -> std::string {
    auto current = this->value(FailurePolicy::Skip);
    if (!current || (current->isNull() && !this->valid))
        return "Derived value: Underivable";
    return "Derived value: " + current->describe();
}

auto FieldValue::Observed(Value value, Source source) -> FieldValuePtr {
    return std::make_shared<FieldValue>(std::in_place_type<ObservedValue>, std::move(value), std::move(source));
}

auto FieldValue::Observed(Value value, std::string_view source) -> FieldValuePtr {
    return Observed(std::move(value), Source{source});
}

auto FieldValue::Derived(DerivedFunction function, std::vector<DependencyArg> const& dependencies, DerivedOptions const& options)
        -> FieldValuePtr {
    auto created = std::make_shared<FieldValue>(std::in_place_type<DerivedValue>, std::move(function), dependencies, options);
    created->derived()->holder = created.get();
    return created;
}

auto FieldValue::value(std::optional<FailurePolicy> policy) -> Expected<Value> {
    if (auto* computed = this->derived())
        return computed->value(policy);
    return this->observed()->value();
}

auto FieldValue::source() const -> Source const& {
    if (auto const* computed = this->derived())
        return computed->source();
    return this->observed()->source();
}

auto FieldValue::checkType(TypeConstraint const& constraint) -> std::optional<Error> {
    if (auto const* literal = this->observed())
        return constraint.check(literal->value());

    auto* computed = this->derived();
    auto  current  = computed->value(FailurePolicy::Skip);
    if (!current || current->isNull())
        return std::nullopt;
    if (auto error = constraint.check(*current)) {
        computed->usable = false;
        return error;
    }
    return std::nullopt;
}

auto FieldValue::describe() -> std::string {
    if (auto* computed = this->derived())
        return computed->describe();
    auto const* literal = this->observed();
    return "Value " + literal->value().describe() + ":" + literal->source().describe();
}

} // namespace OC
