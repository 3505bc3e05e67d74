#include "Field.hpp"
#include "field/FieldNode.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace OC {

namespace {

// "derived" -> 0, "derived3" -> 3, anything else -> nullopt.
auto parseDerivedSelector(std::string_view key) -> std::optional<std::size_t> {
    constexpr std::string_view prefix{"derived"};
    if (!key.starts_with(prefix))
        return std::nullopt;
    auto const digits = key.substr(prefix.size());
    if (digits.empty())
        return 0;
    std::size_t index = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    return index;
}

} // namespace

Field::Field(std::string name, std::optional<TypeConstraint> constraint)
    : fieldName(std::move(name)), typeConstraint(std::move(constraint)) {}

Field::~Field() = default;

auto Field::Create(std::string name, std::optional<TypeConstraint> constraint) -> std::shared_ptr<Field> {
    return std::make_shared<Field>(std::move(name), std::move(constraint));
}

auto Field::setConstraint(std::optional<TypeConstraint> constraint) -> std::optional<Error> {
    if (constraint) {
        for (auto const& entry : this->entries_) {
            if (auto const* literal = entry->observed())
                if (auto error = constraint->check(literal->value()))
                    return error;
        }
    }
    this->typeConstraint = std::move(constraint);
    if (this->typeConstraint) {
        for (auto const& entry : this->entries_)
            if (entry->isDerived())
                if (auto error = entry->checkType(*this->typeConstraint))
                    oc_log("Derived value in Field " + this->fieldName + " marked unusable: " + describeError(*error), "INFO");
    }
    return std::nullopt;
}

auto Field::at(std::size_t index) const -> Expected<FieldValuePtr> {
    if (index >= this->entries_.size())
        return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                     "Field " + this->fieldName + " has " + std::to_string(this->entries_.size()) + " values, index "
                                             + std::to_string(index) + " requested"});
    return this->entries_[index];
}

auto Field::at(Source const& source) const -> Expected<FieldValuePtr> {
    if (auto index = this->indexOf(source))
        return this->entries_[*index];
    return std::unexpected(Error{Error::Code::NoSuchSource, "Field " + this->fieldName + " does not have " + source.describe()});
}

auto Field::at(std::string_view key) const -> Expected<FieldValuePtr> {
    if (auto selector = parseDerivedSelector(key))
        return this->at(DerivedIndex{*selector});
    if (key == Source::None().name())
        return this->at(Source::None());
    auto source = SourceRegistry::instance().find(key);
    if (!source)
        return std::unexpected(Error{Error::Code::NoSuchSource, "Field " + this->fieldName + " does not have Source " + std::string{key}});
    return this->at(*source);
}

auto Field::at(DerivedIndex selector) const -> Expected<FieldValuePtr> {
    std::size_t seen = 0;
    for (auto const& entry : this->entries_) {
        if (!entry->isDerived())
            continue;
        if (seen == selector.index)
            return entry;
        ++seen;
    }
    return std::unexpected(Error{Error::Code::IndexOutOfRange, "field has only " + std::to_string(seen) + " DerivedValues"});
}

auto Field::indexOf(Source const& source) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < this->entries_.size(); ++i)
        if (this->entries_[i]->source() == source)
            return i;
    return std::nullopt;
}

auto Field::indexOf(FieldValue const& value) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < this->entries_.size(); ++i)
        if (this->entries_[i].get() == &value)
            return i;
    return std::nullopt;
}

auto Field::validateIncoming(FieldValuePtr const& value, Expectation const& expectation) const -> std::optional<Error> {
    if (!value)
        return Error{Error::Code::MalformedInput, "null FieldValue"};

    if (expectation.source && value->source() != *expectation.source)
        return Error{Error::Code::MalformedInput,
                     "Input " + value->source().describe() + " does not match expected " + expectation.source->describe()};

    for (std::size_t i = 0; i < this->entries_.size(); ++i) {
        if (expectation.replacing && i == *expectation.replacing)
            continue;
        if (this->entries_[i] == value)
            return Error{Error::Code::DuplicateSource, "value already present in Field " + this->fieldName};
        if (expectation.check == SourceCheck::Unique && this->entries_[i]->source() == value->source())
            return Error{Error::Code::DuplicateSource,
                         "value with " + value->source().describe() + " already present in Field " + this->fieldName};
    }

    if (auto const* literal = value->observed()) {
        if (this->typeConstraint)
            if (auto error = this->typeConstraint->check(literal->value()))
                return error;
        return std::nullopt;
    }

    auto const* computed = value->derived();
    if (auto owner = computed->field(); owner && owner.get() != this)
        return Error{Error::Code::DuplicateOwnership, "DerivedValues can only reside in a single field for dependencies"};
    if (this->weak_from_this().expired())
        return Error{Error::Code::NotSupported, "Field " + this->fieldName + " must be shared-owned to hold derived values"};
    return std::nullopt;
}

auto Field::commit(std::vector<FieldValuePtr> next, Notify notify) -> std::optional<Error> {
    FieldValuePtr oldCurrent = this->entries_.empty() ? nullptr : this->entries_.front();
    FieldValuePtr newCurrent = next.empty() ? nullptr : next.front();
    if (notify == Notify::Always || oldCurrent != newCurrent)
        if (auto error = this->notifyValueChange(oldCurrent, newCurrent))
            return error;

    auto previous = std::exchange(this->entries_, std::move(next));
    for (auto const& entry : previous) {
        auto* computed = entry->derived();
        if (computed && computed->isResident() && !this->indexOf(*entry))
            computed->detach();
    }
    for (auto const& entry : this->entries_) {
        auto const* computed = entry->derived();
        if (computed && !computed->isResident())
            this->attachDerived(entry);
    }
    return std::nullopt;
}

auto Field::attachDerived(FieldValuePtr const& value) -> void {
    value->derived()->attachTo(this->shared_from_this());
    if (!this->typeConstraint)
        return;
    if (auto error = value->checkType(*this->typeConstraint))
        oc_log("Derived value " + value->source().name() + " does not satisfy Field " + this->fieldName + ": " + describeError(*error),
               "INFO");
}

auto Field::set(std::size_t index, FieldValuePtr value) -> std::optional<Error> {
    if (index >= this->entries_.size())
        return this->at(index).error();
    if (auto error = this->validateIncoming(value, Expectation{.source = this->entries_[index]->source(), .replacing = index}))
        return error;
    auto next   = this->entries_;
    next[index] = std::move(value);
    return this->commit(std::move(next), Notify::No);
}

auto Field::set(std::size_t index, Value const& literal) -> std::optional<Error> {
    if (index >= this->entries_.size())
        return this->at(index).error();
    return this->set(index, FieldValue::Observed(literal, this->entries_[index]->source()));
}

auto Field::set(Source const& source, FieldValuePtr value) -> std::optional<Error> {
    if (auto index = this->indexOf(source))
        return this->set(*index, std::move(value));
    if (auto error = this->validateIncoming(value, Expectation{.source = source}))
        return error;
    auto next = this->entries_;
    next.push_back(std::move(value));
    return this->commit(std::move(next), Notify::No);
}

auto Field::set(Source const& source, Value const& literal) -> std::optional<Error> {
    return this->set(source, FieldValue::Observed(literal, source));
}

auto Field::set(std::string_view source, Value const& literal) -> std::optional<Error> {
    return this->set(Source{source}, literal);
}

auto Field::remove(std::size_t index) -> Expected<FieldValuePtr> {
    if (index >= this->entries_.size())
        return std::unexpected(this->at(index).error());
    auto removed = this->entries_[index];
    auto next    = this->entries_;
    next.erase(next.begin() + static_cast<std::ptrdiff_t>(index));
    if (auto error = this->commit(std::move(next), Notify::No))
        return std::unexpected(*error);
    return removed;
}

auto Field::remove(Source const& source) -> Expected<FieldValuePtr> {
    auto index = this->indexOf(source);
    if (!index)
        return std::unexpected(this->at(source).error());
    return this->remove(*index);
}

auto Field::remove(std::string_view key) -> Expected<FieldValuePtr> {
    auto found = this->at(key);
    if (!found)
        return std::unexpected(found.error());
    return this->remove(*this->indexOf(**found));
}

auto Field::insert(std::size_t position, FieldValuePtr value, SourceCheck check) -> std::optional<Error> {
    if (auto error = this->validateIncoming(value, Expectation{.check = check}))
        return error;
    position  = std::min(position, this->entries_.size());
    auto next = this->entries_;
    next.insert(next.begin() + static_cast<std::ptrdiff_t>(position), std::move(value));
    return this->commit(std::move(next), Notify::No);
}

auto Field::current() const -> Expected<FieldValuePtr> {
    if (this->entries_.empty())
        return std::unexpected(Error{Error::Code::EmptyField, "Field " + this->fieldName + " empty"});
    return this->entries_.front();
}

auto Field::currentValue() const -> Expected<Value> {
    auto front = this->current();
    if (!front)
        return std::unexpected(front.error());
    return (*front)->value();
}

auto Field::setCurrent(FieldValuePtr value) -> std::optional<Error> {
    if (!value)
        return Error{Error::Code::MalformedInput, "null FieldValue"};
    auto next = this->entries_;
    if (auto index = this->indexOf(*value)) {
        next.erase(next.begin() + static_cast<std::ptrdiff_t>(*index));
    } else if (auto error = this->validateIncoming(value, Expectation{})) {
        return error;
    }
    next.insert(next.begin(), std::move(value));
    return this->commit(std::move(next), Notify::Always);
}

auto Field::setCurrent(Source const& source) -> std::optional<Error> {
    auto found = this->at(source);
    if (!found)
        return found.error();
    return this->setCurrent(*found);
}

auto Field::setCurrent(Value const& literal, Source const& source) -> std::optional<Error> {
    auto value = FieldValue::Observed(literal, source);
    auto next  = this->entries_;
    if (auto index = this->indexOf(source)) {
        if (auto error = this->validateIncoming(value, Expectation{.source = source, .replacing = *index}))
            return error;
        next.erase(next.begin() + static_cast<std::ptrdiff_t>(*index));
    } else if (auto error = this->validateIncoming(value, Expectation{})) {
        return error;
    }
    next.insert(next.begin(), std::move(value));
    return this->commit(std::move(next), Notify::Always);
}

auto Field::setDefault(Value const& literal) -> std::optional<Error> {
    return this->set(Source::None(), literal);
}

auto Field::defaultValue() const -> Expected<Value> {
    auto slot = this->at(Source::None());
    if (!slot)
        return std::unexpected(slot.error());
    return (*slot)->value();
}

auto Field::clearDefault() -> std::optional<Error> {
    auto removed = this->remove(Source::None());
    if (!removed)
        return removed.error();
    return std::nullopt;
}

auto Field::registerNotifier(std::shared_ptr<FieldNotifier> const& notifier) -> void {
    if (!notifier)
        return;
    for (auto const& existing : this->notifiers)
        if (existing.lock() == notifier)
            return;
    this->notifiers.push_back(notifier);
}

auto Field::unregisterNotifier(std::shared_ptr<FieldNotifier> const& notifier) -> void {
    std::erase_if(this->notifiers, [&notifier](auto const& handle) {
        auto live = handle.lock();
        return !live || live == notifier;
    });
}

auto Field::notifyValueChange(FieldValuePtr const& oldValue, FieldValuePtr const& newValue) -> std::optional<Error> {
    InvalidationScope scope;
    return this->notifyValueChange(oldValue, newValue, scope);
}

auto Field::notifyValueChange(FieldValuePtr const& oldValue, FieldValuePtr const& newValue, InvalidationScope& scope)
        -> std::optional<Error> {
    // A notifier may register further notifiers; only the ones present now are called.
    auto const round = this->notifiers;
    oc_log("Notifying " + std::to_string(round.size()) + " notifiers of Field " + this->fieldName, "Notify");

    std::optional<Error> failure;
    for (auto const& handle : round) {
        auto notifier = handle.lock();
        if (!notifier)
            continue;
        if ((failure = notifier->notify(oldValue, newValue, scope)))
            break;
    }
    std::erase_if(this->notifiers, [](auto const& handle) { return handle.expired(); });
    return failure;
}

auto Field::values() const -> Expected<std::vector<Value>> {
    std::vector<Value> out;
    out.reserve(this->entries_.size());
    for (auto const& entry : this->entries_) {
        auto value = entry->value();
        if (!value)
            return std::unexpected(value.error());
        out.push_back(std::move(*value));
    }
    return out;
}

auto Field::sources() const -> std::vector<Source> {
    std::vector<Source> out;
    out.reserve(this->entries_.size());
    for (auto const& entry : this->entries_)
        out.push_back(entry->source());
    return out;
}

auto Field::sourceNames() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(this->entries_.size());
    for (auto const& entry : this->entries_)
        out.push_back(entry->source().name());
    return out;
}

auto Field::observed() const -> std::vector<FieldValuePtr> {
    std::vector<FieldValuePtr> out;
    for (auto const& entry : this->entries_)
        if (entry->isObserved() && !entry->source().isNone())
            out.push_back(entry);
    return out;
}

auto Field::derived() const -> std::vector<FieldValuePtr> {
    std::vector<FieldValuePtr> out;
    for (auto const& entry : this->entries_)
        if (entry->isDerived())
            out.push_back(entry);
    return out;
}

auto Field::describe() const -> std::string {
    std::string out = "Field " + this->fieldName + ":[";
    for (std::size_t i = 0; i < this->entries_.size(); ++i) {
        if (i > 0)
            out.append(", ");
        out.append(this->entries_[i]->describe());
    }
    out.push_back(']');
    return out;
}

auto Field::describeCurrent() const -> std::string {
    if (this->entries_.empty())
        return "Field " + this->fieldName + " empty";
    auto value = this->entries_.front()->value(FailurePolicy::Skip);
    if (!value)
        return "Field " + this->fieldName + ": " + describeError(value.error());
    return "Field " + this->fieldName + ": " + value->describe();
}

auto Field::setNode(std::shared_ptr<FieldNode> const& node) -> void {
    this->container = node;
    for (auto const& entry : this->entries_)
        if (auto* computed = entry->derived())
            computed->setPathNode(node);
}

} // namespace OC
