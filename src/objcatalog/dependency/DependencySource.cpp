#include "DependencySource.hpp"
#include "dependency/DependencyPath.hpp"
#include "field/Field.hpp"
#include "field/FieldNotifier.hpp"
#include "log/TaggedLogger.hpp"
#include "node/Node.hpp"

namespace OC {

DependencySource::DependencySource(std::vector<DependencyArg> const& arguments, std::weak_ptr<FieldNotifier> notifier)
    : notifier(std::move(notifier)) {
    auto const listener = this->notifier.lock();
    this->slots.reserve(arguments.size());
    for (auto const& argument : arguments) {
        if (auto const* field = std::get_if<std::shared_ptr<Field>>(&argument)) {
            this->slots.push_back(Slot{.path = std::nullopt, .field = *field});
            if (*field && listener)
                (*field)->registerNotifier(listener);
        } else {
            this->slots.push_back(Slot{.path = std::get<std::string>(argument), .field = {}});
        }
    }
}

auto DependencySource::paths() const -> std::vector<std::optional<std::string>> {
    std::vector<std::optional<std::string>> out;
    out.reserve(this->slots.size());
    for (auto const& slot : this->slots)
        out.push_back(slot.path);
    return out;
}

auto DependencySource::reference(std::size_t index) const -> std::shared_ptr<Field> {
    if (index >= this->slots.size())
        return nullptr;
    return this->slots[index].field.lock();
}

auto DependencySource::isResolved() const -> bool {
    for (auto const& slot : this->slots)
        if (slot.field.expired())
            return false;
    return true;
}

auto DependencySource::setPathNode(std::shared_ptr<Node> const& node) -> void {
    this->origin = node;
    this->dropPathReferences();
}

auto DependencySource::dropPathReferences() -> void {
    auto const listener = this->notifier.lock();
    for (auto& slot : this->slots) {
        if (!slot.path)
            continue;
        if (auto live = slot.field.lock(); live && listener)
            live->unregisterNotifier(listener);
        slot.field.reset();
    }
}

auto DependencySource::subscribe() -> void {
    this->listening = true;
    auto const listener = this->notifier.lock();
    if (!listener)
        return;
    for (auto const& slot : this->slots)
        if (auto live = slot.field.lock())
            live->registerNotifier(listener);
}

auto DependencySource::unsubscribe() -> void {
    this->listening = false;
    auto const listener = this->notifier.lock();
    if (!listener)
        return;
    for (auto const& slot : this->slots)
        if (auto live = slot.field.lock())
            live->unregisterNotifier(listener);
}

auto DependencySource::populateReferences() -> Expected<std::vector<std::shared_ptr<Field>>> {
    std::vector<std::shared_ptr<Field>> fields;
    std::vector<std::size_t>            failed;
    std::optional<Error>                firstCause;
    auto const                          node     = this->origin.lock();
    auto const                          listener = this->notifier.lock();

    fields.reserve(this->slots.size());
    for (std::size_t i = 0; i < this->slots.size(); ++i) {
        auto& slot = this->slots[i];
        if (auto live = slot.field.lock()) {
            fields.push_back(std::move(live));
            continue;
        }
        fields.push_back(nullptr);
        if (!slot.path || !node) {
            failed.push_back(i);
            continue;
        }

        auto resolved = DependencyPath::Parse(*slot.path).and_then([&node](DependencyPath const& path) { return path.resolve(*node); });
        if (!resolved) {
            oc_log("Could not resolve \"" + *slot.path + "\": " + describeError(resolved.error()), "Resolve");
            if (!firstCause)
                firstCause = resolved.error();
            failed.push_back(i);
            continue;
        }
        slot.field = *resolved;
        if (listener && this->listening)
            (*resolved)->registerNotifier(listener);
        fields.back() = std::move(*resolved);
    }

    if (failed.empty())
        return fields;
    if (!node)
        return std::unexpected(
                Error{Error::Code::UnresolvedDependency, "Missing/dead field(s) cannot be dereferenced without a catalog location", failed});
    std::string message = "dependency path(s) could not be resolved";
    if (firstCause)
        message += ": " + describeError(*firstCause);
    return std::unexpected(Error{Error::Code::UnresolvedDependency, message, failed});
}

auto DependencySource::dependencyValues() -> Expected<std::vector<Value>> {
    auto fields = this->populateReferences();
    if (!fields)
        return std::unexpected(fields.error());

    std::vector<Value> values;
    values.reserve(fields->size());
    for (auto const& field : *fields) {
        auto value = field->currentValue();
        if (!value)
            return std::unexpected(value.error());
        values.push_back(std::move(*value));
    }
    return values;
}

} // namespace OC
