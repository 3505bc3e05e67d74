#include "Source.hpp"
#include "log/TaggedLogger.hpp"

#include <cctype>

namespace OC {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

struct SourceSpec {
    std::string_view                name;
    std::optional<std::string_view> locator;
    bool                            verbatim = false;
};

// "X" | "X/locator" | "X//code"; the last slash separates the location.
auto splitSpec(std::string_view spec) -> SourceSpec {
    auto const slash = spec.rfind('/');
    if (slash == std::string_view::npos)
        return SourceSpec{trim(spec), std::nullopt, false};
    if (slash > 0 && spec[slash - 1] == '/')
        return SourceSpec{trim(spec.substr(0, slash - 1)), trim(spec.substr(slash + 1)), true};
    return SourceSpec{trim(spec.substr(0, slash)), trim(spec.substr(slash + 1)), false};
}

auto resolveLocator(std::string_view locator) -> Expected<std::string> {
    auto resolver = SourceRegistry::instance().resolver();
    if (!resolver)
        return std::string{locator};
    return resolver->resolveCode(locator);
}

auto assignCode(std::shared_ptr<SourceRecord> const& record, std::string code) -> void {
    if (record->locationCode && *record->locationCode != code)
        oc_log("Overwriting location " + *record->locationCode + " with " + code + " for Source " + record->name, "WARN");
    record->locationCode = std::move(code);
}

} // namespace

Source::Source(std::string_view spec) {
    auto const parsed = splitSpec(spec);
    this->entry      = SourceRegistry::instance().intern(parsed.name).entry;
    if (!parsed.locator || parsed.locator->empty())
        return;
    if (parsed.verbatim) {
        assignCode(this->entry, std::string{*parsed.locator});
        return;
    }
    auto code = resolveLocator(*parsed.locator);
    if (!code) {
        oc_log("Could not resolve location " + std::string{*parsed.locator} + " for Source " + this->entry->name + ": "
                       + describeError(code.error()),
               "WARN");
        return;
    }
    assignCode(this->entry, std::move(*code));
}

auto Source::Intern(std::string_view spec) -> Expected<Source> {
    auto const parsed = splitSpec(spec);
    if (parsed.name.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "Source name is empty"});

    std::optional<std::string> code;
    if (parsed.locator && !parsed.locator->empty()) {
        if (parsed.verbatim) {
            code = std::string{*parsed.locator};
        } else {
            auto resolved = resolveLocator(*parsed.locator);
            if (!resolved)
                return std::unexpected(resolved.error());
            code = std::move(*resolved);
        }
    }

    auto source = SourceRegistry::instance().intern(parsed.name);
    if (code)
        assignCode(source.entry, std::move(*code));
    return source;
}

auto Source::None() -> Source const& {
    static Source const none{std::make_shared<SourceRecord>(SourceRecord{.name = "None", .locationCode = std::nullopt})};
    return none;
}

auto Source::Dependent() -> Source {
    auto& registry = SourceRegistry::instance();
    return registry.intern(registry.nextDependentName());
}

auto Source::isNone() const -> bool {
    return this->entry == None().entry;
}

auto Source::setLocation(std::string_view locator) -> std::optional<Error> {
    auto const trimmed = trim(locator);
    if (trimmed.empty()) {
        this->entry->locationCode.reset();
        return std::nullopt;
    }
    auto code = resolveLocator(trimmed);
    if (!code)
        return code.error();
    this->entry->locationCode = std::move(*code);
    return std::nullopt;
}

auto Source::setLocationCode(std::string_view code) -> void {
    auto const trimmed = trim(code);
    if (trimmed.empty())
        this->entry->locationCode.reset();
    else
        this->entry->locationCode = std::string{trimmed};
}

auto Source::key() const -> std::string {
    if (!this->entry->locationCode)
        return this->entry->name;
    return this->entry->name + "//" + *this->entry->locationCode;
}

auto Source::describe() const -> std::string {
    std::string out = "Source " + this->entry->name;
    if (this->entry->locationCode)
        out += " @" + *this->entry->locationCode;
    return out;
}

auto Source::record(BibliographicResolver& resolver) const -> Expected<BibRecord> {
    if (!this->entry->locationCode)
        return std::unexpected(Error{Error::Code::SourceDataMissing, "No location provided for " + this->describe()});
    return resolver.fetchRecord(*this->entry->locationCode);
}

auto SourceRegistry::instance() -> SourceRegistry& {
    static SourceRegistry registry;
    return registry;
}

auto SourceRegistry::intern(std::string_view name) -> Source {
    if (name == Source::None().name())
        return Source::None();
    std::lock_guard<std::mutex> lock(this->mutex);
    if (auto it = this->table.find(name); it != this->table.end())
        if (auto live = it->second.lock())
            return Source{std::move(live)};

    auto fresh = std::make_shared<SourceRecord>(SourceRecord{.name = std::string{name}, .locationCode = std::nullopt});
    this->table.insert_or_assign(std::string{name}, std::weak_ptr<SourceRecord>{fresh});
    return Source{std::move(fresh)};
}

auto SourceRegistry::find(std::string_view name) const -> std::optional<Source> {
    if (name == Source::None().name())
        return Source::None();
    std::lock_guard<std::mutex> lock(this->mutex);
    if (auto it = this->table.find(name); it != this->table.end())
        if (auto live = it->second.lock())
            return Source{std::move(live)};
    return std::nullopt;
}

auto SourceRegistry::nextDependentName() -> std::string {
    std::lock_guard<std::mutex> lock(this->mutex);
    while (true) {
        auto candidate = "dependent" + std::to_string(this->dependentCounter++);
        auto it        = this->table.find(candidate);
        if (it == this->table.end() || it->second.expired())
            return candidate;
    }
}

auto SourceRegistry::setResolver(std::shared_ptr<BibliographicResolver> resolver) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->bibResolver = std::move(resolver);
}

auto SourceRegistry::resolver() const -> std::shared_ptr<BibliographicResolver> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->bibResolver;
}

auto SourceRegistry::size() -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    for (auto it = this->table.begin(); it != this->table.end();) {
        if (it->second.expired())
            this->table.erase(it++);
        else
            ++it;
    }
    return this->table.size();
}

} // namespace OC
