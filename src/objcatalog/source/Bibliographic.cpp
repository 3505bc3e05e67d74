#include "Bibliographic.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace OC {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto toLower(std::string_view text) -> std::string {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

// Removes every occurrence of each marker, longest first, then trims.
auto stripMarkers(std::string text, std::initializer_list<std::string_view> markers) -> std::string {
    for (auto marker : markers) {
        for (auto pos = text.find(marker); pos != std::string::npos; pos = text.find(marker))
            text.erase(pos, marker.size());
    }
    return std::string{trim(text)};
}

} // namespace

auto parseLocator(std::string_view text) -> Expected<Locator> {
    auto const trimmed = trim(text);
    if (trimmed.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "empty locator"});

    auto const lowered = toLower(trimmed);
    if (lowered.find("arxiv") != std::string::npos)
        return Locator{Locator::Kind::ArXiv, stripMarkers(lowered, {"arxiv:", "arxiv"})};
    if (lowered.find("astro-ph") != std::string::npos)
        return Locator{Locator::Kind::ArXiv, lowered};
    if (lowered.find("doi") != std::string::npos)
        return Locator{Locator::Kind::Doi, stripMarkers(lowered, {"doi:", "doi"})};
    if (lowered.find("http") != std::string::npos)
        return Locator{Locator::Kind::Url, std::string{trimmed}};
    return Locator{Locator::Kind::Code, std::string{trimmed}};
}

auto locatorUrl(Locator const& locator, std::string_view host) -> std::string {
    std::string const base = "http://" + std::string{host};
    switch (locator.kind) {
    case Locator::Kind::ArXiv:
        return base + "/abs/arXiv:" + locator.identifier;
    case Locator::Kind::Doi:
        return base + "/doi/" + locator.identifier;
    case Locator::Kind::Url:
        return locator.identifier;
    case Locator::Kind::Code:
        return base + "/abs/" + locator.identifier;
    }
    return base;
}

CachingBibliographicResolver::CachingBibliographicResolver(std::shared_ptr<BibliographicResolver> upstream)
    : upstream(std::move(upstream)) {}

auto CachingBibliographicResolver::resolveCode(std::string_view locator) -> Expected<std::string> {
    if (!this->upstream)
        return std::unexpected(Error{Error::Code::TransportFailure, "no upstream resolver"});
    return this->upstream->resolveCode(locator);
}

auto CachingBibliographicResolver::fetchRecord(std::string_view code) -> Expected<BibRecord> {
    std::string const key{code};
    if (this->cacheEnabled)
        if (auto it = this->cache.find(key); it != this->cache.end())
            return it->second;

    if (!this->upstream)
        return std::unexpected(Error{Error::Code::TransportFailure, "no upstream resolver"});
    auto record = this->upstream->fetchRecord(code);
    if (record && this->cacheEnabled)
        this->cache.insert_or_assign(key, *record);
    return record;
}

auto CachingBibliographicResolver::clearCache(std::optional<std::string_view> code) -> void {
    if (!code) {
        this->cache.clear();
        return;
    }
    this->cache.erase(std::string{*code});
}

auto CachingBibliographicResolver::setCacheEnabled(bool enabled) -> void {
    this->cacheEnabled = enabled;
    if (!enabled)
        this->cache.clear();
}

auto StaticBibliographicResolver::addRecord(std::string code, BibRecord record) -> void {
    this->records.insert_or_assign(std::move(code), std::move(record));
}

auto StaticBibliographicResolver::addAlias(std::string locator, std::string code) -> void {
    this->aliases.insert_or_assign(std::move(locator), std::move(code));
}

auto StaticBibliographicResolver::resolveCode(std::string_view locator) -> Expected<std::string> {
    if (this->transportFailure)
        return std::unexpected(Error{Error::Code::TransportFailure, "bibliographic service unreachable"});

    std::string const key{trim(locator)};
    if (auto it = this->aliases.find(key); it != this->aliases.end())
        return it->second;

    auto parsed = parseLocator(locator);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (auto it = this->aliases.find(parsed->identifier); it != this->aliases.end())
        return it->second;
    if (this->records.contains(parsed->identifier))
        return parsed->identifier;
    return std::unexpected(Error{Error::Code::NoSuchRecord, "no record for locator " + key});
}

auto StaticBibliographicResolver::fetchRecord(std::string_view code) -> Expected<BibRecord> {
    if (this->transportFailure)
        return std::unexpected(Error{Error::Code::TransportFailure, "bibliographic service unreachable"});

    ++this->fetches;
    if (auto it = this->records.find(std::string{code}); it != this->records.end())
        return it->second;
    return std::unexpected(Error{Error::Code::NoSuchRecord, "no record with code " + std::string{code}});
}

} // namespace OC
