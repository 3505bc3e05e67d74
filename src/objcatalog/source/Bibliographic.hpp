#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace OC {

// Metadata describing the publication behind a Source.
struct BibRecord {
    std::vector<std::string>   authors;
    std::string                title;
    std::string                abstract;
    std::string                date;
    std::vector<std::string>   links;
    std::vector<std::string>   keywords;
    std::optional<std::string> keywordType;
};

/**
 * A free-form citation string classified by what it names.
 * "arXiv:0901.0001", "astro-ph/0601001", "doi:10.1086/1234", "http://..." or a
 * raw bibliographic code.
 */
struct Locator {
    enum struct Kind {
        ArXiv = 0,
        Doi,
        Url,
        Code
    };

    Kind        kind = Kind::Code;
    std::string identifier;
};

auto parseLocator(std::string_view text) -> Expected<Locator>;

// Abstract-page URL of a locator on the given bibliographic service.
auto locatorUrl(Locator const& locator, std::string_view host = "adsabs.harvard.edu") -> std::string;

/**
 * Interface to the bibliographic service used to enrich Sources.
 *
 * resolveCode turns a citation string into the service's canonical code.
 * fetchRecord retrieves the record for a code. Both report a missing entry as
 * NoSuchRecord and a failure to reach the service as TransportFailure.
 */
class BibliographicResolver {
public:
    virtual ~BibliographicResolver() = default;

    virtual auto resolveCode(std::string_view locator) -> Expected<std::string> = 0;
    virtual auto fetchRecord(std::string_view code) -> Expected<BibRecord>      = 0;
};

// Caches successful fetches by code in front of another resolver.
class CachingBibliographicResolver final : public BibliographicResolver {
public:
    explicit CachingBibliographicResolver(std::shared_ptr<BibliographicResolver> upstream);

    auto resolveCode(std::string_view locator) -> Expected<std::string> override;
    auto fetchRecord(std::string_view code) -> Expected<BibRecord> override;

    // Drops one cached code, or everything when no code is given.
    auto clearCache(std::optional<std::string_view> code = std::nullopt) -> void;
    // Disabling the cache also empties it.
    auto setCacheEnabled(bool enabled) -> void;
    [[nodiscard]] auto isCacheEnabled() const -> bool { return this->cacheEnabled; }
    [[nodiscard]] auto cacheSize() const -> std::size_t { return this->cache.size(); }

private:
    std::shared_ptr<BibliographicResolver>     upstream;
    phmap::flat_hash_map<std::string, BibRecord> cache;
    bool                                       cacheEnabled = true;
};

/**
 * In-memory resolver over a fixed table of records. Locators resolve through
 * explicit aliases first, then by their parsed identifier.
 */
class StaticBibliographicResolver final : public BibliographicResolver {
public:
    auto addRecord(std::string code, BibRecord record) -> void;
    auto addAlias(std::string locator, std::string code) -> void;
    // While set, every call fails with TransportFailure.
    auto setTransportFailure(bool failing) -> void { this->transportFailure = failing; }

    auto resolveCode(std::string_view locator) -> Expected<std::string> override;
    auto fetchRecord(std::string_view code) -> Expected<BibRecord> override;

    [[nodiscard]] auto fetchCount() const -> std::size_t { return this->fetches; }

private:
    phmap::flat_hash_map<std::string, BibRecord>   records;
    phmap::flat_hash_map<std::string, std::string> aliases;
    bool                                         transportFailure = false;
    std::size_t                                  fetches          = 0;
};

} // namespace OC
