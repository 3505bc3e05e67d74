#pragma once
#include "core/Error.hpp"
#include "source/Bibliographic.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace OC {

struct SourceRecord {
    std::string                name;
    std::optional<std::string> locationCode;
};

/**
 * Interned provenance identity.
 *
 * Two Sources built from the same name are the same identity for as long as
 * either is alive. The spec string may carry a location:
 * - "X/loc": identity "X", location "loc" resolved through the registry's
 *   bibliographic resolver (kept verbatim when none is installed)
 * - "X//code": identity "X", code stored verbatim
 *
 * The location lives on the shared identity, so giving a location to an
 * existing identity updates it for every holder.
 */
class Source {
public:
    explicit Source(std::string_view spec);

    // Strict variant of the constructor: rejects an empty name and reports resolver failures.
    static auto Intern(std::string_view spec) -> Expected<Source>;
    // Reserved identity of a Field's default slot.
    static auto None() -> Source const&;
    // Fresh identity "dependent<N>" for a derived value.
    static auto Dependent() -> Source;

    [[nodiscard]] auto name() const -> std::string const& { return this->entry->name; }
    [[nodiscard]] auto location() const -> std::optional<std::string> const& { return this->entry->locationCode; }
    [[nodiscard]] auto isNone() const -> bool;

    /**
     * Resolves and stores a location for this identity. An empty locator
     * clears it. On failure the location is left unchanged.
     */
    auto setLocation(std::string_view locator) -> std::optional<Error>;
    auto setLocationCode(std::string_view code) -> void;

    // Spec string that reinterns to this identity and location ("X" or "X//code").
    [[nodiscard]] auto key() const -> std::string;
    [[nodiscard]] auto describe() const -> std::string;

    auto record(BibliographicResolver& resolver) const -> Expected<BibRecord>;

    [[nodiscard]] auto identity() const -> SourceRecord const* { return this->entry.get(); }

    friend auto operator==(Source const& lhs, Source const& rhs) -> bool { return lhs.entry == rhs.entry; }

private:
    explicit Source(std::shared_ptr<SourceRecord> record)
        : entry(std::move(record)) {}

    std::shared_ptr<SourceRecord> entry;

    friend class SourceRegistry;
};

struct TransparentStringHash {
    using is_transparent = void;

    auto operator()(std::string_view value) const noexcept -> std::size_t { return std::hash<std::string_view>{}(value); }
    auto operator()(std::string const& value) const noexcept -> std::size_t { return std::hash<std::string_view>{}(value); }
};

/**
 * Process-wide intern table for Sources.
 *
 * Entries are weak; a name whose last Source died is interned afresh. The table
 * is guarded by a mutex so interning itself is safe from any thread.
 */
class SourceRegistry {
public:
    static auto instance() -> SourceRegistry&;

    SourceRegistry(SourceRegistry const&)            = delete;
    SourceRegistry& operator=(SourceRegistry const&) = delete;

    auto intern(std::string_view name) -> Source;
    // Live identity for a name, without creating one.
    auto find(std::string_view name) const -> std::optional<Source>;
    auto nextDependentName() -> std::string;

    auto setResolver(std::shared_ptr<BibliographicResolver> resolver) -> void;
    [[nodiscard]] auto resolver() const -> std::shared_ptr<BibliographicResolver>;

    // Number of live identities; dead entries are dropped on the way.
    auto size() -> std::size_t;

private:
    SourceRegistry() = default;

    using Table = phmap::flat_hash_map<std::string, std::weak_ptr<SourceRecord>, TransparentStringHash, std::equal_to<>>;

    mutable std::mutex                     mutex;
    Table                                  table;
    std::shared_ptr<BibliographicResolver> bibResolver;
    std::size_t                            dependentCounter = 0;
};

} // namespace OC
