#pragma once
#include "node/Node.hpp"

#include <string>
#include <string_view>

namespace OC {

// Named root of a catalog tree. A Catalog never takes a parent.
class Catalog : public Node {
public:
    explicit Catalog(std::string name = "default Catalog")
        : catalogName(std::move(name)) {}

    [[nodiscard]] auto name() const -> std::string const& { return this->catalogName; }
    auto setName(std::string name) -> void { this->catalogName = std::move(name); }

    [[nodiscard]] auto typeName() const -> std::string override { return "Catalog"; }
    [[nodiscard]] auto matchesName(std::string_view name) const -> bool override;
    [[nodiscard]] auto label() const -> std::string override { return "Catalog " + this->catalogName; }
    [[nodiscard]] auto acceptsParent() const -> bool override { return false; }

private:
    std::string catalogName;
};

} // namespace OC
