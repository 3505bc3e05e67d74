#include "Catalog.hpp"

namespace OC {

auto Catalog::matchesName(std::string_view name) const -> bool {
    return name == this->catalogName || name == this->typeName();
}

} // namespace OC
