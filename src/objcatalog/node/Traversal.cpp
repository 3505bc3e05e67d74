#include "Traversal.hpp"

#include <algorithm>
#include <cmath>

namespace OC {

auto Traversal::rootPosition(std::size_t childCount) const -> std::size_t {
    auto const n = static_cast<long long>(childCount);
    switch (this->order) {
    case Order::Pre:
        return 0;
    case Order::Post:
    case Order::Level:
        return childCount;
    case Order::RootIndex: {
        long long const index    = this->rootIndex;
        long long const position = index >= 0 ? index : n + 1 + index;
        if (position < 0 || position > n)
            return childCount;
        return static_cast<std::size_t>(position);
    }
    case Order::RootFraction: {
        long long position = 0;
        if (this->rootFraction >= 0.0)
            position = static_cast<long long>(std::trunc(this->rootFraction * static_cast<double>(n)));
        else
            position = n + 1 + static_cast<long long>(std::floor(this->rootFraction * static_cast<double>(n + 1)));
        return static_cast<std::size_t>(std::clamp<long long>(position, 0, n));
    }
    }
    return childCount;
}

} // namespace OC
