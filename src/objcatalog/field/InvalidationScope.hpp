#pragma once
#include "core/Error.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace OC {

class DerivedValue;

/**
 * Tracks the derived values whose invalidation is in progress along one chain
 * of change notifications. Entering a value that is already in flight means the
 * value depends on itself and fails with Cycle. Values leave the scope once their
 * own notifications finish, so two paths converging on the same value are fine.
 */
class InvalidationScope {
public:
    class Guard {
    public:
        Guard(InvalidationScope& scope, DerivedValue const* value)
            : scope(&scope), value(value) {}
        Guard(Guard&& other) noexcept
            : scope(other.scope), value(other.value) { other.scope = nullptr; }
        Guard(Guard const&)            = delete;
        Guard& operator=(Guard const&) = delete;
        Guard& operator=(Guard&&)      = delete;
        ~Guard() {
            if (this->scope)
                this->scope->leave(this->value);
        }

    private:
        InvalidationScope*  scope;
        DerivedValue const* value;
    };

    auto enter(DerivedValue const* value) -> Expected<Guard> {
        if (this->inFlight(value))
            return std::unexpected(Error{Error::Code::Cycle, "attempting to invalidate a derived value that results in a cycle"});
        this->stack.push_back(value);
        return Guard{*this, value};
    }

    [[nodiscard]] auto inFlight(DerivedValue const* value) const -> bool {
        return std::find(this->stack.begin(), this->stack.end(), value) != this->stack.end();
    }

    [[nodiscard]] auto depth() const -> std::size_t { return this->stack.size(); }

private:
    auto leave(DerivedValue const* value) -> void {
        auto it = std::find(this->stack.rbegin(), this->stack.rend(), value);
        if (it != this->stack.rend())
            this->stack.erase(std::next(it).base());
    }

    std::vector<DerivedValue const*> stack;
};

} // namespace OC
