#pragma once
#include "core/Error.hpp"
#include "field/InvalidationScope.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace OC {

class FieldValue;
using FieldValuePtr = std::shared_ptr<FieldValue>;

/**
 * Receiver of a Field's change notifications.
 *
 * Fields hold notifiers through weak_ptr only; whoever registers a notifier keeps
 * it alive. A notifier runs before the change is committed, so the Field still
 * reports its old state while notify runs. Returning an error aborts the change.
 *
 * oldValue and newValue are null when the field has no current value before or
 * after the change. A derived value that was invalidated passes itself as both.
 */
struct FieldNotifier {
    virtual ~FieldNotifier() = default;

    virtual auto notify(FieldValuePtr const& oldValue, FieldValuePtr const& newValue, InvalidationScope& scope)
            -> std::optional<Error> = 0;

    /**
     * Wraps a callable taking (old, new) or (old, new, scope) and returning
     * void or std::optional<Error>.
     */
    template <typename F>
    static auto FromCallback(F&& callback) -> std::shared_ptr<FieldNotifier>;
};

template <typename F>
class CallbackNotifier final : public FieldNotifier {
public:
    explicit CallbackNotifier(F callback)
        : callback(std::move(callback)) {}

    auto notify(FieldValuePtr const& oldValue, FieldValuePtr const& newValue, InvalidationScope& scope)
            -> std::optional<Error> override {
        if constexpr (std::is_invocable_v<F&, FieldValuePtr const&, FieldValuePtr const&, InvalidationScope&>) {
            return this->invoke(oldValue, newValue, scope);
        } else {
            return this->invoke(oldValue, newValue);
        }
    }

private:
    template <typename... Args>
    auto invoke(Args&&... args) -> std::optional<Error> {
        using Result = std::invoke_result_t<F&, Args...>;
        if constexpr (std::is_void_v<Result>) {
            this->callback(std::forward<Args>(args)...);
            return std::nullopt;
        } else {
            return this->callback(std::forward<Args>(args)...);
        }
    }

    F callback;
};

template <typename F>
auto FieldNotifier::FromCallback(F&& callback) -> std::shared_ptr<FieldNotifier> {
    return std::make_shared<CallbackNotifier<std::decay_t<F>>>(std::forward<F>(callback));
}

} // namespace OC
