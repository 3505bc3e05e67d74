#pragma once
#include "core/Error.hpp"

#include <any>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace OC {

enum struct ValueCategory {
    None = 0,
    Boolean,
    Integral,
    FloatingPoint,
    String,
    Array,
    Object
};

// ########### Type Detection Concepts ###########

template <typename T>
concept StringLike = std::is_convertible_v<T, std::string_view> && !std::is_same_v<std::remove_cvref_t<T>, std::nullptr_t>;

template <typename T>
struct is_std_vector : std::false_type {};

template <typename E, typename A>
struct is_std_vector<std::vector<E, A>> : std::true_type {};

template <typename T>
concept VectorType = is_std_vector<std::remove_cvref_t<T>>::value;

template <typename T>
concept ArithmeticType = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

// String-like inputs are stored as std::string so that "abc" and std::string("abc") compare equal.
template <typename T>
struct StoredTypeFor {
    using type = std::remove_cvref_t<T>;
};

template <StringLike T>
struct StoredTypeFor<T> {
    using type = std::string;
};

template <typename T>
using StoredType = typename StoredTypeFor<std::decay_t<T>>::type;

/**
 * Compile-time captured description of a leaf value type. Every operation the
 * catalog performs on an opaque value (comparison, description, numeric
 * conversion, element type inference) goes through these entries.
 */
struct ValueMetadata {
    std::type_info const* typeInfo        = nullptr;
    std::type_info const* elementTypeInfo = nullptr;
    ValueCategory         category        = ValueCategory::None;
    ValueCategory         elementCategory = ValueCategory::None;

    bool (*equals)(std::any const&, std::any const&)             = nullptr;
    std::string (*describe)(std::any const&)                     = nullptr;
    std::optional<long double> (*toLongDouble)(std::any const&) = nullptr;
};

template <typename T>
constexpr auto categoryOf() -> ValueCategory {
    if constexpr (std::is_same_v<T, bool>)
        return ValueCategory::Boolean;
    else if constexpr (std::is_integral_v<T>)
        return ValueCategory::Integral;
    else if constexpr (std::is_floating_point_v<T>)
        return ValueCategory::FloatingPoint;
    else if constexpr (std::is_same_v<T, std::string>)
        return ValueCategory::String;
    else if constexpr (VectorType<T>)
        return ValueCategory::Array;
    else
        return ValueCategory::Object;
}

namespace detail {

template <typename T>
auto describeTyped(T const& value) -> std::string {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return value;
    } else if constexpr (std::is_arithmetic_v<T>) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else if constexpr (VectorType<T>) {
        std::string out{"["};
        bool        first = true;
        for (auto const& element : value) {
            if (!first)
                out.append(", ");
            out.append(describeTyped<std::remove_cvref_t<decltype(element)>>(element));
            first = false;
        }
        out.push_back(']');
        return out;
    } else if constexpr (requires(std::ostream& os, T const& v) { os << v; }) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return std::string{"<"} + typeid(T).name() + ">";
    }
}

template <typename T>
auto equalsErased(std::any const& lhs, std::any const& rhs) -> bool {
    auto const* a = std::any_cast<T>(&lhs);
    auto const* b = std::any_cast<T>(&rhs);
    if (!a || !b)
        return false;
    if constexpr (std::equality_comparable<T>)
        return *a == *b;
    else
        return a == b;
}

template <typename T>
auto describeErased(std::any const& value) -> std::string {
    if (auto const* typed = std::any_cast<T>(&value))
        return describeTyped<T>(*typed);
    return "<empty>";
}

template <typename T>
auto toLongDoubleErased(std::any const& value) -> std::optional<long double> {
    if constexpr (std::is_arithmetic_v<T>) {
        if (auto const* typed = std::any_cast<T>(&value))
            return static_cast<long double>(*typed);
    }
    return std::nullopt;
}

template <typename T>
constexpr auto elementTypeInfoOf() -> std::type_info const* {
    if constexpr (VectorType<T>)
        return &typeid(typename T::value_type);
    else
        return nullptr;
}

template <typename T>
constexpr auto elementCategoryOf() -> ValueCategory {
    if constexpr (VectorType<T>)
        return categoryOf<typename T::value_type>();
    else
        return ValueCategory::None;
}

} // namespace detail

template <typename T>
struct ValueMetadataT {
    inline static ValueMetadata const metadata{
            .typeInfo        = &typeid(T),
            .elementTypeInfo = detail::elementTypeInfoOf<T>(),
            .category        = categoryOf<T>(),
            .elementCategory = detail::elementCategoryOf<T>(),
            .equals          = &detail::equalsErased<T>,
            .describe        = &detail::describeErased<T>,
            .toLongDouble    = &detail::toLongDoubleErased<T>};
};

/**
 * Opaque leaf value stored in Fields.
 *
 * A default constructed Value is null and stands for "absent". Any copyable
 * type can be stored; the catalog only ever inspects it through ValueMetadata.
 */
class Value {
public:
    Value() = default;

    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, Value> && !std::is_same_v<std::remove_cvref_t<T>, std::nullptr_t>)
    Value(T&& value)
        : payload(StoredType<T>(std::forward<T>(value))), meta(&ValueMetadataT<StoredType<T>>::metadata) {}

    Value(std::nullptr_t) {}

    [[nodiscard]] auto isNull() const -> bool { return this->meta == nullptr; }
    explicit operator bool() const { return !this->isNull(); }

    [[nodiscard]] auto metadata() const -> ValueMetadata const* { return this->meta; }
    [[nodiscard]] auto category() const -> ValueCategory { return this->meta ? this->meta->category : ValueCategory::None; }

    // Stored type, nullptr for a null value.
    [[nodiscard]] auto type() const -> std::type_info const* { return this->meta ? this->meta->typeInfo : nullptr; }

    [[nodiscard]] auto typeName() const -> std::string {
        return this->meta ? this->meta->typeInfo->name() : std::string{"null"};
    }

    template <typename T>
    [[nodiscard]] auto holds() const -> bool {
        return this->meta && *this->meta->typeInfo == typeid(StoredType<T>);
    }

    // Exact-type access; nullptr when the value holds another type.
    template <typename T>
    [[nodiscard]] auto get() const -> T const* {
        return std::any_cast<T>(&this->payload);
    }

    /**
     * Typed read. The exact stored type is returned as is; arithmetic values
     * convert to any other arithmetic type they fit in. Anything else is a
     * TypeMismatch.
     */
    template <typename T>
    [[nodiscard]] auto as() const -> Expected<T> {
        if (this->isNull())
            return std::unexpected(Error{Error::Code::EmptyField, "Value is null"});
        if (auto const* exact = std::any_cast<T>(&this->payload))
            return *exact;
        if constexpr (std::is_arithmetic_v<T>) {
            if (auto number = this->meta->toLongDouble(this->payload)) {
                if (!fitsIn<T>(*number))
                    return std::unexpected(Error{Error::Code::TypeMismatch,
                                                 this->describe() + " is out of range for " + typeid(T).name()});
                return static_cast<T>(*number);
            }
        }
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     std::string{"Value of type "} + this->typeName() + " is not a " + typeid(T).name()});
    }

    [[nodiscard]] auto toNumber() const -> std::optional<long double> {
        if (this->isNull())
            return std::nullopt;
        return this->meta->toLongDouble(this->payload);
    }

    [[nodiscard]] auto describe() const -> std::string {
        return this->meta ? this->meta->describe(this->payload) : std::string{"null"};
    }

    [[nodiscard]] auto raw() const -> std::any const& { return this->payload; }

    friend auto operator==(Value const& lhs, Value const& rhs) -> bool {
        if (lhs.isNull() || rhs.isNull())
            return lhs.isNull() && rhs.isNull();
        if (*lhs.meta->typeInfo != *rhs.meta->typeInfo)
            return false;
        return lhs.meta->equals(lhs.payload, rhs.payload);
    }

private:
    // Whether number converts to T without leaving T's range.
    template <typename T>
    static auto fitsIn(long double number) -> bool {
        if constexpr (std::is_same_v<T, bool>) {
            return true;
        } else if constexpr (std::is_integral_v<T>) {
            if (std::isnan(number))
                return false;
            auto const bound = std::ldexp(1.0L, std::numeric_limits<T>::digits);
            if constexpr (std::is_signed_v<T>)
                return number >= -bound && number < bound;
            else
                return number > -1.0L && number < bound;
        } else {
            return !std::isfinite(number) || std::fabs(number) <= static_cast<long double>(std::numeric_limits<T>::max());
        }
    }

    std::any             payload;
    ValueMetadata const* meta = nullptr;
};

} // namespace OC
