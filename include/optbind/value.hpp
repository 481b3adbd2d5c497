#ifndef OPTBIND_VALUE_HPP
#define OPTBIND_VALUE_HPP

#include <any>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "coerce.hpp"
#include "utils.hpp"

namespace optbind {

// Binds a declared option to the configuration field that owns its value.
//
// Notes:
// - `set()` receives each coerced occurrence in command-line order; repeatable (list) fields append.
// - `set()` returns an error string on failure; empty optional indicates success.
class Value {
public:
    virtual ~Value() = default;

    [[nodiscard]] virtual const TypeDescriptor& type() const = 0;
    // Current value in string form, or empty if the field holds nothing worth reporting as a default.
    [[nodiscard]] virtual std::optional<std::string> string() const = 0;
    // Apply one occurrence.
    [[nodiscard]] virtual std::optional<std::string> set(const OptionValue& value) = 0;
};

namespace detail {

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T, typename = void>
struct is_streamable : std::false_type {};
template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>> : std::true_type {};

template <typename T>
std::optional<T> fromScalar(const Scalar& v, const TypeDescriptor& type) {
    if constexpr (std::is_same_v<T, bool>) {
        if (const auto* b = std::get_if<bool>(&v)) return *b;
    } else if constexpr (std::is_enum_v<T>) {
        if (const auto* name = std::get_if<std::string>(&v)) {
            for (std::size_t i = 0; i < type.constants.size() && i < type.constantValues.size(); ++i) {
                if (type.constants[i] == *name) return static_cast<T>(type.constantValues[i]);
            }
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (const auto* n = std::get_if<std::int64_t>(&v)) return static_cast<T>(*n);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (const auto* d = std::get_if<double>(&v)) return static_cast<T>(*d);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto* s = std::get_if<std::string>(&v)) return *s;
    } else {
        if (const auto* a = std::get_if<std::any>(&v)) {
            if (const auto* p = std::any_cast<T>(a)) return *p;
        }
    }
    return std::nullopt;
}

template <typename T>
std::optional<std::string> formatScalar(const T& v, const TypeDescriptor& type) {
    if constexpr (std::is_same_v<T, bool>) {
        return std::string(v ? "true" : "false");
    } else if constexpr (std::is_enum_v<T>) {
        const auto raw = static_cast<std::int64_t>(v);
        for (std::size_t i = 0; i < type.constants.size() && i < type.constantValues.size(); ++i) {
            if (type.constantValues[i] == raw) return type.constants[i];
        }
        return std::nullopt;
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return v;
    } else if constexpr (is_streamable<T>::value) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    } else {
        return std::nullopt;
    }
}

} // namespace detail

template <typename T>
class FieldValue final : public Value {
public:
    FieldValue(T& field, TypeDescriptor type) : field_(field), type_(std::move(type)) {}

    [[nodiscard]] const TypeDescriptor& type() const override { return type_; }

    [[nodiscard]] std::optional<std::string> string() const override {
        if constexpr (detail::is_vector<T>::value) {
            if (field_.empty()) return std::nullopt;
            std::vector<std::string> parts;
            parts.reserve(field_.size());
            for (const auto& e : field_) {
                auto s = detail::formatScalar(e, *type_.element);
                if (!s) return std::nullopt;
                parts.push_back(std::move(*s));
            }
            return utils::join(parts, std::string(1, type_.separator));
        } else if constexpr (detail::is_optional<T>::value) {
            if (!field_) return std::nullopt;
            return detail::formatScalar(*field_, type_);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (field_.empty()) return std::nullopt;
            return field_;
        } else {
            return detail::formatScalar(field_, type_);
        }
    }

    [[nodiscard]] std::optional<std::string> set(const OptionValue& value) override {
        if constexpr (detail::is_vector<T>::value) {
            const auto* items = std::get_if<std::vector<Scalar>>(&value);
            if (!items) return "expected a list of " + type_.displayName();
            for (const auto& item : *items) {
                auto element = detail::fromScalar<typename T::value_type>(item, *type_.element);
                if (!element) return "value does not match element type " + type_.displayName();
                field_.push_back(std::move(*element));
            }
            return std::nullopt;
        } else {
            const auto* scalar = std::get_if<Scalar>(&value);
            if (!scalar) return "expected a single " + type_.name;
            if constexpr (detail::is_optional<T>::value) {
                auto v = detail::fromScalar<typename T::value_type>(*scalar, type_);
                if (!v) return "value does not match type " + type_.name;
                field_ = std::move(*v);
            } else {
                auto v = detail::fromScalar<T>(*scalar, type_);
                if (!v) return "value does not match type " + type_.name;
                field_ = std::move(*v);
            }
            return std::nullopt;
        }
    }

private:
    T& field_;
    TypeDescriptor type_;
};

} // namespace optbind

#endif // OPTBIND_VALUE_HPP
