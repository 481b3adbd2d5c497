#ifndef OPTBIND_COERCE_HPP
#define OPTBIND_COERCE_HPP

#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace optbind {

enum class Kind {
    Boolean,
    Integer,
    Floating,
    String,
    Enumeration,
    List,
    Custom,
};

std::string_view kindName(Kind kind);

// Describes the target type of a coercion. Built once per declared option.
struct TypeDescriptor {
    Kind kind{Kind::String};
    std::string name{"string"};

    // Integer
    std::int64_t min{std::numeric_limits<std::int64_t>::min()};
    std::int64_t max{std::numeric_limits<std::int64_t>::max()};

    // Enumeration: constant names and their underlying values, index-aligned.
    std::vector<std::string> constants;
    std::vector<std::int64_t> constantValues;

    // List
    std::shared_ptr<const TypeDescriptor> element;
    char separator{','};

    static TypeDescriptor boolean();
    static TypeDescriptor integer(std::string name = "long",
                                  std::int64_t min = std::numeric_limits<std::int64_t>::min(),
                                  std::int64_t max = std::numeric_limits<std::int64_t>::max());
    static TypeDescriptor floating(std::string name = "double");
    static TypeDescriptor string();
    static TypeDescriptor enumeration(std::string name,
                                      std::vector<std::string> constants,
                                      std::vector<std::int64_t> values);
    static TypeDescriptor list(TypeDescriptor element, char separator = ',');
    static TypeDescriptor custom(std::string tag);

    // Name shown in usage text and documentation. Lists show their element's name.
    [[nodiscard]] const std::string& displayName() const;
};

// Enumeration constants coerce to their name; custom types coerce into std::any.
using Scalar = std::variant<bool, std::int64_t, double, std::string, std::any>;
using OptionValue = std::variant<Scalar, std::vector<Scalar>>;

// String conversions for user-defined types, keyed by type tag.
class CoercionRegistry {
public:
    // Parses one token into `out`. Returns an error message on failure.
    using ParseFunc = std::function<std::optional<std::string>(std::string_view text, std::any& out)>;

    void add(std::string tag, ParseFunc parse) { parsers_[std::move(tag)] = std::move(parse); }

    // Registers a type that knows how to build itself from a single string argument.
    // Exceptions thrown by the constructor are reported as coercion errors.
    template <typename T>
    void addConstructible(std::string tag) {
        static_assert(std::is_constructible_v<T, std::string>, "type must be constructible from std::string");
        auto name = tag;
        add(std::move(tag), [name = std::move(name)](std::string_view text, std::any& out) -> std::optional<std::string> {
            try {
                out = T(std::string(text));
            } catch (const std::exception& e) {
                return "expected " + name + ", got \"" + std::string(text) + "\": " + e.what();
            }
            return std::nullopt;
        });
    }

    [[nodiscard]] bool contains(const std::string& tag) const { return parsers_.find(tag) != parsers_.end(); }

    [[nodiscard]] std::optional<std::string> parse(const std::string& tag, std::string_view text, std::any& out) const;

private:
    std::unordered_map<std::string, ParseFunc> parsers_;
};

// Converts one token to a value of `type`. Returns an error message naming the token and expected type.
[[nodiscard]] std::optional<std::string> coerce(std::string_view text,
                                                const TypeDescriptor& type,
                                                const CoercionRegistry& registry,
                                                OptionValue& out);

// As coerce(), for non-list types.
[[nodiscard]] std::optional<std::string> coerceScalar(std::string_view text,
                                                      const TypeDescriptor& type,
                                                      const CoercionRegistry& registry,
                                                      Scalar& out);

} // namespace optbind

#endif // OPTBIND_COERCE_HPP
