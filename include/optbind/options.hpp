#ifndef OPTBIND_OPTIONS_HPP
#define OPTBIND_OPTIONS_HPP

#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "coerce.hpp"
#include "option.hpp"
#include "value.hpp"

namespace optbind {

class Parser;

enum class RepeatPolicy {
    LastWins,  // a single-valued option given twice keeps the last value
    Reject,    // ... is a parse error
};

class ParseResult {
public:
    static ParseResult success(std::vector<std::string> arguments) {
        ParseResult r;
        r.arguments_ = std::move(arguments);
        return r;
    }

    static ParseResult failure(std::string error, std::string token) {
        ParseResult r;
        r.ok_ = false;
        r.error_ = std::move(error);
        r.token_ = std::move(token);
        return r;
    }

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] const std::string& error() const { return error_; }
    // The offending command-line token, when there is one.
    [[nodiscard]] const std::string& token() const { return token_; }
    // Non-option arguments, in their original order.
    [[nodiscard]] const std::vector<std::string>& arguments() const { return arguments_; }

private:
    bool ok_{true};
    std::string error_;
    std::string token_;
    std::vector<std::string> arguments_;
};

// Registry of declared options, bound to the configuration fields they set.
class Options {
public:
    Options() = default;
    Options(const Options&) = delete;
    Options& operator=(const Options&) = delete;

    // Subsequent add() calls declare fields of this configuration holder.
    Options& holder(std::string typeName) {
        holders_.push_back(typeName);
        currentHolder_ = std::move(typeName);
        currentGroup_.reset();
        return *this;
    }

    template <typename T>
    Options& add(T& field, OptionSpec decl) {
        auto type = describe<T>(decl);
        registerOption(std::move(decl), std::make_shared<FieldValue<T>>(field, std::move(type)));
        return *this;
    }

    // Makes enum type E coercible from its constant names (case-sensitive).
    template <typename E>
    Options& enumeration(std::string name, std::vector<std::pair<std::string, E>> constants) {
        static_assert(std::is_enum_v<E>, "enumeration() requires an enum type");
        std::vector<std::string> names;
        std::vector<std::int64_t> values;
        for (auto& [n, v] : constants) {
            names.push_back(std::move(n));
            values.push_back(static_cast<std::int64_t>(v));
        }
        enums_[std::type_index(typeid(E))] = TypeDescriptor::enumeration(std::move(name), std::move(names), std::move(values));
        return *this;
    }

    // Registers T under `tag`, converted through its std::string constructor.
    template <typename T>
    Options& registerType(std::string tag) {
        customTags_[std::type_index(typeid(T))] = tag;
        coercions_.addConstructible<T>(std::move(tag));
        return *this;
    }

    // Registers T under `tag` with an explicit conversion returning empty on malformed text.
    template <typename T>
    Options& registerType(std::string tag, std::function<std::optional<T>(std::string_view)> parse) {
        customTags_[std::type_index(typeid(T))] = tag;
        auto name = tag;
        coercions_.add(std::move(tag),
                       [name = std::move(name), parse = std::move(parse)](std::string_view text,
                                                                         std::any& out) -> std::optional<std::string> {
                           auto v = parse(text);
                           if (!v) return "expected " + name + ", got \"" + std::string(text) + "\"";
                           out = std::move(*v);
                           return std::nullopt;
                       });
        return *this;
    }

    // Lets `-name` select a long option. Throws DeclarationError if a one-letter long name would
    // shadow another option's short name.
    Options& useSingleDash(bool v = true);

    Options& repeatPolicy(RepeatPolicy p) {
        repeatPolicy_ = p;
        return *this;
    }

    // Default separator for list options declared after this call.
    Options& listSeparator(char sep) {
        listSeparator_ = sep;
        return *this;
    }

    // Replaces '_' when deriving long names from field names; applies to later declarations.
    // Lookup does not depend on it: `_` and `-` are interchangeable in long-option tokens.
    Options& wordSeparator(char sep) {
        wordSeparator_ = sep;
        return *this;
    }

    Options& suggestions(bool v = true) {
        suggestions_ = v;
        return *this;
    }

    [[nodiscard]] bool isUsingSingleDash() const { return useSingleDash_; }
    [[nodiscard]] bool isUsingGroups() const { return usingGroups_; }
    [[nodiscard]] RepeatPolicy repeatPolicy() const { return repeatPolicy_; }
    [[nodiscard]] char wordSeparator() const { return wordSeparator_; }
    [[nodiscard]] bool suggestionsEnabled() const { return suggestions_; }
    [[nodiscard]] const std::string& longPrefix() const;

    [[nodiscard]] std::vector<const OptionField*> options() const;
    [[nodiscard]] const std::vector<OptionGroup>& groups() const { return groups_; }
    [[nodiscard]] const std::vector<std::string>& holders() const { return holders_; }
    [[nodiscard]] const CoercionRegistry& coercions() const { return coercions_; }

    // `name` without its dash prefix; `_` and `-` match each other.
    [[nodiscard]] const OptionField* findLong(const std::string& name) const;
    [[nodiscard]] const OptionField* findShort(char name) const;
    [[nodiscard]] const OptionField* findAlias(const std::string& spelling) const;
    // Every accepted spelling, with its dash prefix.
    [[nodiscard]] std::vector<std::string> spellings() const;

    // Parses `args` (program name excluded) and writes the values into the bound fields.
    ParseResult parse(const std::vector<std::string>& args);
    ParseResult parse(int argc, char** argv);

    // Replays a successful parse into the bound fields, in command-line order.
    [[nodiscard]] std::optional<std::string> apply(const Parser& parser);

    [[nodiscard]] std::string usage(bool includeUnpublicized = false) const;
    void printUsage(std::ostream& os) const { os << usage(); }
    // One "name=value" line per option, current values.
    [[nodiscard]] std::string settings() const;

private:
    template <typename T>
    static constexpr const char* integerName() {
        if constexpr (std::is_signed_v<T>) {
            return sizeof(T) > sizeof(std::int32_t) ? "long" : "int";
        } else {
            return sizeof(T) > sizeof(std::uint32_t) ? "ulong" : "uint";
        }
    }

    template <typename T>
    TypeDescriptor describe(const OptionSpec& decl) const {
        if constexpr (detail::is_vector<T>::value) {
            using E = typename T::value_type;
            static_assert(!detail::is_vector<E>::value && !detail::is_optional<E>::value,
                          "list elements must be scalar types");
            return TypeDescriptor::list(describe<E>(decl), decl.separator_.value_or(listSeparator_));
        } else if constexpr (detail::is_optional<T>::value) {
            static_assert(!detail::is_vector<typename T::value_type>::value, "optional lists are not supported");
            return describe<typename T::value_type>(decl);
        } else if constexpr (std::is_same_v<T, bool>) {
            return TypeDescriptor::boolean();
        } else if constexpr (std::is_enum_v<T>) {
            const auto it = enums_.find(std::type_index(typeid(T)));
            if (it == enums_.end()) {
                throw DeclarationError(fieldLabel(decl) + ": enum type " + typeid(T).name() + " has no registered constants");
            }
            return it->second;
        } else if constexpr (std::is_integral_v<T>) {
            constexpr bool wide = std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t);
            const std::int64_t hi = wide ? std::numeric_limits<std::int64_t>::max()
                                         : static_cast<std::int64_t>(std::numeric_limits<T>::max());
            return TypeDescriptor::integer(integerName<T>(), static_cast<std::int64_t>(std::numeric_limits<T>::min()), hi);
        } else if constexpr (std::is_floating_point_v<T>) {
            return TypeDescriptor::floating(std::is_same_v<T, float> ? "float" : "double");
        } else if constexpr (std::is_same_v<T, std::string>) {
            return TypeDescriptor::string();
        } else {
            const auto it = customTags_.find(std::type_index(typeid(T)));
            if (it == customTags_.end() || !coercions_.contains(it->second)) {
                throw DeclarationError(fieldLabel(decl) + ": no string conversion registered for type " + typeid(T).name());
            }
            return TypeDescriptor::custom(it->second);
        }
    }

    std::string fieldLabel(const OptionSpec& decl) const;
    std::string deriveLongName(const std::string& fieldName) const;
    static std::string longKey(std::string name);
    void checkSingleDashClash(const std::string& label, const std::string& longName,
                              std::optional<char> shortName, const OptionField* self) const;
    bool spellingTaken(const std::string& spelling) const;
    void registerOption(OptionSpec decl, std::shared_ptr<Value> value);

    std::vector<std::unique_ptr<OptionField>> options_;
    // Keyed by longKey(); a derived name is also reachable under longKey(fieldName).
    std::unordered_map<std::string, OptionField*> byLong_;
    std::unordered_map<char, OptionField*> byShort_;
    std::unordered_map<std::string, OptionField*> byAlias_;
    std::vector<OptionGroup> groups_;
    std::unordered_map<std::string, std::size_t> groupIndex_;
    std::optional<std::size_t> currentGroup_;
    std::vector<std::string> holders_;
    std::string currentHolder_;
    std::unordered_map<std::type_index, TypeDescriptor> enums_;
    std::unordered_map<std::type_index, std::string> customTags_;
    CoercionRegistry coercions_;
    bool usingGroups_{false};
    bool useSingleDash_{false};
    RepeatPolicy repeatPolicy_{RepeatPolicy::LastWins};
    char listSeparator_{','};
    char wordSeparator_{'-'};
    bool suggestions_{true};
};

} // namespace optbind

#endif // OPTBIND_OPTIONS_HPP
