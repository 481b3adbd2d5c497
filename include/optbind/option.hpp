#ifndef OPTBIND_OPTION_HPP
#define OPTBIND_OPTION_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "coerce.hpp"
#include "value.hpp"

namespace optbind {

// Raised while declaring options: duplicate names, types without a string conversion, misplaced groups.
class DeclarationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class Options;

// Declaration-site metadata for one configuration field. Build with option() and chain.
class OptionSpec {
public:
    explicit OptionSpec(std::string fieldName, std::string description = {})
        : fieldName_(std::move(fieldName)),
          description_(std::move(description)) {}

    OptionSpec& shortName(char c) {
        shortName_ = c;
        return *this;
    }

    // Overrides the long name derived from the field name.
    OptionSpec& longName(std::string name) {
        longName_ = std::move(name);
        return *this;
    }

    // Additional complete spelling, e.g. "--maxcount" or "-M".
    OptionSpec& alias(std::string spelling) {
        aliases_.push_back(std::move(spelling));
        return *this;
    }

    // Starts a group containing this field and the following fields of the same holder.
    OptionSpec& group(std::string name, bool unpublicized = false) {
        groupName_ = std::move(name);
        groupUnpublicized_ = unpublicized;
        return *this;
    }

    // Parseable, but left out of usage text and generated documentation.
    OptionSpec& unpublicized(bool v = true) {
        unpublicized_ = v;
        return *this;
    }

    // List separator for this option only.
    OptionSpec& separator(char sep) {
        separator_ = sep;
        return *this;
    }

private:
    friend class Options;

    std::string fieldName_;
    std::string description_;
    std::optional<char> shortName_;
    std::optional<std::string> longName_;
    std::vector<std::string> aliases_;
    std::optional<std::string> groupName_;
    bool groupUnpublicized_{false};
    bool unpublicized_{false};
    std::optional<char> separator_;
};

inline OptionSpec option(std::string fieldName, std::string description = {}) {
    return OptionSpec(std::move(fieldName), std::move(description));
}

class OptionField {
public:
    OptionField(std::string longName,
                std::optional<char> shortName,
                std::vector<std::string> aliases,
                std::string description,
                std::string owner,
                std::string fieldName,
                std::shared_ptr<Value> value)
        : longName_(std::move(longName)),
          shortName_(shortName),
          aliases_(std::move(aliases)),
          description_(std::move(description)),
          owner_(std::move(owner)),
          fieldName_(std::move(fieldName)),
          value_(std::move(value)),
          defaultText_(value_->string()) {}

    [[nodiscard]] const std::string& longName() const { return longName_; }  // max-count
    [[nodiscard]] const std::optional<char>& shortName() const { return shortName_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::string& owner() const { return owner_; }
    [[nodiscard]] const std::string& fieldName() const { return fieldName_; }  // max_count
    [[nodiscard]] const TypeDescriptor& type() const { return value_->type(); }
    [[nodiscard]] bool repeatable() const { return type().kind == Kind::List; }
    [[nodiscard]] bool takesValue() const { return type().kind != Kind::Boolean; }
    [[nodiscard]] const std::optional<std::string>& defaultText() const { return defaultText_; }
    [[nodiscard]] bool unpublicized() const { return unpublicized_; }
    [[nodiscard]] const std::optional<std::string>& groupName() const { return groupName_; }

    [[nodiscard]] Value& value() const { return *value_; }

    void setUnpublicized(bool v) { unpublicized_ = v; }
    void setGroupName(std::string name) { groupName_ = std::move(name); }

private:
    std::string longName_;
    std::optional<char> shortName_;
    std::vector<std::string> aliases_;
    std::string description_;
    std::string owner_;
    std::string fieldName_;
    std::shared_ptr<Value> value_;
    std::optional<std::string> defaultText_;
    bool unpublicized_{false};
    std::optional<std::string> groupName_;
};

struct OptionGroup {
    std::string name;
    // Hidden from usage text; still documented when it has a publicized member.
    bool unpublicized{false};
    std::vector<const OptionField*> options;

    [[nodiscard]] bool containsPublicizedOption() const {
        for (const auto* f : options) {
            if (!f->unpublicized()) return true;
        }
        return false;
    }
};

} // namespace optbind

#endif // OPTBIND_OPTION_HPP
