#include "optbind/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>

#include "optbind/parser.hpp"

namespace optbind {

const std::string& Options::longPrefix() const {
    static const std::string single = "-";
    static const std::string dbl = "--";
    return useSingleDash_ ? single : dbl;
}

std::vector<const OptionField*> Options::options() const {
    std::vector<const OptionField*> out;
    out.reserve(options_.size());
    for (const auto& f : options_) out.push_back(f.get());
    return out;
}

const OptionField* Options::findLong(const std::string& name) const {
    const auto it = byLong_.find(longKey(name));
    return it == byLong_.end() ? nullptr : it->second;
}

const OptionField* Options::findShort(char name) const {
    const auto it = byShort_.find(name);
    return it == byShort_.end() ? nullptr : it->second;
}

const OptionField* Options::findAlias(const std::string& spelling) const {
    const auto it = byAlias_.find(spelling);
    return it == byAlias_.end() ? nullptr : it->second;
}

std::vector<std::string> Options::spellings() const {
    std::vector<std::string> out;
    for (const auto& f : options_) {
        out.push_back(longPrefix() + f->longName());
        if (f->shortName()) out.push_back(std::string("-") + *f->shortName());
        for (const auto& a : f->aliases()) out.push_back(a);
    }
    return out;
}

std::string Options::fieldLabel(const OptionSpec& decl) const {
    if (currentHolder_.empty()) return decl.fieldName_;
    return currentHolder_ + "." + decl.fieldName_;
}

std::string Options::deriveLongName(const std::string& fieldName) const {
    std::string out = fieldName;
    std::replace(out.begin(), out.end(), '_', wordSeparator_);
    return out;
}

std::string Options::longKey(std::string name) {
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

Options& Options::useSingleDash(bool v) {
    if (v && !useSingleDash_) {
        for (const auto& f : options_) checkSingleDashClash(f->fieldName(), f->longName(), f->shortName(), f.get());
    }
    useSingleDash_ = v;
    return *this;
}

// In single-dash mode `-x` would select both a one-letter long name and a short name.
void Options::checkSingleDashClash(const std::string& label, const std::string& longName,
                                   std::optional<char> shortName, const OptionField* self) const {
    if (longName.size() == 1) {
        const auto* owner = findShort(longName[0]);
        if (owner && owner != self) {
            throw DeclarationError(label + ": long name \"" + longName + "\" clashes with short name -" + longName +
                                   " of " + owner->fieldName() + " in single-dash mode");
        }
    }
    if (shortName) {
        const auto* owner = findLong(std::string(1, *shortName));
        if (owner && owner != self) {
            throw DeclarationError(label + ": short name -" + std::string(1, *shortName) + " clashes with long name \"" +
                                   owner->longName() + "\" in single-dash mode");
        }
    }
}

// True if `spelling` already selects some option, as an alias or as a long/short spelling.
bool Options::spellingTaken(const std::string& spelling) const {
    if (findAlias(spelling)) return true;
    if (spelling.rfind("--", 0) == 0) return findLong(spelling.substr(2)) != nullptr;
    if (spelling.size() < 2 || spelling[0] != '-') return false;
    const auto name = spelling.substr(1);
    if (useSingleDash_ && findLong(name)) return true;
    return name.size() == 1 && findShort(name[0]);
}

void Options::registerOption(OptionSpec decl, std::shared_ptr<Value> value) {
    if (decl.fieldName_.empty()) throw DeclarationError("option declared with an empty field name");

    const auto label = fieldLabel(decl);
    const auto longName = decl.longName_ ? *decl.longName_ : deriveLongName(decl.fieldName_);
    if (longName.empty()) throw DeclarationError(label + ": empty long name");
    std::vector<std::string> keys{longKey(longName)};
    if (!decl.longName_ && longKey(decl.fieldName_) != keys.front()) keys.push_back(longKey(decl.fieldName_));
    for (const auto& key : keys) {
        if (byLong_.count(key)) {
            throw DeclarationError(label + ": long name \"" + longName + "\" is already used by " + byLong_.at(key)->fieldName());
        }
    }
    for (const auto& entry : byAlias_) {
        const auto& a = entry.first;
        const auto dashes = a.rfind("--", 0) == 0 ? 2 : (useSingleDash_ ? 1 : 0);
        if (dashes && std::find(keys.begin(), keys.end(), longKey(a.substr(dashes))) != keys.end()) {
            throw DeclarationError(label + ": long name \"" + longName + "\" is already used as an alias");
        }
    }
    if (decl.shortName_) {
        const char c = *decl.shortName_;
        if (c == '-' || c == '=' || std::isspace(static_cast<unsigned char>(c))) {
            throw DeclarationError(label + ": invalid short name '" + std::string(1, c) + "'");
        }
        if (byShort_.count(c)) {
            throw DeclarationError(label + ": short name -" + std::string(1, c) + " is already used by " +
                                   byShort_.at(c)->fieldName());
        }
        if (findAlias(std::string("-") + c)) {
            throw DeclarationError(label + ": short name -" + std::string(1, c) + " is already used as an alias");
        }
    }
    if (useSingleDash_) checkSingleDashClash(label, longName, decl.shortName_, nullptr);
    for (std::size_t i = 0; i < decl.aliases_.size(); ++i) {
        const auto& a = decl.aliases_[i];
        const auto dashes = a.rfind("--", 0) == 0 ? 2 : (useSingleDash_ ? 1 : 0);
        const bool own = (dashes && std::find(keys.begin(), keys.end(), longKey(a.substr(dashes))) != keys.end()) ||
                         (decl.shortName_ && a == std::string("-") + *decl.shortName_) ||
                         std::find(decl.aliases_.begin(), decl.aliases_.begin() + static_cast<std::ptrdiff_t>(i), a) !=
                             decl.aliases_.begin() + static_cast<std::ptrdiff_t>(i);
        if (a.size() < 2 || a[0] != '-' || a.find('=') != std::string::npos) {
            throw DeclarationError(label + ": alias \"" + a + "\" is not an option spelling");
        }
        if (own || spellingTaken(a)) throw DeclarationError(label + ": alias \"" + a + "\" is already in use");
    }

    // Group membership.
    std::optional<std::size_t> groupIdx;
    if (decl.groupName_) {
        const auto& name = *decl.groupName_;
        if (groupIndex_.count(name)) throw DeclarationError(label + ": group \"" + name + "\" is declared more than once");
        if (!usingGroups_ && !options_.empty()) {
            throw DeclarationError(label + ": group \"" + name + "\" declared after options that belong to no group");
        }
        groupIdx = groups_.size();
        groups_.push_back(OptionGroup{name, decl.groupUnpublicized_, {}});
        groupIndex_[name] = *groupIdx;
        usingGroups_ = true;
        currentGroup_ = groupIdx;
    } else if (currentGroup_) {
        groupIdx = currentGroup_;
    } else if (usingGroups_) {
        throw DeclarationError(label + ": option belongs to no group, but the registry uses groups");
    }

    auto field = std::make_unique<OptionField>(longName, decl.shortName_, decl.aliases_, decl.description_, currentHolder_,
                                               decl.fieldName_, std::move(value));
    field->setUnpublicized(decl.unpublicized_);
    OptionField* raw = field.get();
    if (groupIdx) {
        raw->setGroupName(groups_[*groupIdx].name);
        groups_[*groupIdx].options.push_back(raw);
    }

    for (const auto& key : keys) byLong_[key] = raw;
    if (decl.shortName_) byShort_[*decl.shortName_] = raw;
    for (const auto& a : decl.aliases_) byAlias_[a] = raw;
    options_.push_back(std::move(field));
}

ParseResult Options::parse(const std::vector<std::string>& args) {
    Parser parser(*this, args);
    if (!parser.ok()) return ParseResult::failure(parser.error(), parser.errorToken());
    if (auto err = apply(parser)) return ParseResult::failure(*err, {});
    return ParseResult::success(parser.positionals());
}

ParseResult Options::parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse(args);
}

std::optional<std::string> Options::apply(const Parser& parser) {
    if (!parser.ok()) return parser.error();
    for (const auto& occ : parser.occurrences()) {
        if (auto err = occ.field->value().set(occ.value)) {
            return "cannot apply \"" + occ.token + "\" to " + occ.field->fieldName() + ": " + *err;
        }
    }
    return std::nullopt;
}

namespace {

std::string formatOptionForUsage(const OptionField& f, const std::string& longPrefix) {
    std::string names;
    if (f.shortName()) names += std::string("-") + *f.shortName() + ", ";
    names += longPrefix + f.longName();
    for (const auto& a : f.aliases()) names += ", " + a;

    if (f.takesValue()) {
        names.push_back(' ');
        names += f.type().displayName();
    }
    if (f.repeatable()) names += " [+]";

    std::string desc = f.description();
    const auto& def = f.defaultText();
    // A false boolean is not worth reporting.
    if (def && !(f.type().kind == Kind::Boolean && *def == "false")) {
        if (!desc.empty()) desc.push_back(' ');
        desc += "(default: " + *def + ")";
    }
    if (!desc.empty()) names += " - " + desc;
    return names;
}

} // namespace

std::string Options::usage(bool includeUnpublicized) const {
    std::ostringstream oss;
    auto section = [&](const std::string& title, const std::vector<const OptionField*>& fields) {
        std::vector<const OptionField*> visible;
        for (const auto* f : fields) {
            if (includeUnpublicized || !f->unpublicized()) visible.push_back(f);
        }
        if (visible.empty()) return;
        if (oss.tellp() > 0) oss << "\n";
        oss << title << ":\n";
        for (const auto* f : visible) oss << "  " << formatOptionForUsage(*f, longPrefix()) << "\n";
    };

    if (!usingGroups_) {
        section("Options", options());
        return oss.str();
    }
    for (const auto& g : groups_) {
        if (g.unpublicized && !includeUnpublicized) continue;
        section(g.name, g.options);
    }
    return oss.str();
}

std::string Options::settings() const {
    std::ostringstream oss;
    for (const auto& f : options_) {
        oss << f->longName() << "=" << f->value().string().value_or("") << "\n";
    }
    return oss.str();
}

} // namespace optbind
