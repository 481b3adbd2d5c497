#ifndef OPTBIND_PARSER_HPP
#define OPTBIND_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "coerce.hpp"
#include "option.hpp"
#include "options.hpp"
#include "utils.hpp"

namespace optbind {

// Scans an argument vector against a registry. Nothing is written to the bound fields here;
// Options::apply() replays the recorded occurrences.
class Parser {
public:
    // One option occurrence on the command line, already coerced.
    struct Occurrence {
        const OptionField* field{nullptr};
        std::string token;
        OptionValue value;
    };

    Parser(const Options& options, const std::vector<std::string>& args) : options_(options) {
        std::unordered_set<const OptionField*> seen;

        std::size_t i = 0;
        for (; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--") {
                ++i;
                break;
            }
            if (!isOptionToken(arg)) break;

            std::string key = arg;
            std::optional<std::string> inlineValue;
            const auto eq = arg.find('=');
            if (eq != std::string::npos) {
                key = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }

            const OptionField* field = resolve(key);
            if (!field) {
                failUnknownOption(key);
                return;
            }

            std::string text;
            if (inlineValue) {
                text = std::move(*inlineValue);
            } else if (!field->takesValue()) {
                text = "true";
            } else if (i + 1 < args.size()) {
                text = args[++i];
            } else {
                fail("option needs an argument: " + key, arg);
                return;
            }

            if (!field->repeatable() && !seen.insert(field).second && options_.repeatPolicy() == RepeatPolicy::Reject) {
                fail("option " + key + " given more than once", arg);
                return;
            }

            OptionValue value;
            if (auto err = coerce(text, field->type(), options_.coercions(), value)) {
                fail("invalid argument \"" + text + "\" for \"" + key + "\": " + *err, arg);
                return;
            }
            occurrences_.push_back(Occurrence{field, key, std::move(value)});
        }

        for (; i < args.size(); ++i) positionals_.push_back(args[i]);
    }

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] const std::string& error() const { return error_; }
    [[nodiscard]] const std::string& errorToken() const { return errorToken_; }
    [[nodiscard]] const std::vector<Occurrence>& occurrences() const { return occurrences_; }
    [[nodiscard]] const std::vector<std::string>& positionals() const { return positionals_; }

private:
    static bool isOptionToken(const std::string& arg) { return arg.size() > 1 && arg[0] == '-'; }

    // Aliases first, then long names; single-dash mode tries `-name` as a long name before a short one.
    const OptionField* resolve(const std::string& key) const {
        if (const auto* f = options_.findAlias(key)) return f;

        if (key.rfind("--", 0) == 0) return options_.findLong(key.substr(2));

        const auto name = key.substr(1);
        if (options_.isUsingSingleDash()) {
            if (const auto* f = options_.findLong(name)) return f;
        }
        if (name.size() == 1) return options_.findShort(name[0]);
        return nullptr;
    }

    void fail(std::string message, const std::string& token) {
        ok_ = false;
        error_ = std::move(message);
        errorToken_ = token;
    }

    void failUnknownOption(const std::string& key) {
        fail("unknown option: " + key, key);
        if (!options_.suggestionsEnabled()) return;
        const auto suggestions = utils::suggest(key, options_.spellings(), /*maxResults=*/3, /*maxDistance=*/2);
        if (suggestions.empty()) return;
        error_ += "\n\nDid you mean this?\n";
        for (const auto& s : suggestions) error_ += "  " + s + "\n";
    }

    const Options& options_;
    bool ok_{true};
    std::string error_;
    std::string errorToken_;
    std::vector<Occurrence> occurrences_;
    std::vector<std::string> positionals_;
};

} // namespace optbind

#endif // OPTBIND_PARSER_HPP
