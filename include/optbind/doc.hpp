#ifndef OPTBIND_DOC_HPP
#define OPTBIND_DOC_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "option.hpp"
#include "options.hpp"

namespace optbind {

struct CommentFragment {
    enum class Kind {
        Text,
        Link,  // inline cross-reference; rendered as <code>text</code>
    };

    Kind kind{Kind::Text};
    std::string text;
};

// A source comment as extracted by some external tool.
struct Comment {
    std::string raw;
    std::vector<CommentFragment> inlineTags;
    std::vector<std::string> seeTags;

    [[nodiscard]] bool empty() const { return raw.empty() && inlineTags.empty() && seeTags.empty(); }

    // A comment consisting of plain text only.
    static Comment fromText(std::string text) {
        Comment c;
        c.inlineTags.push_back(CommentFragment{CommentFragment::Kind::Text, text});
        c.raw = std::move(text);
        return c;
    }
};

// Source of documentation comments. Missing comments are returned empty.
class CommentProvider {
public:
    virtual ~CommentProvider() = default;

    [[nodiscard]] virtual Comment fieldComment(const std::string& owner, const std::string& field) const = 0;
    [[nodiscard]] virtual Comment typeComment(const std::string& owner) const = 0;
};

class MapCommentProvider final : public CommentProvider {
public:
    MapCommentProvider& setFieldComment(const std::string& owner, const std::string& field, Comment comment) {
        fields_[{owner, field}] = std::move(comment);
        return *this;
    }

    MapCommentProvider& setTypeComment(const std::string& owner, Comment comment) {
        types_[owner] = std::move(comment);
        return *this;
    }

    [[nodiscard]] Comment fieldComment(const std::string& owner, const std::string& field) const override {
        const auto it = fields_.find({owner, field});
        return it == fields_.end() ? Comment{} : it->second;
    }

    [[nodiscard]] Comment typeComment(const std::string& owner) const override {
        const auto it = types_.find(owner);
        return it == types_.end() ? Comment{} : it->second;
    }

private:
    std::map<std::pair<std::string, std::string>, Comment> fields_;
    std::map<std::string, Comment> types_;
};

enum class DocFormat {
    Html,
    Javadoc,  // HTML with every line prefixed by "* ", for embedding in a source comment
};

struct RenderOptions {
    DocFormat format{DocFormat::Html};
    // Defaults to whether the registry uses groups.
    std::optional<bool> grouping;
    bool includeUnpublicized{false};
    bool includeClassDoc{false};
    // Defaults to the registry's single-dash setting.
    std::optional<bool> singleDash;
    // Javadoc only: spaces before each "* ".
    std::size_t padding{0};
    std::string eol{"\n"};
};

// Renders an option registry as an HTML list. The output carries no trailing end-of-line.
class Renderer {
public:
    Renderer(const Options& options, const CommentProvider& comments) : options_(options), comments_(comments) {}

    [[nodiscard]] std::string render(const RenderOptions& ro = {}) const;

    // One <li> body: names, type, description and default.
    [[nodiscard]] std::string optionToHtml(const OptionField& field, const RenderOptions& ro = {}) const;

    // Flattens inline fragments and appends block see-references.
    [[nodiscard]] static std::string commentToHtml(const Comment& comment);

private:
    std::string renderHtml(const RenderOptions& ro) const;
    std::string optionListToHtml(const std::vector<const OptionField*>& fields,
                                 std::size_t padding,
                                 const RenderOptions& ro) const;
    std::string description(const OptionField& field, DocFormat format) const;

    const Options& options_;
    const CommentProvider& comments_;
};

} // namespace optbind

#endif // OPTBIND_DOC_HPP
