#include "optbind/doc.hpp"

#include <vector>

#include "optbind/utils.hpp"

namespace optbind {

namespace {

// Joins lines with `eol`, without a trailing one.
class LineBuilder {
public:
    explicit LineBuilder(std::string eol) : eol_(std::move(eol)) {}

    void append(const std::string& line) {
        if (!first_) out_ += eol_;
        out_ += line;
        first_ = false;
    }

    [[nodiscard]] const std::string& str() const { return out_; }

private:
    std::string eol_;
    std::string out_;
    bool first_{true};
};

} // namespace

std::string Renderer::commentToHtml(const Comment& comment) {
    std::string out;
    for (const auto& tag : comment.inlineTags) {
        if (tag.kind == CommentFragment::Kind::Link) {
            out += "<code>" + tag.text + "</code>";
        } else {
            out += tag.text;
        }
    }
    if (!comment.seeTags.empty()) {
        std::vector<std::string> refs;
        refs.reserve(comment.seeTags.size());
        for (const auto& s : comment.seeTags) refs.push_back("<code>" + s + "</code>");
        out += " See: " + utils::join(refs, ", ") + ".";
    }
    return out;
}

std::string Renderer::description(const OptionField& field, DocFormat format) const {
    const auto comment = comments_.fieldComment(field.owner(), field.fieldName());
    if (comment.empty()) return utils::escapeHtml(field.description());
    if (format == DocFormat::Javadoc && !comment.raw.empty()) return comment.raw;
    return commentToHtml(comment);
}

std::string Renderer::optionToHtml(const OptionField& field, const RenderOptions& ro) const {
    const std::string prefix = ro.singleDash.value_or(options_.isUsingSingleDash()) ? "-" : "--";
    std::string out;
    if (field.shortName()) out += std::string("<b>-") + *field.shortName() + "</b> ";
    for (const auto& a : field.aliases()) out += "<b>" + a + "</b> ";
    out += "<b>" + prefix + field.longName() + "=</b><i>" + field.type().displayName() + "</i>. ";
    out += description(field, ro.format);
    const auto& def = field.defaultText();
    const std::string defaultStr = def ? "default " + *def : "no default";
    out += " [" + utils::escapeHtml(defaultStr) + "]";
    return out;
}

std::string Renderer::optionListToHtml(const std::vector<const OptionField*>& fields,
                                       std::size_t padding,
                                       const RenderOptions& ro) const {
    LineBuilder b(ro.eol);
    for (const auto* f : fields) {
        if (f->unpublicized() && !ro.includeUnpublicized) continue;
        b.append(std::string(padding, ' ') + "<li>" + optionToHtml(*f, ro) + "</li>");
    }
    return b.str();
}

std::string Renderer::renderHtml(const RenderOptions& ro) const {
    LineBuilder b(ro.eol);

    if (ro.includeClassDoc && !options_.holders().empty()) {
        b.append(commentToHtml(comments_.typeComment(options_.holders().front())));
        b.append("<p>Command line options: </p>");
    }

    b.append("<ul>");
    if (!ro.grouping.value_or(options_.isUsingGroups())) {
        const auto list = optionListToHtml(options_.options(), 2, ro);
        if (!list.empty()) b.append(list);
    } else {
        for (const auto& g : options_.groups()) {
            if (!ro.includeUnpublicized && !g.containsPublicizedOption()) continue;
            if (g.options.empty()) continue;
            b.append("  <li>" + g.name);
            b.append("    <ul>");
            b.append(optionListToHtml(g.options, 6, ro));
            b.append("    </ul>");
            b.append("  </li>");
        }
    }
    b.append("</ul>");
    return b.str();
}

std::string Renderer::render(const RenderOptions& ro) const {
    const auto html = renderHtml(ro);
    if (ro.format == DocFormat::Html) return html;

    // Re-split the HTML so multi-line comments are prefixed line by line too.
    LineBuilder b(ro.eol);
    const std::string prefix = std::string(ro.padding, ' ') + "* ";
    std::size_t start = 0;
    while (start <= html.size()) {
        auto end = html.find('\n', start);
        if (end == std::string::npos) end = html.size();
        std::string line = html.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        b.append(prefix + line);
        start = end + 1;
    }
    return b.str();
}

} // namespace optbind
