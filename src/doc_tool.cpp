#include "optbind/doc_tool.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "optbind/splice.hpp"

namespace fs = std::filesystem;

namespace {

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) return false;
    out = oss.str();
    return true;
}

bool writeText(std::ostream& os, const std::string& text) {
    os << text;
    os.flush();
    return static_cast<bool>(os);
}

bool samePath(const std::string& a, const std::string& b) {
    std::error_code ec;
    if (fs::exists(a, ec) && fs::exists(b, ec) && fs::equivalent(a, b, ec)) return true;
    const auto absA = fs::absolute(a, ec);
    if (ec) return a == b;
    const auto absB = fs::absolute(b, ec);
    if (ec) return a == b;
    return absA.lexically_normal() == absB.lexically_normal();
}

} // namespace

namespace optbind {

void DocTool::declare(Options& opts, DocToolConfig& cfg) {
    opts.useSingleDash().repeatPolicy(RepeatPolicy::Reject);
    opts.holder("DocTool")
        .add(cfg.docfile, option("docfile", "Specify file into which options documentation is inserted"))
        .add(cfg.outfile, option("outfile", "Specify destination for resulting output"))
        .add(cfg.i, option("i", "Edit the docfile in-place"))
        .add(cfg.format, option("format", "Format output as a Javadoc comment (only \"javadoc\" is recognized)"))
        .add(cfg.classdoc, option("classdoc", "Include the main holder's documentation in output"))
        .add(cfg.singledash, option("singledash", "Use single dashes for long options"))
        .add(cfg.help, option("help", "Print this message"));
}

std::string DocTool::usage() {
    DocToolConfig cfg;
    Options opts;
    declare(opts, cfg);
    return opts.usage();
}

int DocTool::fail(const std::string& message) const {
    err() << "Error: " << message;
    if (message.empty() || message.back() != '\n') err() << "\n";
    return 1;
}

std::optional<std::string> DocTool::validate(const DocToolConfig& cfg) const {
    if (cfg.i && !cfg.outfile.empty()) return std::string("-i and -outfile can not be used at the same time");
    if (cfg.i && cfg.docfile.empty()) return std::string("-i requires -docfile");
    if (!cfg.format.empty() && cfg.format != "javadoc") return "unrecognized output format: " + cfg.format;
    if (!cfg.docfile.empty()) {
        std::error_code ec;
        if (!fs::exists(cfg.docfile, ec)) return "file not found: " + cfg.docfile;
    }
    if (!cfg.docfile.empty() && !cfg.outfile.empty() && samePath(cfg.docfile, cfg.outfile)) {
        return std::string("docfile must be different from outfile");
    }
    return std::nullopt;
}

int DocTool::run(int argc, char** argv) const {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args);
}

int DocTool::run(const std::vector<std::string>& args) const {
    DocToolConfig cfg;
    Options opts;
    declare(opts, cfg);

    const auto parsed = opts.parse(args);
    if (!parsed.ok()) {
        const int rc = fail(parsed.error());
        err() << "\n" << opts.usage();
        return rc;
    }
    if (!parsed.arguments().empty()) return fail("unexpected argument: " + parsed.arguments().front());
    if (cfg.help) {
        out() << "Provided by the options doc tool:\n" << opts.usage();
        return 0;
    }
    if (auto problem = validate(cfg)) return fail(*problem);
    if (options_.options().empty()) return fail("no options declared");

    RenderOptions ro;
    ro.format = cfg.format == "javadoc" ? DocFormat::Javadoc : DocFormat::Html;
    ro.includeClassDoc = cfg.classdoc;
    if (cfg.singledash) ro.singleDash = true;
    const Renderer renderer(options_, comments_);

    std::string text;
    if (cfg.docfile.empty()) {
        text = renderer.render(ro);
    } else {
        std::string doc;
        if (!readFile(cfg.docfile, doc)) return fail("cannot read " + cfg.docfile);

        const auto markers = ro.format == DocFormat::Javadoc ? SpliceMarkers::javadoc() : SpliceMarkers::html();
        auto result = splice(
            doc,
            [&](const std::string& startLine) {
                RenderOptions block = ro;
                // Javadoc blocks line up with the marker's '*'.
                if (block.format == DocFormat::Javadoc) {
                    const auto star = startLine.find('*');
                    block.padding = star == std::string::npos ? 0 : star;
                }
                return renderer.render(block);
            },
            markers);
        if (!result.startFound) {
            err() << "Warning: start marker \"" << markers.start << "\" not found in " << cfg.docfile << "\n";
        } else if (!result.endFound) {
            err() << "Warning: end marker \"" << markers.end << "\" not found in " << cfg.docfile << "\n";
        }
        text = std::move(result.text);
    }
    if (text.empty() || text.back() != '\n') text += "\n";

    const std::string& target = !cfg.outfile.empty() ? cfg.outfile : (cfg.i ? cfg.docfile : std::string());
    if (target.empty()) {
        if (!writeText(out(), text)) return fail("cannot write output");
        return 0;
    }
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file || !writeText(file, text)) return fail("cannot write " + target);
    return 0;
}

} // namespace optbind
