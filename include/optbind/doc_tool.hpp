#ifndef OPTBIND_DOC_TOOL_HPP
#define OPTBIND_DOC_TOOL_HPP

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "doc.hpp"
#include "options.hpp"

namespace optbind {

// Settings of one documentation tool run, filled from its own command line.
struct DocToolConfig {
    std::string docfile;
    std::string outfile;
    bool i{false};
    std::string format;
    bool classdoc{false};
    bool singledash{false};
    bool help{false};
};

// Writes the documentation of a registry to stdout, a file, or into an existing document.
//
// Flags (single dash):
//   -docfile <file>   splice into this document
//   -outfile <file>   write here instead of stdout
//   -i                edit the docfile in place
//   -format javadoc   HTML inside a Javadoc-style comment
//   -classdoc         start with the first holder's type comment
//   -singledash       document long options as -name
//   -help
class DocTool {
public:
    DocTool(const Options& options, const CommentProvider& comments) : options_(options), comments_(comments) {}

    DocTool& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    DocTool& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    // Returns the process exit status. Errors are reported on the error stream.
    int run(const std::vector<std::string>& args) const;
    int run(int argc, char** argv) const;

    [[nodiscard]] static std::string usage();

private:
    static void declare(Options& opts, DocToolConfig& cfg);
    std::optional<std::string> validate(const DocToolConfig& cfg) const;
    int fail(const std::string& message) const;

    std::ostream& out() const { return out_ ? *out_ : std::cout; }
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }

    const Options& options_;
    const CommentProvider& comments_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace optbind

#endif // OPTBIND_DOC_TOOL_HPP
