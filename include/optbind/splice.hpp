#ifndef OPTBIND_SPLICE_HPP
#define OPTBIND_SPLICE_HPP

#include <functional>
#include <string>
#include <string_view>

namespace optbind {

// Sentinel lines delimiting the generated region. Matched after trimming surrounding whitespace.
struct SpliceMarkers {
    std::string start{"<!-- start options doc (DO NOT EDIT BY HAND) -->"};
    std::string end{"<!-- end options doc -->"};

    static SpliceMarkers html() { return SpliceMarkers{}; }

    // Markers inside a Javadoc-style comment: "* <!-- start ... -->".
    static SpliceMarkers javadoc() {
        SpliceMarkers m;
        m.start = "* " + m.start;
        m.end = "* " + m.end;
        return m;
    }
};

struct SpliceResult {
    std::string text;
    bool startFound{false};
    bool endFound{false};
};

// Produces the block to insert, given the start marker line (without its terminator).
using BlockRenderer = std::function<std::string(const std::string& startLine)>;

// Replaces the lines between the first start marker and the following end marker with `block`.
// Lines outside the region, their terminators and a missing final newline are preserved.
// Without a start marker the document is returned unchanged; without an end marker the block is
// inserted after the start marker and every following line is kept.
[[nodiscard]] SpliceResult splice(std::string_view document, const BlockRenderer& render, const SpliceMarkers& markers = {});

[[nodiscard]] SpliceResult splice(std::string_view document, const std::string& block, const SpliceMarkers& markers = {});

} // namespace optbind

#endif // OPTBIND_SPLICE_HPP
