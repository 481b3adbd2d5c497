#include "optbind/splice.hpp"

#include <vector>

#include "optbind/utils.hpp"

namespace {

struct Line {
    std::string_view content;
    std::string_view terminator;  // "\n", "\r\n", or empty for an unterminated last line
};

std::vector<Line> splitLines(std::string_view doc) {
    std::vector<Line> out;
    std::size_t start = 0;
    while (start < doc.size()) {
        const auto nl = doc.find('\n', start);
        if (nl == std::string_view::npos) {
            out.push_back(Line{doc.substr(start), {}});
            break;
        }
        std::size_t contentEnd = nl;
        if (contentEnd > start && doc[contentEnd - 1] == '\r') --contentEnd;
        out.push_back(Line{doc.substr(start, contentEnd - start), doc.substr(contentEnd, nl + 1 - contentEnd)});
        start = nl + 1;
    }
    return out;
}

bool isMarker(std::string_view line, const std::string& marker) { return optbind::utils::trimWs(line) == marker; }

} // namespace

namespace optbind {

SpliceResult splice(std::string_view document, const BlockRenderer& render, const SpliceMarkers& markers) {
    const auto lines = splitLines(document);

    std::size_t startIdx = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (isMarker(lines[i].content, markers.start)) {
            startIdx = i;
            break;
        }
    }

    SpliceResult result;
    if (startIdx == lines.size()) {
        result.text = std::string(document);
        return result;
    }
    result.startFound = true;

    std::size_t endIdx = lines.size();
    for (std::size_t i = startIdx + 1; i < lines.size(); ++i) {
        if (isMarker(lines[i].content, markers.end)) {
            endIdx = i;
            break;
        }
    }
    result.endFound = endIdx != lines.size();

    // Inserted lines use the start marker's terminator, or the document's first one.
    std::string eol(lines[startIdx].terminator);
    if (eol.empty()) {
        for (const auto& l : lines) {
            if (!l.terminator.empty()) {
                eol = std::string(l.terminator);
                break;
            }
        }
    }
    if (eol.empty()) eol = "\n";

    std::string& out = result.text;
    out.reserve(document.size());
    for (std::size_t i = 0; i < startIdx; ++i) {
        out.append(lines[i].content);
        out.append(lines[i].terminator);
    }

    const std::string startLine(lines[startIdx].content);
    const std::string block = render(startLine);
    out += startLine;

    // The lines that follow the block: from the end marker on, or everything after the start marker.
    const std::size_t resume = result.endFound ? endIdx : startIdx + 1;
    const bool more = resume < lines.size();

    if (!block.empty()) {
        out += eol;
        out += block;
        if (more || !lines[startIdx].terminator.empty()) out += eol;
    } else {
        out.append(lines[startIdx].terminator);
    }

    for (std::size_t i = resume; i < lines.size(); ++i) {
        out.append(lines[i].content);
        out.append(lines[i].terminator);
    }
    return result;
}

SpliceResult splice(std::string_view document, const std::string& block, const SpliceMarkers& markers) {
    return splice(document, [&block](const std::string&) { return block; }, markers);
}

} // namespace optbind
