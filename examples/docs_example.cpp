#include <string>
#include <vector>

#include "optbind/optbind.hpp"

struct LookupConfig {
    bool verbose = false;
    std::vector<std::string> entry_file;
    int min_score = 1;
};

// Usage: docs_example [-docfile FILE] [-outfile FILE] [-i] [-format javadoc] [-classdoc] [-singledash]
int main(int argc, char** argv) {
    LookupConfig cfg;
    optbind::Options opts;
    opts.holder("LookupConfig")
        .add(cfg.verbose, optbind::option("verbose", "Print progress information").shortName('v'))
        .add(cfg.entry_file, optbind::option("entry_file", "File of entries to search").shortName('e'))
        .add(cfg.min_score, optbind::option("min_score", "Ignore entries scoring below this"));

    optbind::Comment entry;
    entry.raw = "Entry files, searched in order. See {@link #min_score}.";
    entry.inlineTags = {{optbind::CommentFragment::Kind::Text, "Entry files, searched in order. See "},
                        {optbind::CommentFragment::Kind::Link, "min_score"},
                        {optbind::CommentFragment::Kind::Text, "."}};

    optbind::MapCommentProvider comments;
    comments.setTypeComment("LookupConfig", optbind::Comment::fromText("Looks up entries in a set of files."))
        .setFieldComment("LookupConfig", "entry_file", entry);

    return optbind::DocTool(opts, comments).run(argc, argv);
}
