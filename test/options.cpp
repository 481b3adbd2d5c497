#include "catch2/catch.hpp"
#include "optbind/options.hpp"

#include <optional>
#include <string_view>
#include <string>
#include <vector>

using namespace optbind;

namespace {

enum class Color { Red, Green };

struct Opaque {
    int v{0};
};

struct Config {
    bool verbose = false;
    long max_count = 10;
    std::string name;
    std::vector<std::string> tag;
    std::optional<int> limit;
    Color color = Color::Red;
};

} // namespace

TEST_CASE( "long names derive from field names", "[options]" ) {
    Config cfg;
    Options opts;
    opts.holder("Config").add(cfg.max_count, option("max_count", "Maximum").shortName('m'));

    const auto* f = opts.findLong("max-count");
    REQUIRE(f);
    REQUIRE(f->fieldName() == "max_count");
    REQUIRE(f->owner() == "Config");
    REQUIRE(opts.findShort('m') == f);
    REQUIRE(f->type().name == "long");
    REQUIRE(f->defaultText() == std::optional<std::string>("10"));
    REQUIRE(!f->repeatable());
    REQUIRE(f->takesValue());
}

TEST_CASE( "word separator and explicit long names", "[options]" ) {
    Config cfg;
    Options opts;
    opts.wordSeparator('.');
    opts.add(cfg.max_count, option("max_count"));
    opts.add(cfg.name, option("name").longName("user"));
    REQUIRE(opts.findLong("max.count"));
    REQUIRE(opts.findLong("user"));
    REQUIRE(!opts.findLong("name"));
}

TEST_CASE( "underscores and dashes match in long names", "[options]" ) {
    Config cfg;
    Options opts;
    opts.wordSeparator('.');
    opts.add(cfg.max_count, option("max_count"));
    opts.add(cfg.name, option("name").longName("user_name"));
    REQUIRE(opts.findLong("max_count") == opts.findLong("max.count"));
    REQUIRE(opts.findLong("user_name"));
    REQUIRE(opts.findLong("user-name") == opts.findLong("user_name"));

    long other = 0;
    REQUIRE_THROWS_AS(opts.add(other, option("other").longName("max-count")), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(other, option("other").alias("--user-name")), DeclarationError);
}

TEST_CASE( "single-dash one-letter long names may not shadow short names", "[options]" ) {
    Config cfg;
    long v = 0;

    Options longAfterShort;
    longAfterShort.useSingleDash();
    longAfterShort.add(cfg.verbose, option("verbose").shortName('v'));
    REQUIRE_THROWS_AS(longAfterShort.add(v, option("v")), DeclarationError);

    Options shortAfterLong;
    shortAfterLong.useSingleDash();
    shortAfterLong.add(v, option("v"));
    REQUIRE_THROWS_AS(shortAfterLong.add(cfg.verbose, option("verbose").shortName('v')), DeclarationError);

    // The same clash is caught when single-dash mode is switched on later.
    Options late;
    late.add(cfg.verbose, option("verbose").shortName('v')).add(v, option("v"));
    REQUIRE_THROWS_AS(late.useSingleDash(), DeclarationError);
    REQUIRE(!late.isUsingSingleDash());

    // An option may use its own letter for both.
    Options own;
    own.useSingleDash();
    REQUIRE_NOTHROW(own.add(v, option("v").shortName('v')));
}

TEST_CASE( "default text", "[options]" ) {
    Config cfg;
    Options opts;
    opts.enumeration<Color>("Color", {{"RED", Color::Red}, {"GREEN", Color::Green}});
    opts.add(cfg.verbose, option("verbose"))
        .add(cfg.name, option("name"))
        .add(cfg.tag, option("tag"))
        .add(cfg.limit, option("limit"))
        .add(cfg.color, option("color"));

    REQUIRE(opts.findLong("verbose")->defaultText() == std::optional<std::string>("false"));
    REQUIRE(!opts.findLong("name")->defaultText());
    REQUIRE(!opts.findLong("tag")->defaultText());
    REQUIRE(!opts.findLong("limit")->defaultText());
    REQUIRE(opts.findLong("color")->defaultText() == std::optional<std::string>("RED"));
    REQUIRE(opts.findLong("color")->type().name == "Color");
    REQUIRE(opts.findLong("tag")->repeatable());
    REQUIRE(!opts.findLong("verbose")->takesValue());
}

TEST_CASE( "duplicate names are rejected", "[options]" ) {
    Config cfg;
    Options opts;
    opts.add(cfg.max_count, option("max_count").shortName('m').alias("--maxcount"));

    long other = 0;
    REQUIRE_THROWS_AS(opts.add(other, option("max_count")), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(other, option("other").shortName('m')), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(other, option("other").alias("--maxcount")), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(other, option("other").alias("--max-count")), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(other, option("maxcount")), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(other, option("")), DeclarationError);
    REQUIRE(opts.options().size() == 1);

    REQUIRE_NOTHROW(opts.add(other, option("other").shortName('o')));
    REQUIRE(opts.options().size() == 2);
}

TEST_CASE( "types without a conversion are rejected", "[options]" ) {
    Config cfg;
    Opaque opaque;
    Options opts;
    opts.holder("Config");
    REQUIRE_THROWS_AS(opts.add(cfg.color, option("color")), DeclarationError);
    REQUIRE_THROWS_AS(opts.add(opaque, option("opaque")), DeclarationError);

    try {
        opts.add(opaque, option("opaque"));
        FAIL("expected a declaration error");
    } catch (const DeclarationError& e) {
        REQUIRE(std::string(e.what()).find("Config.opaque") != std::string::npos);
    }

    opts.registerType<Opaque>("opaque", [](std::string_view text) -> std::optional<Opaque> {
        if (text.empty()) return std::nullopt;
        return Opaque{static_cast<int>(text.size())};
    });
    REQUIRE_NOTHROW(opts.add(opaque, option("opaque")));
    REQUIRE(opts.findLong("opaque")->type().name == "opaque");
    REQUIRE(opts.findLong("opaque")->type().kind == Kind::Custom);
}

TEST_CASE( "groups", "[options]" ) {
    Config cfg;
    Options opts;
    opts.holder("Config")
        .add(cfg.verbose, option("verbose").group("General"))
        .add(cfg.name, option("name"))
        .add(cfg.max_count, option("max_count").group("Limits", true).unpublicized());

    REQUIRE(opts.isUsingGroups());
    REQUIRE(opts.groups().size() == 2);
    REQUIRE(opts.groups()[0].name == "General");
    REQUIRE(opts.groups()[0].options.size() == 2);
    REQUIRE(opts.groups()[0].containsPublicizedOption());
    REQUIRE(opts.groups()[1].unpublicized);
    REQUIRE(!opts.groups()[1].containsPublicizedOption());
    REQUIRE(opts.findLong("name")->groupName() == std::optional<std::string>("General"));

    long other = 0;
    REQUIRE_THROWS_AS(opts.add(other, option("other").group("General")), DeclarationError);

    // A new holder must open its own group.
    opts.holder("Other");
    REQUIRE_THROWS_AS(opts.add(other, option("other")), DeclarationError);
    REQUIRE_NOTHROW(opts.add(other, option("other").group("More")));
}

TEST_CASE( "a group may not follow ungrouped options", "[options]" ) {
    Config cfg;
    Options opts;
    opts.add(cfg.verbose, option("verbose"));
    REQUIRE_THROWS_AS(opts.add(cfg.name, option("name").group("Late")), DeclarationError);
    REQUIRE(!opts.isUsingGroups());
}

TEST_CASE( "usage text", "[options]" ) {
    Config cfg;
    Options opts;
    opts.add(cfg.verbose, option("verbose", "Talk more").shortName('v'))
        .add(cfg.max_count, option("max_count", "Stop after N").alias("--maxcount"))
        .add(cfg.tag, option("tag", "Tag"))
        .add(cfg.name, option("name", "Secret").unpublicized());

    const auto text = opts.usage();
    REQUIRE(text ==
            "Options:\n"
            "  -v, --verbose - Talk more\n"
            "  --max-count, --maxcount long - Stop after N (default: 10)\n"
            "  --tag string [+] - Tag\n");

    REQUIRE(opts.usage(true).find("--name string - Secret") != std::string::npos);

    opts.useSingleDash();
    REQUIRE(opts.usage().find("  -tag string [+] - Tag\n") != std::string::npos);
}

TEST_CASE( "usage text hides unpublicized groups", "[options]" ) {
    Config cfg;
    Options opts;
    opts.add(cfg.verbose, option("verbose", "Talk more").group("General"))
        .add(cfg.name, option("name", "Name").group("Internal", true));

    REQUIRE(opts.usage() == "General:\n  --verbose - Talk more\n");
    REQUIRE(opts.usage(true) == "General:\n  --verbose - Talk more\n\nInternal:\n  --name string - Name\n");
}

TEST_CASE( "settings lists current values", "[options]" ) {
    Config cfg;
    Options opts;
    opts.add(cfg.verbose, option("verbose"))
        .add(cfg.max_count, option("max_count"))
        .add(cfg.tag, option("tag"))
        .add(cfg.name, option("name").unpublicized());

    cfg.tag = {"a", "b"};
    cfg.name = "x";
    REQUIRE(opts.settings() == "verbose=false\nmax-count=10\ntag=a,b\nname=x\n");
}
