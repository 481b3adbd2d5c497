#include "catch2/catch.hpp"
#include "optbind/coerce.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace optbind;

namespace {

Scalar scalarOf(const std::string& text, const TypeDescriptor& type, const CoercionRegistry& registry = {}) {
    OptionValue out;
    const auto err = coerce(text, type, registry, out);
    REQUIRE(!err);
    REQUIRE(std::holds_alternative<Scalar>(out));
    return std::get<Scalar>(out);
}

std::vector<Scalar> listOf(const std::string& text, const TypeDescriptor& type) {
    OptionValue out;
    const auto err = coerce(text, type, CoercionRegistry{}, out);
    REQUIRE(!err);
    REQUIRE(std::holds_alternative<std::vector<Scalar>>(out));
    return std::get<std::vector<Scalar>>(out);
}

std::string errorOf(const std::string& text, const TypeDescriptor& type) {
    OptionValue out;
    const auto err = coerce(text, type, CoercionRegistry{}, out);
    REQUIRE(err);
    return *err;
}

struct Point {
    explicit Point(const std::string& text) {
        const auto comma = text.find('x');
        if (comma == std::string::npos) throw std::invalid_argument("missing 'x'");
        x = std::stoi(text.substr(0, comma));
        y = std::stoi(text.substr(comma + 1));
    }
    int x{0};
    int y{0};
};

} // namespace

TEST_CASE( "booleans", "[coerce]" ) {
    REQUIRE(std::get<bool>(scalarOf("true", TypeDescriptor::boolean())));
    REQUIRE(std::get<bool>(scalarOf("TRUE", TypeDescriptor::boolean())));
    REQUIRE(!std::get<bool>(scalarOf("False", TypeDescriptor::boolean())));

    // Whitespace is not trimmed.
    errorOf(" true", TypeDescriptor::boolean());
    errorOf("true ", TypeDescriptor::boolean());

    const auto err = errorOf("yes", TypeDescriptor::boolean());
    REQUIRE(err.find("\"yes\"") != std::string::npos);
    REQUIRE(err.find("boolean") != std::string::npos);
}

TEST_CASE( "integers", "[coerce]" ) {
    REQUIRE(std::get<std::int64_t>(scalarOf("42", TypeDescriptor::integer())) == 42);
    REQUIRE(std::get<std::int64_t>(scalarOf("-7", TypeDescriptor::integer())) == -7);

    REQUIRE(errorOf("12abc", TypeDescriptor::integer()) == "expected long, got \"12abc\"");
    REQUIRE(errorOf("", TypeDescriptor::integer()) == "expected long, got \"\"");
    REQUIRE(errorOf("99999999999999999999", TypeDescriptor::integer()).find("out of range") != std::string::npos);

    const auto small = TypeDescriptor::integer("int", -2147483648LL, 2147483647LL);
    REQUIRE(std::get<std::int64_t>(scalarOf("2147483647", small)) == 2147483647LL);
    REQUIRE(errorOf("2147483648", small) == "value \"2147483648\" is out of range for int");
}

TEST_CASE( "floating point", "[coerce]" ) {
    REQUIRE(std::get<double>(scalarOf("1.5", TypeDescriptor::floating())) == 1.5);
    REQUIRE(std::get<double>(scalarOf("-2e3", TypeDescriptor::floating())) == -2000.0);
    REQUIRE(errorOf("1.5.5", TypeDescriptor::floating()) == "expected double, got \"1.5.5\"");
    REQUIRE(errorOf("1e999", TypeDescriptor::floating()).find("out of range") != std::string::npos);
    REQUIRE(errorOf("1e300", TypeDescriptor::floating("float")).find("out of range for float") != std::string::npos);
}

TEST_CASE( "strings are taken verbatim", "[coerce]" ) {
    REQUIRE(std::get<std::string>(scalarOf(" a b ", TypeDescriptor::string())) == " a b ");
    REQUIRE(std::get<std::string>(scalarOf("", TypeDescriptor::string())).empty());
}

TEST_CASE( "enumerations match constant names exactly", "[coerce]" ) {
    const auto color = TypeDescriptor::enumeration("color", {"RED", "GREEN"}, {0, 1});
    REQUIRE(std::get<std::string>(scalarOf("GREEN", color)) == "GREEN");

    const auto err = errorOf("green", color);
    REQUIRE(err == "expected one of RED, GREEN for color, got \"green\"");
}

TEST_CASE( "lists split on the separator", "[coerce]" ) {
    const auto ints = TypeDescriptor::list(TypeDescriptor::integer());
    const auto items = listOf("3,4,5", ints);
    REQUIRE(items.size() == 3);
    REQUIRE(std::get<std::int64_t>(items[0]) == 3);
    REQUIRE(std::get<std::int64_t>(items[1]) == 4);
    REQUIRE(std::get<std::int64_t>(items[2]) == 5);

    REQUIRE(listOf("", ints).empty());

    const auto words = TypeDescriptor::list(TypeDescriptor::string(), ':');
    const auto parts = listOf("a:b", words);
    REQUIRE(parts.size() == 2);
    REQUIRE(std::get<std::string>(parts[1]) == "b");

    REQUIRE(errorOf("1,x,3", ints) == "expected long, got \"x\"");
}

TEST_CASE( "custom types go through the registry", "[coerce]" ) {
    CoercionRegistry registry;
    registry.addConstructible<Point>("point");
    REQUIRE(registry.contains("point"));
    REQUIRE(!registry.contains("size"));

    const auto v = scalarOf("3x4", TypeDescriptor::custom("point"), registry);
    const auto& p = std::any_cast<const Point&>(std::get<std::any>(v));
    REQUIRE(p.x == 3);
    REQUIRE(p.y == 4);

    OptionValue out;
    const auto err = coerce("34", TypeDescriptor::custom("point"), registry, out);
    REQUIRE(err);
    REQUIRE(*err == "expected point, got \"34\": missing 'x'");

    const auto missing = coerce("1", TypeDescriptor::custom("size"), registry, out);
    REQUIRE(missing);
}

TEST_CASE( "display names", "[coerce]" ) {
    REQUIRE(TypeDescriptor::list(TypeDescriptor::integer("int")).displayName() == "int");
    REQUIRE(TypeDescriptor::boolean().displayName() == "boolean");
    REQUIRE(kindName(Kind::Enumeration) == "enumeration");
}
