#include "optbind/coerce.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

#include "optbind/utils.hpp"

namespace {

using optbind::utils::trimWs;

std::string quoted(std::string_view s) { return "\"" + std::string(s) + "\""; }

std::optional<std::string> expected(const optbind::TypeDescriptor& type, std::string_view text) {
    return "expected " + type.name + ", got " + quoted(text);
}

bool tryParseBool(std::string_view s, bool& out) {
    const auto t = optbind::utils::toLowerAscii(s);
    if (t == "true") {
        out = true;
        return true;
    }
    if (t == "false") {
        out = false;
        return true;
    }
    return false;
}

std::optional<std::string> parseInteger(std::string_view s, const optbind::TypeDescriptor& type, std::int64_t& out) {
    const auto t = trimWs(s);
    if (t.empty()) return expected(type, s);
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return expected(type, s);
    if (errno == ERANGE || v < type.min || v > type.max) {
        return "value " + quoted(s) + " is out of range for " + type.name;
    }
    out = static_cast<std::int64_t>(v);
    return std::nullopt;
}

std::optional<std::string> parseFloating(std::string_view s, const optbind::TypeDescriptor& type, double& out) {
    const auto t = trimWs(s);
    if (t.empty()) return expected(type, s);
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return expected(type, s);
    // Underflow also reports ERANGE; only overflow is an error.
    if (errno == ERANGE && std::isinf(v)) return "value " + quoted(s) + " is out of range for " + type.name;
    if (type.name == "float" && std::isfinite(v) && std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) {
        return "value " + quoted(s) + " is out of range for " + type.name;
    }
    out = v;
    return std::nullopt;
}

} // namespace

namespace optbind {

std::string_view kindName(Kind kind) {
    switch (kind) {
        case Kind::Boolean: return "boolean";
        case Kind::Integer: return "integer";
        case Kind::Floating: return "floating";
        case Kind::String: return "string";
        case Kind::Enumeration: return "enumeration";
        case Kind::List: return "list";
        case Kind::Custom: return "custom";
    }
    return "string";
}

TypeDescriptor TypeDescriptor::boolean() {
    TypeDescriptor t;
    t.kind = Kind::Boolean;
    t.name = "boolean";
    return t;
}

TypeDescriptor TypeDescriptor::integer(std::string name, std::int64_t min, std::int64_t max) {
    TypeDescriptor t;
    t.kind = Kind::Integer;
    t.name = std::move(name);
    t.min = min;
    t.max = max;
    return t;
}

TypeDescriptor TypeDescriptor::floating(std::string name) {
    TypeDescriptor t;
    t.kind = Kind::Floating;
    t.name = std::move(name);
    return t;
}

TypeDescriptor TypeDescriptor::string() { return TypeDescriptor{}; }

TypeDescriptor TypeDescriptor::enumeration(std::string name,
                                           std::vector<std::string> constants,
                                           std::vector<std::int64_t> values) {
    TypeDescriptor t;
    t.kind = Kind::Enumeration;
    t.name = std::move(name);
    t.constants = std::move(constants);
    t.constantValues = std::move(values);
    return t;
}

TypeDescriptor TypeDescriptor::list(TypeDescriptor element, char separator) {
    TypeDescriptor t;
    t.kind = Kind::List;
    t.name = element.name;
    t.element = std::make_shared<const TypeDescriptor>(std::move(element));
    t.separator = separator;
    return t;
}

TypeDescriptor TypeDescriptor::custom(std::string tag) {
    TypeDescriptor t;
    t.kind = Kind::Custom;
    t.name = std::move(tag);
    return t;
}

const std::string& TypeDescriptor::displayName() const {
    if (kind == Kind::List && element) return element->displayName();
    return name;
}

std::optional<std::string> CoercionRegistry::parse(const std::string& tag, std::string_view text, std::any& out) const {
    const auto it = parsers_.find(tag);
    if (it == parsers_.end()) return "no string conversion registered for type " + tag;
    return it->second(text, out);
}

std::optional<std::string> coerceScalar(std::string_view text,
                                        const TypeDescriptor& type,
                                        const CoercionRegistry& registry,
                                        Scalar& out) {
    switch (type.kind) {
        case Kind::Boolean: {
            bool parsed{};
            if (!tryParseBool(text, parsed)) return expected(type, text);
            out.emplace<bool>(parsed);
            return std::nullopt;
        }
        case Kind::Integer: {
            std::int64_t parsed{};
            if (auto err = parseInteger(text, type, parsed)) return err;
            out.emplace<std::int64_t>(parsed);
            return std::nullopt;
        }
        case Kind::Floating: {
            double parsed{};
            if (auto err = parseFloating(text, type, parsed)) return err;
            out.emplace<double>(parsed);
            return std::nullopt;
        }
        case Kind::String:
            out.emplace<std::string>(text);
            return std::nullopt;
        case Kind::Enumeration:
            for (const auto& c : type.constants) {
                if (c == text) {
                    out.emplace<std::string>(c);
                    return std::nullopt;
                }
            }
            return "expected one of " + utils::join(type.constants, ", ") + " for " + type.name + ", got " + quoted(text);
        case Kind::Custom: {
            std::any parsed;
            if (auto err = registry.parse(type.name, text, parsed)) return err;
            out.emplace<std::any>(std::move(parsed));
            return std::nullopt;
        }
        case Kind::List:
            break;
    }
    return "cannot convert " + quoted(text) + " to a single " + type.name;
}

std::optional<std::string> coerce(std::string_view text,
                                  const TypeDescriptor& type,
                                  const CoercionRegistry& registry,
                                  OptionValue& out) {
    if (type.kind != Kind::List) {
        Scalar scalar;
        if (auto err = coerceScalar(text, type, registry, scalar)) return err;
        out.emplace<Scalar>(std::move(scalar));
        return std::nullopt;
    }

    if (!type.element || type.element->kind == Kind::List) return std::string("list element type is not a scalar type");

    std::vector<Scalar> items;
    for (const auto& token : utils::split(text, type.separator)) {
        Scalar scalar;
        if (auto err = coerceScalar(token, *type.element, registry, scalar)) return err;
        items.push_back(std::move(scalar));
    }
    out.emplace<std::vector<Scalar>>(std::move(items));
    return std::nullopt;
}

} // namespace optbind
