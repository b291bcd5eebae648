#include "NodeYaml.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace RS {

namespace {

constexpr std::string_view kTagNull  = "tag:yaml.org,2002:null";
constexpr std::string_view kTagBool  = "tag:yaml.org,2002:bool";
constexpr std::string_view kTagInt   = "tag:yaml.org,2002:int";
constexpr std::string_view kTagFloat = "tag:yaml.org,2002:float";
constexpr std::string_view kTagStr   = "tag:yaml.org,2002:str";

constexpr std::size_t kMaxYamlDepth = 512;

auto isDigits(std::string_view text, bool (*accept)(char)) -> bool {
    if (text.empty())
        return false;
    for (char c : text) {
        if (!accept(c))
            return false;
    }
    return true;
}

auto parseInteger(std::string_view text) -> std::optional<Node> {
    std::string_view body = text;
    bool             negative = false;
    if (!body.empty() && (body.front() == '-' || body.front() == '+')) {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    int base = 10;
    if (body.starts_with("0x")) {
        base = 16;
        body.remove_prefix(2);
        if (!isDigits(body, [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }))
            return std::nullopt;
    } else if (body.starts_with("0o")) {
        base = 8;
        body.remove_prefix(2);
        if (!isDigits(body, [](char c) { return c >= '0' && c <= '7'; }))
            return std::nullopt;
    } else if (!isDigits(body, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    // Hex and octal forms are unsigned in the core schema.
    if (base != 10 && text.front() != '0')
        return std::nullopt;

    std::uint64_t magnitude = 0;
    auto [ptr, ec]          = std::from_chars(body.data(), body.data() + body.size(), magnitude, base);
    if (ec == std::errc::result_out_of_range) {
        if (base != 10)
            return std::nullopt;
        double approx = 0.0;
        std::from_chars(body.data(), body.data() + body.size(), approx);
        return Node{negative ? -approx : approx};
    }
    if (ec != std::errc{} || ptr != body.data() + body.size())
        return std::nullopt;

    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude <= kMax + 1)
            return Node{magnitude == kMax + 1 ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(magnitude)};
        return Node{-static_cast<double>(magnitude)};
    }
    if (magnitude <= kMax)
        return Node{static_cast<std::int64_t>(magnitude)};
    return Node{static_cast<double>(magnitude)};
}

auto parseFloat(std::string_view text) -> std::optional<Node> {
    if (text == ".inf" || text == ".Inf" || text == ".INF" || text == "+.inf" || text == "+.Inf" || text == "+.INF")
        return Node{std::numeric_limits<double>::infinity()};
    if (text == "-.inf" || text == "-.Inf" || text == "-.INF")
        return Node{-std::numeric_limits<double>::infinity()};
    if (text == ".nan" || text == ".NaN" || text == ".NAN")
        return Node{std::numeric_limits<double>::quiet_NaN()};

    // [-+]? ( \. [0-9]+ | [0-9]+ ( \. [0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
    std::string_view body = text;
    if (!body.empty() && (body.front() == '-' || body.front() == '+'))
        body.remove_prefix(1);
    std::size_t i           = 0;
    std::size_t intDigits   = 0;
    std::size_t fracDigits  = 0;
    while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
        ++i;
        ++intDigits;
    }
    if (i < body.size() && body[i] == '.') {
        ++i;
        while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
            ++i;
            ++fracDigits;
        }
    }
    if (intDigits == 0 && fracDigits == 0)
        return std::nullopt;
    if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
        ++i;
        if (i < body.size() && (body[i] == '-' || body[i] == '+'))
            ++i;
        std::size_t expDigits = 0;
        while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
            ++i;
            ++expDigits;
        }
        if (expDigits == 0)
            return std::nullopt;
    }
    if (i != body.size())
        return std::nullopt;

    // from_chars rejects a leading '+'.
    if (text.front() == '+')
        text.remove_prefix(1);
    double value   = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range)
        return Node{text.front() == '-' ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity()};
    if (ec != std::errc{})
        return std::nullopt;
    return Node{value};
}

auto scalarWithTag(std::string const& tag, std::string const& text) -> Expected<Node> {
    if (tag == "!" || tag == kTagStr)
        return Node{text};
    if (tag == "?" || tag.empty())
        return ResolvePlainScalar(text);
    if (tag == kTagNull)
        return Node{};
    if (tag == kTagBool || tag == kTagInt || tag == kTagFloat) {
        auto resolved = ResolvePlainScalar(text);
        bool const ok = (tag == kTagBool && resolved.isBool()) || (tag == kTagInt && resolved.isInteger())
                        || (tag == kTagFloat && resolved.isNumber());
        if (!ok)
            return std::unexpected(Error{Error::Code::ParseError, "scalar '" + text + "' does not match tag " + tag});
        if (tag == kTagFloat && resolved.isInteger())
            return Node{resolved.asDouble()};
        return resolved;
    }
    // Unknown local tags keep the text.
    return Node{text};
}

auto needsQuoting(std::string const& text) -> bool {
    return text.empty() || !ResolvePlainScalar(text).isString();
}

auto formatDouble(double value) -> std::string {
    if (std::isnan(value))
        return ".nan";
    if (std::isinf(value))
        return value > 0 ? ".inf" : "-.inf";
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string text{buffer, ptr};
    if (text.find_first_of(".e") == std::string::npos)
        text.append(".0");
    return text;
}

auto emit(YAML::Emitter& out, Node const& node) -> void {
    switch (node.kind()) {
    case Node::Kind::Null:
        out << YAML::Null;
        return;
    case Node::Kind::Bool:
        out << node.asBool();
        return;
    case Node::Kind::Number:
        if (auto const* integer = node.tryInteger())
            out << static_cast<long long>(*integer);
        else
            out << formatDouble(node.asDouble());
        return;
    case Node::Kind::String:
        if (needsQuoting(node.asString()))
            out << YAML::DoubleQuoted << node.asString();
        else
            out << node.asString();
        return;
    case Node::Kind::Sequence:
        out << YAML::BeginSeq;
        for (auto const& element : node.asSequence())
            emit(out, element);
        out << YAML::EndSeq;
        return;
    case Node::Kind::Mapping:
        out << YAML::BeginMap;
        for (auto const& [key, value] : node.asMapping()) {
            out << YAML::Key;
            if (needsQuoting(key))
                out << YAML::DoubleQuoted << key;
            else
                out << key;
            out << YAML::Value;
            emit(out, value);
        }
        out << YAML::EndMap;
        return;
    }
}

// Containers on the path from the root to the node being converted.
auto convert(YAML::Node const& yaml, std::vector<YAML::Node>& open) -> Expected<Node>;

auto convertSequence(YAML::Node const& yaml, std::vector<YAML::Node>& open) -> Expected<Node> {
    Node::Sequence sequence;
    sequence.reserve(yaml.size());
    for (auto const& element : yaml) {
        auto value = convert(element, open);
        if (!value)
            return std::unexpected(value.error());
        sequence.push_back(std::move(*value));
    }
    return Node{std::move(sequence)};
}

auto convertMapping(YAML::Node const& yaml, std::vector<YAML::Node>& open) -> Expected<Node> {
    Node::Mapping mapping;
    for (auto const& entry : yaml) {
        if (!entry.first.IsScalar())
            return std::unexpected(Error{Error::Code::ParseError, "mapping keys must be scalars"});
        auto value = convert(entry.second, open);
        if (!value)
            return std::unexpected(value.error());
        mapping.insert_or_assign(entry.first.Scalar(), std::move(*value));
    }
    return Node{std::move(mapping)};
}

auto convert(YAML::Node const& yaml, std::vector<YAML::Node>& open) -> Expected<Node> {
    switch (yaml.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Node{};
    case YAML::NodeType::Scalar:
        return scalarWithTag(yaml.Tag(), yaml.Scalar());
    case YAML::NodeType::Sequence:
    case YAML::NodeType::Map:
        break;
    }

    // An alias to one of its own ancestors makes yaml-cpp hand back a cyclic graph.
    if (std::any_of(open.begin(), open.end(), [&yaml](YAML::Node const& ancestor) { return ancestor.is(yaml); }))
        return std::unexpected(Error{Error::Code::ParseError, "recursive alias in YAML document"});
    if (open.size() >= kMaxYamlDepth)
        return std::unexpected(Error{Error::Code::ParseError, "YAML nesting exceeds " + std::to_string(kMaxYamlDepth) + " levels"});

    open.push_back(yaml);
    auto result = yaml.IsSequence() ? convertSequence(yaml, open) : convertMapping(yaml, open);
    open.pop_back();
    return result;
}

} // namespace

auto ResolvePlainScalar(std::string_view text) -> Node {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL")
        return Node{};
    if (text == "true" || text == "True" || text == "TRUE")
        return Node{true};
    if (text == "false" || text == "False" || text == "FALSE")
        return Node{false};
    if (auto integer = parseInteger(text))
        return std::move(*integer);
    if (auto number = parseFloat(text))
        return std::move(*number);
    return Node{text};
}

auto FromYaml(YAML::Node const& yaml) -> Expected<Node> {
    std::vector<YAML::Node> open;
    return convert(yaml, open);
}

auto ParseYaml(std::string_view text) -> Expected<Node> {
    try {
        return FromYaml(YAML::Load(std::string{text}));
    } catch (YAML::Exception const& error) {
        return std::unexpected(Error{Error::Code::ParseError, std::string{"invalid YAML: "} + error.what()});
    }
}

auto DumpYaml(Node const& node) -> std::string {
    YAML::Emitter out;
    emit(out, node);
    return std::string{out.c_str()};
}

} // namespace RS
