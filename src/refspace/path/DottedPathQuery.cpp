#include "DottedPathQuery.hpp"

#include "path/path_utils.hpp"

#include <array>
#include <charconv>
#include <cstdint>

namespace RS {

namespace {

enum class CompareOp {
    Exists,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Like,
    NotLike
};

struct Predicate {
    std::string lhs;
    CompareOp   op = CompareOp::Exists;
    Node        rhs;
    bool        all = false;
};

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
        text.remove_suffix(1);
    return text;
}

auto unescape(std::string_view segment) -> std::string {
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '\\' && i + 1 < segment.size()) {
            ++i;
        }
        out.push_back(segment[i]);
    }
    return out;
}

auto parseIndex(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty())
        return std::nullopt;
    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (ec != std::errc{} || ptr != segment.data() + segment.size())
        return std::nullopt;
    return value;
}

auto parseLiteral(std::string_view text) -> Node {
    text = trim(text);
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        return Node{unescape(text.substr(1, text.size() - 2))};
    }
    if (text == "true")
        return Node{true};
    if (text == "false")
        return Node{false};
    if (text == "null")
        return Node{};
    std::int64_t integer = 0;
    if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), integer); ec == std::errc{} && ptr == text.data() + text.size()) {
        return Node{integer};
    }
    double number = 0.0;
    if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number); ec == std::errc{} && ptr == text.data() + text.size()) {
        return Node{number};
    }
    return Node{std::string{text}};
}

// Operators ordered so that two-character forms are tried before their prefixes.
constexpr std::array<std::pair<std::string_view, CompareOp>, 8> kOperators{{
    {"==", CompareOp::Equal},
    {"!=", CompareOp::NotEqual},
    {"<=", CompareOp::LessEqual},
    {">=", CompareOp::GreaterEqual},
    {"!%", CompareOp::NotLike},
    {"<", CompareOp::Less},
    {">", CompareOp::Greater},
    {"%", CompareOp::Like},
}};

auto parsePredicate(std::string_view segment) -> std::optional<Predicate> {
    if (!segment.starts_with("#("))
        return std::nullopt;
    Predicate predicate;
    if (segment.ends_with(")#")) {
        predicate.all = true;
        segment       = segment.substr(2, segment.size() - 4);
    } else if (segment.ends_with(')')) {
        segment = segment.substr(2, segment.size() - 3);
    } else {
        return std::nullopt;
    }

    char quote = '\0';
    for (std::size_t i = 0; i < segment.size(); ++i) {
        char const ch = segment[i];
        if (quote != '\0') {
            if (ch == '\\')
                ++i;
            else if (ch == quote)
                quote = '\0';
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
            continue;
        }
        if (ch == '\\') {
            ++i;
            continue;
        }
        for (auto const& [token, op] : kOperators) {
            if (segment.substr(i).starts_with(token)) {
                predicate.lhs = std::string{trim(segment.substr(0, i))};
                predicate.op  = op;
                predicate.rhs = parseLiteral(segment.substr(i + token.size()));
                return predicate;
            }
        }
    }
    predicate.lhs = std::string{trim(segment)};
    return predicate;
}

auto compareOrdered(Node const& lhs, Node const& rhs, CompareOp op) -> bool {
    int order = 0;
    if (lhs.isNumber() && rhs.isNumber()) {
        auto const a = lhs.asDouble();
        auto const b = rhs.asDouble();
        order        = a < b ? -1 : (a > b ? 1 : 0);
    } else if (lhs.isString() && rhs.isString()) {
        order = lhs.asString().compare(rhs.asString());
    } else {
        return false;
    }
    switch (op) {
    case CompareOp::Less:
        return order < 0;
    case CompareOp::LessEqual:
        return order <= 0;
    case CompareOp::Greater:
        return order > 0;
    case CompareOp::GreaterEqual:
        return order >= 0;
    default:
        return false;
    }
}

auto evaluatePredicate(Predicate const& predicate, std::optional<Node> const& subject) -> bool {
    if (predicate.op == CompareOp::Exists) {
        return subject.has_value() && !subject->isNull() && !(subject->isBool() && !subject->asBool());
    }
    if (!subject) {
        return false;
    }
    switch (predicate.op) {
    case CompareOp::Equal:
        return sameValue(*subject, predicate.rhs);
    case CompareOp::NotEqual:
        return !sameValue(*subject, predicate.rhs);
    case CompareOp::Like:
    case CompareOp::NotLike: {
        if (!subject->isString() || !predicate.rhs.isString())
            return false;
        bool const matched = match_names(predicate.rhs.asString(), subject->asString());
        return predicate.op == CompareOp::Like ? matched : !matched;
    }
    default:
        return compareOrdered(*subject, predicate.rhs, predicate.op);
    }
}

} // namespace

auto DottedPathQuery::splitSegments(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    std::string              current;
    int                      depth = 0;
    char                     quote = '\0';
    for (std::size_t i = 0; i < path.size(); ++i) {
        char const ch = path[i];
        if (ch == '\\' && i + 1 < path.size()) {
            current.push_back(ch);
            current.push_back(path[++i]);
            continue;
        }
        if (depth > 0) {
            if (quote != '\0') {
                if (ch == quote)
                    quote = '\0';
            } else if (ch == '"' || ch == '\'') {
                quote = ch;
            } else if (ch == '(') {
                ++depth;
            } else if (ch == ')') {
                --depth;
            }
        } else if (ch == '(') {
            ++depth;
        } else if (ch == '.') {
            segments.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    segments.push_back(std::move(current));
    return segments;
}

auto DottedPathQuery::query(Node const& document, std::string_view path) const -> std::optional<Node> {
    if (path.empty()) {
        return document;
    }
    auto const segments = splitSegments(path);
    return this->walk(document, segments, 0);
}

auto DottedPathQuery::walk(Node const& current, std::vector<std::string> const& segments, std::size_t index) const -> std::optional<Node> {
    if (index == segments.size()) {
        return current;
    }
    std::string_view const segment = segments[index];

    if (segment == "#") {
        auto const* sequence = current.trySequence();
        if (!sequence)
            return std::nullopt;
        if (index + 1 == segments.size())
            return Node{static_cast<std::int64_t>(sequence->size())};
        Node::Sequence collected;
        for (auto const& element : *sequence) {
            if (auto value = this->walk(element, segments, index + 1))
                collected.push_back(std::move(*value));
        }
        return Node{std::move(collected)};
    }

    if (auto predicate = parsePredicate(segment)) {
        auto const* sequence = current.trySequence();
        if (!sequence)
            return std::nullopt;
        auto const subjectOf = [&](Node const& element) -> std::optional<Node> {
            if (predicate->lhs.empty())
                return element;
            return this->query(element, predicate->lhs);
        };
        if (!predicate->all) {
            for (auto const& element : *sequence) {
                if (evaluatePredicate(*predicate, subjectOf(element)))
                    return this->walk(element, segments, index + 1);
            }
            return std::nullopt;
        }
        Node::Sequence collected;
        for (auto const& element : *sequence) {
            if (!evaluatePredicate(*predicate, subjectOf(element)))
                continue;
            if (auto value = this->walk(element, segments, index + 1))
                collected.push_back(std::move(*value));
        }
        return Node{std::move(collected)};
    }

    if (auto const* sequence = current.trySequence()) {
        auto const position = parseIndex(segment);
        if (!position || *position >= sequence->size())
            return std::nullopt;
        return this->walk((*sequence)[*position], segments, index + 1);
    }

    auto const* mapping = current.tryMapping();
    if (!mapping)
        return std::nullopt;
    if (is_glob(segment)) {
        for (auto const& [key, value] : *mapping) {
            if (match_names(segment, key))
                return this->walk(value, segments, index + 1);
        }
        return std::nullopt;
    }
    auto it = mapping->find(unescape(segment));
    if (it == mapping->end())
        return std::nullopt;
    return this->walk(it->second, segments, index + 1);
}

} // namespace RS
