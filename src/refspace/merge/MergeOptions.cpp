#include "MergeOptions.hpp"

#include <string>

namespace RS {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

} // namespace

auto parseObjectStrategy(std::string_view name) -> Expected<ObjectStrategy> {
    if (name == "deep")
        return ObjectStrategy::Deep;
    if (name == "shallow")
        return ObjectStrategy::Shallow;
    if (name == "replace")
        return ObjectStrategy::Replace;
    return std::unexpected(validationError("invalid object merge strategy: '" + std::string{name} + "'"));
}

auto parseArrayStrategy(std::string_view name) -> Expected<ArrayStrategy> {
    if (name == "concat")
        return ArrayStrategy::Concat;
    if (name == "prepend")
        return ArrayStrategy::Prepend;
    if (name == "append")
        return ArrayStrategy::Append;
    if (name == "unique")
        return ArrayStrategy::Unique;
    if (name == "union")
        return ArrayStrategy::Union;
    return std::unexpected(validationError("invalid array merge strategy: '" + std::string{name} + "'"));
}

auto parseKeyConflict(std::string_view name) -> Expected<KeyConflict> {
    if (name == "replace")
        return KeyConflict::Replace;
    if (name == "first")
        return KeyConflict::First;
    if (name == "error")
        return KeyConflict::Error;
    return std::unexpected(validationError("invalid key_conflict: '" + std::string{name} + "'"));
}

auto toString(ObjectStrategy strategy) -> std::string_view {
    switch (strategy) {
    case ObjectStrategy::Deep:
        return "deep";
    case ObjectStrategy::Shallow:
        return "shallow";
    case ObjectStrategy::Replace:
        return "replace";
    }
    return "deep";
}

auto toString(ArrayStrategy strategy) -> std::string_view {
    switch (strategy) {
    case ArrayStrategy::Concat:
        return "concat";
    case ArrayStrategy::Prepend:
        return "prepend";
    case ArrayStrategy::Append:
        return "append";
    case ArrayStrategy::Unique:
        return "unique";
    case ArrayStrategy::Union:
        return "union";
    }
    return "concat";
}

auto toString(KeyConflict conflict) -> std::string_view {
    switch (conflict) {
    case KeyConflict::Replace:
        return "replace";
    case KeyConflict::First:
        return "first";
    case KeyConflict::Error:
        return "error";
    }
    return "replace";
}

auto parseInlineMergeSpec(std::string_view spec, MergeOptions base) -> Expected<MergeOptions> {
    spec = trim(spec);
    if (spec.starts_with('<')) {
        if (!spec.ends_with('>'))
            return std::unexpected(validationError("unterminated inline merge options '" + std::string{spec} + "'"));
        spec = trim(spec.substr(1, spec.size() - 2));
    }
    if (spec.empty())
        return std::unexpected(validationError("empty inline merge options"));

    auto const comma    = spec.find(',');
    auto const strategy = trim(spec.substr(0, comma));

    if (auto object = parseObjectStrategy(strategy)) {
        base.object = *object;
    } else if (auto array = parseArrayStrategy(strategy)) {
        base.array = *array;
    } else {
        return std::unexpected(validationError("invalid merge strategy '" + std::string{strategy} + "'"));
    }

    if (comma != std::string_view::npos) {
        auto const rest = spec.substr(comma + 1);
        if (rest.find(',') != std::string_view::npos)
            return std::unexpected(validationError("too many inline merge options in '" + std::string{spec} + "'"));
        auto conflict = parseKeyConflict(trim(rest));
        if (!conflict)
            return std::unexpected(conflict.error());
        base.keyConflict = *conflict;
    }
    return base;
}

auto canonicalString(MergeOptions const& options) -> std::string {
    std::string out;
    out.append(toString(options.object));
    out.push_back('|');
    out.append(toString(options.array));
    out.push_back('|');
    out.append(toString(options.keyConflict));
    return out;
}

} // namespace RS
