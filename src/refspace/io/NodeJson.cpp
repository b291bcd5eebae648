#include "NodeJson.hpp"

#include <cstdint>
#include <limits>

namespace RS {

auto FromJson(Json const& json) -> Node {
    switch (json.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return Node{};
    case Json::value_t::boolean:
        return Node{json.get<bool>()};
    case Json::value_t::number_integer:
        return Node{json.get<std::int64_t>()};
    case Json::value_t::number_unsigned: {
        auto const value = json.get<std::uint64_t>();
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return Node{static_cast<std::int64_t>(value)};
        return Node{static_cast<double>(value)};
    }
    case Json::value_t::number_float:
        return Node{json.get<double>()};
    case Json::value_t::string:
        return Node{json.get_ref<std::string const&>()};
    case Json::value_t::array: {
        Node::Sequence sequence;
        sequence.reserve(json.size());
        for (auto const& element : json)
            sequence.push_back(FromJson(element));
        return Node{std::move(sequence)};
    }
    case Json::value_t::object: {
        Node::Mapping mapping;
        for (auto const& [key, value] : json.items())
            mapping.insert_or_assign(key, FromJson(value));
        return Node{std::move(mapping)};
    }
    case Json::value_t::binary:
        break;
    }
    return Node{};
}

auto ToJson(Node const& node) -> Json {
    switch (node.kind()) {
    case Node::Kind::Null:
        return Json(nullptr);
    case Node::Kind::Bool:
        return Json(node.asBool());
    case Node::Kind::Number:
        if (auto const* integer = node.tryInteger())
            return Json(*integer);
        return Json(node.asDouble());
    case Node::Kind::String:
        return Json(node.asString());
    case Node::Kind::Sequence: {
        auto array = Json::array();
        for (auto const& element : node.asSequence())
            array.push_back(ToJson(element));
        return array;
    }
    case Node::Kind::Mapping: {
        auto object = Json::object();
        for (auto const& [key, value] : node.asMapping())
            object[key] = ToJson(value);
        return object;
    }
    }
    return Json(nullptr);
}

auto ParseJson(std::string_view text) -> Expected<Node> {
    try {
        return FromJson(Json::parse(text.begin(), text.end()));
    } catch (Json::parse_error const& error) {
        return std::unexpected(Error{Error::Code::ParseError, std::string{"invalid JSON: "} + error.what()});
    }
}

auto DumpJson(Node const& node, int indent) -> std::string {
    return ToJson(node).dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace RS
