#include "Process.hpp"
#include "eval/Evaluator.hpp"
#include "io/NodeJson.hpp"
#include "io/NodeYaml.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <iterator>
#include <sstream>
#include <string>

namespace RS {

namespace {

auto looksLikeJson(std::string_view text) -> bool {
    auto it = std::find_if(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) == 0; });
    return it != text.end() && (*it == '{' || *it == '[');
}

auto toLower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

auto ParseDocument(std::string_view text, DocumentFormat format) -> Expected<Node> {
    switch (format) {
    case DocumentFormat::Json:
        return ParseJson(text);
    case DocumentFormat::Yaml:
        return ParseYaml(text);
    case DocumentFormat::Auto:
        break;
    }
    if (looksLikeJson(text)) {
        auto json = ParseJson(text);
        if (json)
            return json;
        rs_log("JSON parse failed, retrying as YAML: " + json.error().message.value_or(""), "Process");
    }
    return ParseYaml(text);
}

auto FormatForPath(std::filesystem::path const& path) -> DocumentFormat {
    auto const extension = toLower(path.extension().string());
    if (extension == ".json")
        return DocumentFormat::Json;
    if (extension == ".yaml" || extension == ".yml")
        return DocumentFormat::Yaml;
    return DocumentFormat::Auto;
}

auto ProcessBytes(std::string_view bytes, EvaluatorOptions options, DocumentFormat format) -> Expected<Node> {
    auto document = ParseDocument(bytes, format);
    if (!document)
        return std::unexpected(document.error());
    if (auto invalid = ValidateEvaluatorOptions(options))
        return std::unexpected(validationError(*invalid));
    Evaluator evaluator{std::move(options)};
    return evaluator.eval(*document);
}

auto ProcessStream(std::istream& stream, EvaluatorOptions options, DocumentFormat format) -> Expected<Node> {
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad())
        return std::unexpected(Error{Error::Code::IoError, "failed to read input stream"});
    return ProcessBytes(buffer.str(), std::move(options), format);
}

auto ProcessFile(std::filesystem::path const& path, EvaluatorOptions options) -> Expected<Node> {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return std::unexpected(Error{Error::Code::IoError, "failed to open " + path.string(), {path.string()}});
    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
        return std::unexpected(Error{Error::Code::IoError, "failed to read " + path.string(), {path.string()}});
    rs_log("Processing " + path.string(), "Process");
    auto result = ProcessBytes(contents, std::move(options), FormatForPath(path));
    if (!result)
        return std::unexpected(withContext(std::move(result.error()), path.string()));
    return result;
}

auto DumpDocument(Node const& node, DocumentFormat format) -> std::string {
    if (format == DocumentFormat::Json)
        return DumpJson(node, 2);
    return DumpYaml(node);
}

} // namespace RS
