#pragma once
#include "config/EvaluatorOptions.hpp"
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <filesystem>
#include <iosfwd>
#include <string_view>

namespace RS {

enum class DocumentFormat {
    Auto,
    Yaml,
    Json
};

/**
 * Auto treats text whose first significant character is '{' or '[' as JSON
 * and falls back to YAML when that fails; anything else is read as YAML,
 * which JSON documents also satisfy.
 */
[[nodiscard]] auto ParseDocument(std::string_view text, DocumentFormat format = DocumentFormat::Auto) -> Expected<Node>;
[[nodiscard]] auto FormatForPath(std::filesystem::path const& path) -> DocumentFormat;

// Parse then evaluate with a fresh Evaluator built from options.
[[nodiscard]] auto ProcessBytes(std::string_view bytes, EvaluatorOptions options = {}, DocumentFormat format = DocumentFormat::Auto) -> Expected<Node>;
[[nodiscard]] auto ProcessStream(std::istream& stream, EvaluatorOptions options = {}, DocumentFormat format = DocumentFormat::Auto) -> Expected<Node>;
[[nodiscard]] auto ProcessFile(std::filesystem::path const& path, EvaluatorOptions options = {}) -> Expected<Node>;

[[nodiscard]] auto DumpDocument(Node const& node, DocumentFormat format) -> std::string;

} // namespace RS
