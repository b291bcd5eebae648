#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RS {

struct Error {
    enum class Code {
        UnknownError = 0,
        UnknownScope,
        PathNotFound,
        CycleDetected,
        KeyConflict,
        ValidationError,
        DuplicateDirective,
        ResourceResolutionError,
        TransformError,
        PreEvalError,
        ParseError,
        DepthExceeded,
        IoError
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::vector<std::string> s)
        : code(c), message(std::move(m)), subjects(std::move(s)) {}

    Code                       code;
    std::optional<std::string> message;
    // UnknownScope: {scope}, PathNotFound: {scope, path}, KeyConflict: {key}, CycleDetected: the chain.
    std::vector<std::string> subjects;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::UnknownScope:
        return "unknown_scope";
    case Error::Code::PathNotFound:
        return "path_not_found";
    case Error::Code::CycleDetected:
        return "cycle_detected";
    case Error::Code::KeyConflict:
        return "key_conflict";
    case Error::Code::ValidationError:
        return "validation_error";
    case Error::Code::DuplicateDirective:
        return "duplicate_directive";
    case Error::Code::ResourceResolutionError:
        return "resource_resolution_error";
    case Error::Code::TransformError:
        return "transform_error";
    case Error::Code::PreEvalError:
        return "pre_eval_error";
    case Error::Code::ParseError:
        return "parse_error";
    case Error::Code::DepthExceeded:
        return "depth_exceeded";
    case Error::Code::IoError:
        return "io_error";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Prefixes the message with where the failure happened. Code and subjects are kept.
[[nodiscard]] inline auto withContext(Error error, std::string_view context) -> Error {
    std::string message{context};
    if (error.message && !error.message->empty()) {
        message.append(": ");
        message.append(*error.message);
    }
    error.message = std::move(message);
    return error;
}

[[nodiscard]] inline auto unknownScopeError(std::string scope, std::string message) -> Error {
    return Error{Error::Code::UnknownScope, std::move(message), {std::move(scope)}};
}

[[nodiscard]] inline auto pathNotFoundError(std::string scope, std::string path) -> Error {
    auto message = "path '" + path + "' not found in " + scope + " scope";
    return Error{Error::Code::PathNotFound, std::move(message), {std::move(scope), std::move(path)}};
}

[[nodiscard]] inline auto keyConflictError(std::string key) -> Error {
    auto message = "key conflict: '" + key + "' already exists";
    return Error{Error::Code::KeyConflict, std::move(message), {std::move(key)}};
}

[[nodiscard]] inline auto validationError(std::string message) -> Error {
    return Error{Error::Code::ValidationError, std::move(message)};
}

} // namespace RS
