#include "EvaluatorOptions.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace RS {

namespace {

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool ApplyEvaluatorEnvOverrides(EvaluatorOptions& options) {
    if (!apply_env("REFSPACE_CACHE_ENABLED", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "REFSPACE_CACHE_ENABLED must be a boolean (1/0, true/false, yes/no, on/off)\n";
                return false;
            }
            options.cache.enabled = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("REFSPACE_CACHE_MAX_COST", [&](std::string_view value) {
            std::int64_t parsed = options.cache.maxCost;
            if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int64_t>::max(), parsed)) {
                std::cerr << "REFSPACE_CACHE_MAX_COST must be a positive integer\n";
                return false;
            }
            options.cache.maxCost = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("REFSPACE_CACHE_NUM_COUNTERS", [&](std::string_view value) {
            std::size_t parsed = options.cache.numCounters;
            if (!parse_integer_in_range<std::size_t>(value, 1, std::size_t{1} << 32, parsed)) {
                std::cerr << "REFSPACE_CACHE_NUM_COUNTERS must be within 1-4294967296\n";
                return false;
            }
            options.cache.numCounters = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("REFSPACE_MAX_REFERENCE_DEPTH", [&](std::string_view value) {
            std::size_t parsed = options.maxReferenceDepth;
            if (!parse_integer_in_range<std::size_t>(value, 1, 100000, parsed)) {
                std::cerr << "REFSPACE_MAX_REFERENCE_DEPTH must be within 1-100000\n";
                return false;
            }
            options.maxReferenceDepth = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("REFSPACE_INLINE_MERGE", [&](std::string_view value) {
            auto parsed = parseInlineMergeSpec(value, options.inlineMergeDefaults);
            if (!parsed) {
                std::cerr << "REFSPACE_INLINE_MERGE is invalid: " << parsed.error().message.value_or("") << "\n";
                return false;
            }
            options.inlineMergeDefaults = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ValidateEvaluatorOptions(EvaluatorOptions const& options) -> std::optional<std::string> {
    if (options.localScope && options.localScope->isScalar() && !options.localScope->isNull()) {
        return std::string{"local scope must be a mapping or sequence"};
    }
    if (options.globalScope && options.globalScope->isScalar() && !options.globalScope->isNull()) {
        return std::string{"global scope must be a mapping or sequence"};
    }
    if (options.maxReferenceDepth == 0) {
        return std::string{"maxReferenceDepth must be >= 1"};
    }
    if (options.cache.enabled) {
        if (options.cache.maxCost <= 0) {
            return std::string{"cache.maxCost must be > 0"};
        }
        if (options.cache.numCounters == 0) {
            return std::string{"cache.numCounters must be > 0"};
        }
        if (options.cache.sampleSize == 0) {
            return std::string{"cache.sampleSize must be > 0"};
        }
    }
    return std::nullopt;
}

} // namespace RS
