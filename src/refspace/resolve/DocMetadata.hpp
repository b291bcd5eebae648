#pragma once
#include "core/Node.hpp"
#include "path/TransparentString.hpp"

#include <functional>
#include <string>

#include <parallel_hashmap/phmap.h>

namespace RS {

// Per-eval memo of fetched resource documents, keyed by resource id.
struct DocMetadata {
    using ResourceMap = phmap::flat_hash_map<std::string, Node, TransparentStringHash, std::equal_to<>>;

    ResourceMap resources;
    std::size_t fetchCount = 0;
};

} // namespace RS
