#pragma once

#include "algorithm"
#include "any"
#include "array"
#include "atomic"
#include "chrono"
#include "concepts"
#include "exception"
#include "expected"
#include "functional"
#include "initializer_list"
#include "iostream"
#include "map"
#include "memory"
#include "mutex"
#include "optional"
#include "ranges"
#include "set"
#include "shared_mutex"
#include "source_location"
#include "sstream"
#include "stdexcept"
#include "system_error"
#include "string"
#include "string_view"
#include "thread"
#include "typeindex"
#include "unordered_map"
#include "utility"
#include "vector"

#include <cstdint>
#include <cstring>

#include "config.h"

namespace Registrar {

// === Universal Type Concepts ===

/**
 * @brief An implementation type that can be boxed behind a capability interface
 */
template <typename Impl, typename Interface>
concept ImplementationOf = std::derived_from<Impl, Interface> || std::is_same_v<Impl, Interface>;

} // namespace Registrar
