#pragma once

/// @file hash_map.hpp
/// @brief Hash container selection (abseil Swiss tables when available)

#if defined(TNT_HAS_ABSEIL) && TNT_HAS_ABSEIL
    #include <absl/container/flat_hash_map.h>
    #include <absl/container/flat_hash_set.h>
    #define TNT_USE_ABSEIL_HASH_MAP 1
#else
    #include <unordered_map>
    #include <unordered_set>
    #define TNT_USE_ABSEIL_HASH_MAP 0
#endif

namespace tnt::util {

#if TNT_USE_ABSEIL_HASH_MAP
template<typename K, typename V>
using HashMap = absl::flat_hash_map<K, V>;

template<typename K>
using HashSet = absl::flat_hash_set<K>;
#else
template<typename K, typename V>
using HashMap = std::unordered_map<K, V>;

template<typename K>
using HashSet = std::unordered_set<K>;
#endif

} // namespace tnt::util
