#pragma once

#include <type_traits>

// =========================================================================================================
// Keyed lookup
// =========================================================================================================
//
//   get_or_default(map, key)    - mapped value for key, or a value-initialized one if key is missing
//
// Works with every associative container exposing find() / end() / mapped_type,
// e.g. std::map, std::unordered_map, std::flat_map.
// Unlike map[key], the lookup never inserts and works on const maps.
//

namespace uc
{
/// Returns a copy of the value stored under key, or mapped_type{} if there is none.
/// The map is not modified.
/// Usage:
///   std::map<std::string, int> counts = {{"a", 3}};
///   uc::get_or_default(counts, "a"); // 3
///   uc::get_or_default(counts, "b"); // 0, counts still has one entry
template <class Map, class Key>
[[nodiscard]] typename Map::mapped_type get_or_default(Map const& map, Key const& key)
{
    static_assert(std::is_default_constructible_v<typename Map::mapped_type>,
                  "missing keys yield a value-initialized mapped_type");

    auto const it = map.find(key);
    if (it == map.end())
        return typename Map::mapped_type{};
    return it->second;
}
} // namespace uc
