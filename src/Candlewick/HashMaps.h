#pragma once

////////////////////
// Defines hash map types in a generic way so they can be easily changed
// Notes about the hashes:
// std::unordered is best for debugability (due to IDE support), but is slow
// ska::flat_hash is best for performance, used for the scope tables which are probed on every variable access
// ska::bytell_hash is compact and almost as fast as ska::flat_hash, used for tables that are built once and read often,
//  like the function registry

//system headers:
#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#ifdef USE_STL_HASH_MAPS

#include <unordered_map>

template<typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>, typename A = std::allocator<std::pair<const K, V> > >
using FastHashMap = std::unordered_map<K, V, H, E, A>;

template<typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>, typename A = std::allocator<std::pair<const K, V> > >
using CompactHashMap = std::unordered_map<K, V, H, E, A>;

#else

//3rd party headers:
#include "skarupke_maps/bytell_hash_map.hpp"
#include "skarupke_maps/flat_hash_map.hpp"

template<typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>, typename A = std::allocator<std::pair<const K, V> > >
using FastHashMap = ska::flat_hash_map<K, V, H, E, A>;

template<typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>, typename A = std::allocator<std::pair<const K, V> > >
using CompactHashMap = ska::bytell_hash_map<K, V, H, E, A>;

#endif

//implements a map via a vector, where entries are looked up sequentially for brute force
//useful for very small maps, such as the named arguments of a single call,
// and keeps the insertion order, which hash maps do not
//note that, like other fast maps, iterators may be invalidated when the map is altered
template<typename K, typename V, typename E = std::equal_to<K>>
class SmallMap : public std::vector<std::pair<K, V>>
{
public:

	using key_type = K;
	using mapped_type = V;
	using value_type = std::pair<K, V>;

	//returns an iterator to the entry with key, end() if not found
	inline auto find(const K &key)
	{
		return std::find_if(
			std::begin(*this),
			std::end(*this),
			[&key](const auto &i)
			{	return E{}(i.first, key);	}
		);
	}

	inline auto find(const K &key) const
	{
		return std::find_if(
			std::begin(*this),
			std::end(*this),
			[&key](const auto &i)
			{	return E{}(i.first, key);	}
		);
	}

	//implement the map version of emplace, but allow for use of default constructor for the value
	template<class... Args>
	inline auto &emplace(K key, Args&&... args)
	{
		if constexpr(sizeof...(Args) == 0)
			return this->emplace_back(std::move(key), V{});
		else
			return this->emplace_back(std::move(key), std::forward<Args>(args)...);
	}
};
