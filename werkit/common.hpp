#pragma once

#include <iostream>
#include <vector>
#include <string>
#include <mutex>
#include <memory>
#include <algorithm>
#include <limits>
#include <optional>
#include <array>
#include <atomic>
#include <boost/functional/hash.hpp>

#include <parallel_hashmap/phmap.h>
#include <ctpl.h>
#include <spdlog/spdlog.h>

using string = std::string;

template <class T>
using vec = std::vector<T>;

template <class K, class V>
using map = phmap::flat_hash_map<K, V>;

// Node-based so that references to stored values survive later insertions.
template <class K, class V>
using paramap = phmap::parallel_node_hash_map<K, V,
                                              std::hash<K>,
                                              std::equal_to<K>,
                                              std::allocator<std::pair<const K, V>>,
                                              4,
                                              std::mutex>;

// Single-shard variant for small maps owned by one object.
template <class K, class V>
using lockmap = phmap::parallel_node_hash_map<K, V,
                                              std::hash<K>,
                                              std::equal_to<K>,
                                              std::allocator<std::pair<const K, V>>,
                                              0,
                                              std::mutex>;

using Pool = ctpl::thread_pool;

template <class K>
using set = phmap::flat_hash_set<K>;

template <class T1, class T2>
using pair = std::pair<T1, T2>;

template <class T, size_t S>
using array = std::array<T, S>;

// Which rendition of a token is compared or reported.
enum class TextForm : int
{
    RAW,
    NORMALIZED
};

namespace str
{
    inline string from(TextForm form) { return (form == TextForm::RAW) ? "raw" : "normalized"; }

    // Shorten `s` to at most `width` characters, marking the cut with "...".
    inline string clip(const string &s, size_t width)
    {
        if (s.size() <= width)
            return s;
        return s.substr(0, width - 3) + "...";
    }

    inline string join(const vec<string> &items, const string &sep)
    {
        string ret;
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
                ret += sep;
            ret += items[i];
        }
        return ret;
    }
} // namespace str

template <class T>
inline void show_size(const T &obj, std::string msg) { SPDLOG_INFO("{0} size: {1}", msg, obj.size()); }
