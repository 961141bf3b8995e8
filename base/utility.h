// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

#include <memory>
#include <string>
#include <vector>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <optional>

#include "base/assert.h"

namespace base
{

inline unsigned NextPOT(unsigned v)
{
    // https://graphics.stanford.edu/~seander/bithacks.html#RoundUpPowerOf2
    v--;
    v |= v >> 1;
    v |= v >> 2;
    v |= v >> 4;
    v |= v >> 8;
    v |= v >> 16;
    v++;
    return v;
}

template<typename T> inline
const T* GetOpt(const std::optional<T>& opt)
{
    if (opt.has_value())
        return &opt.value();
    return nullptr;
}

template<typename Key, typename Val> inline
bool Contains(const std::unordered_map<Key, Val>& map, const Key& k)
{ return map.find(k) != map.end(); }

template<typename T> inline
bool Contains(const std::unordered_set<T>& set, const T& value)
{ return set.find(value) != set.end(); }

template<typename T> inline
bool Contains(const std::vector<T>& vector, const T& value)
{ return std::find(vector.begin(), vector.end(), value) != vector.end(); }

template<typename K, typename T>
T* SafeFind(std::unordered_map<K, T>& map, const K& key)
{
    auto it = map.find(key);
    if (it == map.end())
        return nullptr;
    return &it->second;
}
template<typename K, typename T>
const T* SafeFind(const std::unordered_map<K, T>& map, const K& key)
{
    auto it = map.find(key);
    if (it == map.end())
        return nullptr;
    return &it->second;
}

template<typename T, typename Predicate>
T* SafeFind(std::vector<T>& vector, Predicate predicate)
{
    for (auto& item : vector)
    {
        if (predicate(item))
            return &item;
    }
    return nullptr;
}
template<typename T, typename Predicate>
const T* SafeFind(const std::vector<T>& vector, Predicate predicate)
{
    for (auto& item : vector)
    {
        if (predicate(item))
            return &item;
    }
    return nullptr;
}

inline bool Contains(const std::string& str, const std::string& what)
{ return str.find(what) != std::string::npos; }
inline bool StartsWith(const std::string& str, const std::string& what)
{ return str.find(what) == 0; }
inline bool EndsWith(const std::string& str, const std::string& what)
{
    if (what.size() > str.size())
        return false;
    return str.compare(str.size() - what.size(), what.size(), what) == 0;
}

// split the string into parts at each separator. empty parts are kept.
inline std::vector<std::string> SplitString(const std::string& str, char separator = ' ')
{
    std::vector<std::string> ret;
    std::string part;
    for (char c : str)
    {
        if (c == separator)
        {
            ret.push_back(std::move(part));
            part.clear();
        }
        else part.push_back(c);
    }
    if (!part.empty())
        ret.push_back(std::move(part));
    return ret;
}

// join the parts into a single string with the separator between each part.
inline std::string JoinString(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string ret;
    for (size_t i=0; i<parts.size(); ++i)
    {
        if (i)
            ret += separator;
        ret += parts[i];
    }
    return ret;
}

} // base
