#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

template <class Char, class Traits = std::char_traits<Char>>
struct BasicStringHash {
  using is_transparent = void;
  using view_type = std::basic_string_view<Char, Traits>;
  std::size_t operator()(view_type key) const noexcept { return std::hash<view_type>{}(key); }
};

template <class Char, class Traits = std::char_traits<Char>>
struct BasicStringEqual {
  using is_transparent = void;
  using view_type = std::basic_string_view<Char, Traits>;
  bool operator()(view_type l, view_type r) const noexcept { return l == r; }
};

template <class Char, class T, class Traits = std::char_traits<Char>, class Alloc = std::allocator<Char>>
using BasicStringMap = std::unordered_map<
  std::basic_string<Char, Traits, Alloc>, T, BasicStringHash<Char, Traits>, BasicStringEqual<Char, Traits>>;

template <class Char, class Traits = std::char_traits<Char>, class Alloc = std::allocator<Char>>
using BasicStringSet = std::unordered_set<
  std::basic_string<Char, Traits, Alloc>, BasicStringHash<Char, Traits>, BasicStringEqual<Char, Traits>>;

template <class T>
using StringMap = BasicStringMap<char, T>;

using StringSet = BasicStringSet<char>;
