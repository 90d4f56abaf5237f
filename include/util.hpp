#pragma once
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

constexpr std::string_view trim(std::string_view sv) noexcept {
  auto first = sv.find_first_not_of(" \t\n\r\f\v");
  if (first == std::string_view::npos) return std::string_view();
  auto last = sv.find_last_not_of(" \t\n\r\f\v");
  return sv.substr(first, last - first + 1);
}

inline std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    auto pos = text.find('\n');
    lines.emplace_back(text.substr(0, pos));
    if (pos == std::string_view::npos) break;
    text.remove_prefix(pos + 1);
  }
  return lines;
}

template <class... Args>
void print(std::ostream &os, const Args &... args) {
  (os << ... << args);
}

template <class... Args>
void println(std::ostream &os, const Args &... args) {
  (os << ... << args) << '\n';
}

// Diagnostics never go to stdout: it carries the JSON document.
template <class... Args>
void eprintln(const Args &... args) {
  println(std::cerr, args...);
}

template <class Duration, class Fn, class... Args>
auto measure_time(Fn &&fn, Args &&... args) {
  using Ret = std::invoke_result_t<Fn, Args...>;
  auto start = std::chrono::steady_clock::now();
  if constexpr (std::is_void_v<Ret>) {
    std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(end - start);
  } else {
    Ret result = std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
    auto end = std::chrono::steady_clock::now();
    return std::pair<Ret, Duration>(std::move(result), std::chrono::duration_cast<Duration>(end - start));
  }
}
