#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

using PackageId = std::uint32_t;
using DatabaseId = std::uint8_t;
using DepthType = std::size_t;

enum DatabaseScope : std::uint8_t { kLocal, kSync };

inline constexpr DatabaseScope complement(DatabaseScope scope) noexcept { return scope == kLocal ? kSync : kLocal; }

inline constexpr std::string_view kLocalDatabaseName = "local";
inline constexpr std::string_view kPacmanConfCommand = "pacman-conf";
inline constexpr int kJsonIndent = 2;
