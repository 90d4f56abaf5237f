#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "memory_database.hpp"
#include "package_record.hpp"

// Reads pacman `desc` text into a MemoryDatabase. A package starts at every
// %NAME% section; a section ends at the first blank line.
class PackageLoader {
public:
  PackageLoader(MemoryDatabase &database) : database_(database) {}
  ~PackageLoader() = default;

  std::size_t load_packages(std::string_view db_name, std::string_view raw_packages, bool verbose = false) const;

  bool load_file(std::string_view db_name, const std::filesystem::path &path, bool verbose = false) const;
  bool load_directory(std::string_view db_name, const std::filesystem::path &path, bool verbose = false) const;
  bool load(std::string_view db_name, const std::filesystem::path &path, bool verbose = false) const;

  static std::optional<PackageRecord> parse_package(std::string_view raw_desc, bool verbose = false);

private:
  MemoryDatabase &database_;

  using DescSections = std::unordered_map<std::string_view, std::vector<std::string_view>>;

  static DescSections parse_sections(std::string_view raw_desc);
  static std::vector<std::string_view> split_packages(std::string_view raw_packages);
};
