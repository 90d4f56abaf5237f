#include "package_loader.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include "dependency.hpp"
#include "util.hpp"

namespace {

std::string read_file(const std::filesystem::path &path) {
  std::ifstream file{path, std::ios::binary};
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::int64_t to_integer(std::string_view value) {
  std::int64_t result = 0;
  std::from_chars(value.data(), value.data() + value.size(), result);
  return result;
}

std::uint8_t to_validation(const std::vector<std::string_view> &values) {
  std::uint8_t validation = kValidationUnknown;
  for (auto value : values) {
    if (value == "none") validation |= kValidationNone;
    else if (value == "md5") validation |= kValidationMd5Sum;
    else if (value == "sha256") validation |= kValidationSha256Sum;
    else if (value == "pgp") validation |= kValidationSignature;
  }
  return validation;
}

} // namespace

auto PackageLoader::parse_sections(std::string_view raw_desc) -> DescSections {
  DescSections sections;
  std::vector<std::string_view> *current = nullptr;
  for (auto raw_line : split_lines(raw_desc)) {
    auto line = trim(raw_line);
    if (line.empty()) current = nullptr;
    else if (line.size() > 2 && line.front() == '%' && line.back() == '%')
      current = &sections[line.substr(1, line.size() - 2)];
    else if (current) current->push_back(line);
  }
  return sections;
}

std::vector<std::string_view> PackageLoader::split_packages(std::string_view raw_packages) {
  std::vector<std::string_view> result;
  std::size_t begin = std::string_view::npos, offset = 0;
  for (auto line : split_lines(raw_packages)) {
    if (trim(line) == "%NAME%") {
      if (begin != std::string_view::npos) result.push_back(raw_packages.substr(begin, offset - begin));
      begin = offset;
    }
    offset += line.size() + 1;
  }
  if (begin != std::string_view::npos) result.push_back(raw_packages.substr(begin));
  return result;
}

std::optional<PackageRecord> PackageLoader::parse_package(std::string_view raw_desc, bool verbose) {
  auto sections = parse_sections(raw_desc);
  auto single = [&sections](std::string_view field) -> std::string_view {
    auto it = sections.find(field);
    return it != sections.end() && !it->second.empty() ? it->second.front() : std::string_view{};
  };
  auto list = [&sections](std::string_view field) -> std::vector<std::string> {
    std::vector<std::string> result;
    if (auto it = sections.find(field); it != sections.end())
      for (auto value : it->second) result.emplace_back(value);
    return result;
  };
  auto deps = [&sections](std::string_view field) -> std::vector<Dependency> {
    auto it = sections.find(field);
    return it != sections.end() ? parse_dependencies(it->second) : std::vector<Dependency>{};
  };

  if (single("NAME").empty() || single("VERSION").empty()) {
    if (verbose) eprintln("Skipping package entry without %NAME% or %VERSION%.");
    return std::nullopt;
  }

  PackageRecord record;
  record.name = single("NAME");
  record.version = single("VERSION");
  record.description = single("DESC");
  record.architecture = single("ARCH");
  record.url = single("URL");
  record.licenses = list("LICENSE");
  record.groups = list("GROUPS");
  record.provides = deps("PROVIDES");
  record.depends_on = deps("DEPENDS");
  record.optional_deps = deps("OPTDEPENDS");
  record.make_deps = deps("MAKEDEPENDS");
  record.check_deps = deps("CHECKDEPENDS");
  record.conflicts_with = deps("CONFLICTS");
  record.replaces = deps("REPLACES");
  record.download_size = to_integer(single("CSIZE"));
  record.installed_size = to_integer(single(sections.contains("ISIZE") ? "ISIZE" : "SIZE"));
  record.packager = single("PACKAGER");
  record.build_date = to_integer(single("BUILDDATE"));
  if (auto install_date = to_integer(single("INSTALLDATE")); install_date != 0) record.install_date = install_date;
  record.install_reason = single("REASON") == "1" ? kDepend : kExplicit;
  if (auto scriptlet = single("SCRIPTLET"); !scriptlet.empty() && scriptlet != "0") record.install_script = true;
  record.md5_sum = single("MD5SUM");
  record.sha256_sum = single("SHA256SUM");
  if (auto sig = single("PGPSIG"); !sig.empty()) record.base64_sig = std::string(sig);
  if (auto it = sections.find("VALIDATION"); it != sections.end()) record.validation = to_validation(it->second);
  return record;
}

std::size_t PackageLoader::load_packages(std::string_view db_name, std::string_view raw_packages, bool verbose) const {
  auto dbid = database_.add_database(db_name);
  std::size_t loaded = 0;
  for (auto raw_desc : split_packages(raw_packages)) {
    auto record = parse_package(raw_desc, verbose);
    if (!record) continue;
    auto [pid, created] = database_.add_package(dbid, std::move(*record));
    if (!created && verbose) eprintln("Duplicated package '", database_.get_package(pid).name, "' in ", db_name, ".");
    loaded += created;
  }
  return loaded;
}

bool PackageLoader::load_file(std::string_view db_name, const std::filesystem::path &path, bool verbose) const {
  std::ifstream file{path};
  if (!file) {
    eprintln("Failed to open package file: ", path.string(), ".");
    return false;
  }
  file.close();
  auto [loaded, time] = measure_time<std::chrono::milliseconds>([&] {
    return load_packages(db_name, read_file(path), verbose);
  });
  if (verbose) eprintln("Loaded ", loaded, " packages into '", db_name, "' from ", path.string(), ". (", time.count(),
    " ms)");
  return true;
}

bool PackageLoader::load_directory(std::string_view db_name, const std::filesystem::path &path, bool verbose) const {
  std::error_code ec;
  std::vector<std::filesystem::path> entries;
  for (const auto &entry : std::filesystem::directory_iterator{path, ec})
    if (entry.is_directory() && std::filesystem::exists(entry.path() / "desc")) entries.push_back(entry.path());
  if (ec) {
    eprintln("Failed to read package directory: ", path.string(), ": ", ec.message(), ".");
    return false;
  }
  std::ranges::sort(entries);
  auto dbid = database_.add_database(db_name);
  std::size_t loaded = 0;
  for (const auto &entry : entries) {
    auto raw_desc = read_file(entry / "desc");
    if (std::filesystem::exists(entry / "depends")) raw_desc.append("\n").append(read_file(entry / "depends"));
    auto record = parse_package(raw_desc, verbose);
    if (!record) continue;
    if (std::filesystem::exists(entry / "install")) record->install_script = true;
    loaded += database_.add_package(dbid, std::move(*record)).second;
  }
  if (verbose) eprintln("Loaded ", loaded, " packages into '", db_name, "' from ", path.string(), ".");
  return true;
}

bool PackageLoader::load(std::string_view db_name, const std::filesystem::path &path, bool verbose) const {
  if (std::filesystem::is_directory(path)) return load_directory(db_name, path, verbose);
  return load_file(db_name, path, verbose);
}
