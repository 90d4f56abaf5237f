#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>
#include "memory_database.hpp"
#include "reverse_deps.hpp"
#include "util.hpp"

std::string format_ms(double ms) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3) << ms << " ms";
  return os.str();
}

double analyze_times(nlohmann::ordered_json &result, std::vector<std::size_t> &times) {
  std::ranges::sort(times);
  auto trials = times.size();
  auto total_time = std::accumulate(times.begin(), times.end(), 0ull);
  result["avg"] = format_ms(total_time / trials / 1000.0);
  result["min"] = format_ms(times.front() / 1000.0);
  result["max"] = format_ms(times.back() / 1000.0);
  result["p50"] = format_ms(times[trials / 2] / 1000.0);
  result["p90"] = format_ms(times[trials * 9 / 10] / 1000.0);
  result["p99"] = format_ms(times[trials * 99 / 100] / 1000.0);
  return total_time / trials / 1000.0;
}

// The per-package strategy the index replaces: scan every package for each
// name asked about.
ReverseDeps scan_required_by(const PackageDatabase &database, std::string_view name) {
  ReverseDeps result;
  database.for_each_package(kSync, [&](const PackageRecord &pkg) {
    for (const auto &dep : pkg.depends_on)
      if (dep.name == name) result.insert(pkg.name);
  });
  return result;
}

struct Option {
  std::size_t packages;
  std::size_t fanout;
  std::size_t trials;
  std::string output_file;
};

int main(int argc, char *argv[]) {
  Option opt;
  CLI::App app;
  app.add_option("--packages", opt.packages)->default_val(20000)->check(CLI::PositiveNumber);
  app.add_option("--fanout", opt.fanout)->default_val(8)->check(CLI::PositiveNumber);
  app.add_option("--trials", opt.trials)->default_val(100)->check(CLI::PositiveNumber);
  app.add_option("--output", opt.output_file);
  CLI11_PARSE(app, argc, argv);

  MemoryDatabase database;
  auto dbid = database.add_database("core");
  std::mt19937 gen(42);
  for (std::size_t i = 0; i < opt.packages; ++i) {
    PackageRecord record;
    record.name = "pkg" + std::to_string(i);
    record.version = "1.0-1";
    if (i > 0) {
      std::uniform_int_distribution<std::size_t> dist(0, i - 1);
      for (std::size_t d = 0; d < opt.fanout; ++d) record.depends_on.push_back({.name = "pkg" + std::to_string(dist(gen))});
    }
    database.add_package(dbid, std::move(record));
  }
  println(std::cout, "Generated ", database.package_count(), " packages with up to ", opt.fanout, " dependencies each.");

  nlohmann::ordered_json result;
  result["title"] = "Reverse Dependencies Benchmark";
  result["packages"] = opt.packages;
  result["fanout"] = opt.fanout;
  result["trials"] = opt.trials;

  std::vector<std::size_t> index_times, scan_times;
  std::uniform_int_distribution<std::size_t> pick(0, opt.packages - 1);
  std::size_t mismatches = 0;
  for (std::size_t t = 0; t < opt.trials; ++t) {
    auto [index, index_time] = measure_time<std::chrono::microseconds>([&] {
      return build_reverse_deps_map(database, [](const PackageRecord &pkg) -> const std::vector<Dependency> & {
        return pkg.depends_on;
      });
    });
    index_times.push_back(index_time.count());

    auto name = "pkg" + std::to_string(pick(gen));
    auto [scanned, scan_time] = measure_time<std::chrono::microseconds>([&] { return scan_required_by(database, name); });
    scan_times.push_back(scan_time.count());
    mismatches += scanned != find_reverse_deps(index, name);
  }

  auto index_avg = analyze_times(result["full_index_build"], index_times);
  auto scan_avg = analyze_times(result["single_package_scan"], scan_times);
  result["mismatches"] = mismatches;
  result["break_even_packages"] = scan_avg > 0 ? index_avg / scan_avg : 0.0;
  println(std::cout, "Full index: ", format_ms(index_avg), ", single package scan: ", format_ms(scan_avg),
          ", full dump by scanning: ", format_ms(scan_avg * opt.packages), ".");
  if (mismatches) println(std::cerr, mismatches, " index lookups disagreed with the scan.");

  if (!opt.output_file.empty()) {
    std::ofstream{opt.output_file} << result.dump(2) << std::endl;
  } else {
    std::cout << result.dump(2) << std::endl;
  }
  return mismatches ? 1 : 0;
}
