#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>
#include "alpm_database.hpp"
#include "config.hpp"
#include "error.hpp"
#include "memory_database.hpp"
#include "package_loader.hpp"
#include "pacman_conf.hpp"
#include "query_driver.hpp"
#include "siglevel.hpp"
#include "util.hpp"

namespace {

struct Option {
  QueryOptions query;
  ConfigOverrides config;
  std::vector<std::string> loads;
  bool pretty = false;
};

std::string join(const std::vector<std::string_view> &items, std::string_view sep) {
  std::string result;
  for (auto item : items) {
    if (!result.empty()) result.append(sep);
    result.append(item);
  }
  return result;
}

std::unique_ptr<AlpmDatabase> open_alpm_database(const Option &opt) {
  auto conf = load_pacman_config(opt.config);
  if (opt.query.verbose) {
    eprintln("RootDir: ", conf.root_dir);
    eprintln("DBPath: ", conf.db_path);
    eprintln("SigLevel: ", join(siglevel_names(conf.default_siglevel), " | "));
  }
  auto database = std::make_unique<AlpmDatabase>(conf.root_dir, conf.db_path);
  for (const auto &repo : conf.repositories) {
    database->register_syncdb(repo.name, repo.siglevel);
    if (opt.query.verbose) eprintln(repo.name, ": SigLevel: ", join(siglevel_names(repo.siglevel), " | "));
  }
  return database;
}

std::unique_ptr<MemoryDatabase> load_memory_database(const Option &opt) {
  auto database = std::make_unique<MemoryDatabase>();
  PackageLoader loader{*database};
  for (const auto &load : opt.loads) {
    auto eq = load.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == load.size())
      throw QueryError(kDatabaseRegistrationFailure, "expected NAME=PATH for --load, got '" + load + "'");
    if (!loader.load(std::string_view(load).substr(0, eq), load.substr(eq + 1), opt.query.verbose))
      throw QueryError(kDatabaseRegistrationFailure, "failed to load '" + load + "'");
  }
  return database;
}

} // namespace

int main(int argc, char *argv[]) {
  Option opt;
  CLI::App app{"Dump pacman packages information in JSON"};
  app.add_flag("--sync", opt.query.sync,
    "Query the sync databases; by default only the local database of installed packages is queried");
  app.add_flag("--all", opt.query.all,
    "Query all packages, including those not explicitly installed");
  app.add_flag("--plain", opt.query.plain,
    "Output package info from the queried database only, without combining local and sync information");
  auto *recurse_opt = app.add_option("--recurse", opt.query.recurse,
    "Recursively query the dependencies of the given package; implies --all");
  app.add_flag("--optional", opt.query.optional, "--recurse installed optional dependencies as well")
     ->needs(recurse_opt);
  app.add_flag("--summary", opt.query.summary, "--recurse dependencies, but only print package names and versions")
     ->needs(recurse_opt);
  app.add_option("--config", opt.config.config_file, "pacman configuration file passed to pacman-conf");
  app.add_option("--root", opt.config.root_dir, "Installation root; overrides RootDir");
  app.add_option("--dbpath", opt.config.db_path, "Database directory; overrides DBPath");
  app.add_option("--repo", opt.config.repositories, "Sync database to register; overrides the repository list");
  app.add_option("--load", opt.loads, "Read NAME=PATH pacman desc data instead of opening libalpm");
  app.add_flag("-v,--verbose", opt.query.verbose, "Report progress and configuration on stderr");
  app.add_flag("--pretty", opt.pretty, "Indent the JSON output");
  CLI11_PARSE(app, argc, argv);

  try {
    std::unique_ptr<PackageDatabase> database;
    const SignatureDecoder *decoder = nullptr;
    if (opt.loads.empty()) {
      auto alpm_database = open_alpm_database(opt);
      decoder = alpm_database.get();
      database = std::move(alpm_database);
    } else {
      database = load_memory_database(opt);
    }

    QueryDriver driver{*database, decoder, opt.query};
    auto result = driver.run();
    std::cout << dump_json(result, opt.pretty ? kJsonIndent : -1) << std::endl;
  } catch (const QueryError &e) {
    eprintln(to_string(e.kind()), ": ", e.what());
    return 1;
  } catch (const std::exception &e) {
    eprintln("error: ", e.what());
    return 1;
  }
  return 0;
}
