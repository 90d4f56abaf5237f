#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <alpm.h>
#include <gtest/gtest.h>
#include "error.hpp"
#include "pacman_conf.hpp"

TEST(PacmanConfTest, DisablesUserLocales) {
  EXPECT_EQ(conf_command({"RootDir"}), "LC_ALL=C.UTF-8 LANGUAGE=C.UTF-8 pacman-conf 'RootDir'");
}

TEST(PacmanConfTest, QuotesArguments) {
  EXPECT_EQ(conf_command({"--config=/tmp/my pacman.conf", "--repo=it's", "SigLevel"}),
            "LC_ALL=C.UTF-8 LANGUAGE=C.UTF-8 pacman-conf '--config=/tmp/my pacman.conf' '--repo=it'\\''s' 'SigLevel'");
  EXPECT_EQ(conf_command({}), "LC_ALL=C.UTF-8 LANGUAGE=C.UTF-8 pacman-conf");
}

TEST(PacmanConfTest, StripsOneTrailingNewline) {
  EXPECT_EQ(strip_trailing_newline("/var/lib/pacman/\n"), "/var/lib/pacman/");
  EXPECT_EQ(strip_trailing_newline("core\nextra\n\n"), "core\nextra\n");
  EXPECT_EQ(strip_trailing_newline("/"), "/");
  EXPECT_EQ(strip_trailing_newline(""), "");
}

namespace {

// Answers pacman-conf queries from a table and records every query.
struct FakePacmanConf {
  std::map<std::vector<std::string>, std::string> answers;
  std::vector<std::vector<std::string>> queries;

  ConfReader reader() {
    return [this](const std::vector<std::string> &args) -> std::optional<std::string> {
      queries.push_back(args);
      auto it = answers.find(args);
      if (it == answers.end()) return std::nullopt;
      return it->second;
    };
  }

  bool asked(const std::string &key) const {
    return std::ranges::any_of(queries, [&](const auto &args) { return !args.empty() && args.back() == key; });
  }
};

} // namespace

TEST(PacmanConfTest, OverridesSkipPacmanConfQueries) {
  FakePacmanConf conf;
  conf.answers[{"SigLevel"}] = "PackageRequired\nDatabaseOptional";
  conf.answers[{"--repo=core", "SigLevel"}] = "PackageTrustAll";
  auto config = load_pacman_config({
    .root_dir = "/mnt",
    .db_path = "/mnt/var/lib/pacman/",
    .repositories = {"core"}
  }, conf.reader());

  EXPECT_EQ(config.root_dir, "/mnt");
  EXPECT_EQ(config.db_path, "/mnt/var/lib/pacman/");
  EXPECT_FALSE(conf.asked("RootDir"));
  EXPECT_FALSE(conf.asked("DBPath"));
  EXPECT_FALSE(conf.asked("--repo-list"));
  EXPECT_EQ(config.default_siglevel, ALPM_SIG_PACKAGE | ALPM_SIG_DATABASE | ALPM_SIG_DATABASE_OPTIONAL);
  ASSERT_EQ(config.repositories.size(), 1u);
  EXPECT_EQ(config.repositories[0].name, "core");
  EXPECT_EQ(config.repositories[0].siglevel,
            config.default_siglevel | ALPM_SIG_PACKAGE_MARGINAL_OK | ALPM_SIG_PACKAGE_UNKNOWN_OK);
}

TEST(PacmanConfTest, ReadsEverythingFromPacmanConf) {
  FakePacmanConf conf;
  conf.answers[{"--config=/etc/alt.conf", "RootDir"}] = "/";
  conf.answers[{"--config=/etc/alt.conf", "DBPath"}] = "/var/lib/pacman/";
  conf.answers[{"--config=/etc/alt.conf", "--repo-list"}] = "core\nextra";
  auto config = load_pacman_config({.config_file = "/etc/alt.conf"}, conf.reader());

  EXPECT_EQ(config.root_dir, "/");
  EXPECT_EQ(config.db_path, "/var/lib/pacman/");
  EXPECT_EQ(config.default_siglevel, ALPM_SIG_USE_DEFAULT);
  ASSERT_EQ(config.repositories.size(), 2u);
  EXPECT_EQ(config.repositories[1].name, "extra");
  EXPECT_TRUE(std::ranges::all_of(conf.queries, [](const auto &args) { return args.front() == "--config=/etc/alt.conf"; }));
}

TEST(PacmanConfTest, FailsWithoutRootDir) {
  FakePacmanConf conf;
  conf.answers[{"DBPath"}] = "/var/lib/pacman/";
  try {
    load_pacman_config({}, conf.reader());
    FAIL() << "expected a QueryError";
  } catch (const QueryError &e) {
    EXPECT_EQ(e.kind(), kDatabaseRegistrationFailure);
  }
}
