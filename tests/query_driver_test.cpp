#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "error.hpp"
#include "query_driver.hpp"
#include "test_universe.hpp"

namespace {

constexpr const char *kPackager = "Arch Builder <builder@example.org>";

class StubDecoder : public SignatureDecoder {
public:
  SignatureBytes decode_signature(std::string_view base64_sig) const override {
    return SignatureBytes(base64_sig.begin(), base64_sig.end());
  }
  std::vector<std::string> extract_key_ids(std::string_view, const SignatureBytes &) const override {
    return {"D6C055F927843F1C"};
  }
};

} // namespace

class QueryDriverTest : public ::testing::Test {
protected:
  MemoryDatabase database = make_database({
    {"local",
      desc("vim", "9.1-1", {{"PACKAGER", {kPackager}}, {"DEPENDS", {"glibc"}}, {"INSTALLDATE", {"100"}}})
      + desc("glibc", "2.39-1", {{"PACKAGER", {kPackager}}, {"REASON", {"1"}}, {"INSTALLDATE", {"50"}}})
      + desc("bash", "5.2-1", {{"PACKAGER", {kPackager}}, {"DEPENDS", {"glibc"}}})},
    {"core",
      desc("glibc", "2.39-1", {{"PACKAGER", {kPackager}}, {"PGPSIG", {"iQEz"}}})
      + desc("bash", "5.2-2", {{"PACKAGER", {kPackager}}, {"DEPENDS", {"glibc"}}})},
    {"extra",
      desc("vim", "9.1-2", {{"PACKAGER", {kPackager}}, {"DEPENDS", {"glibc", "python"}}})
      + desc("python", "3.12-1", {{"PACKAGER", {kPackager}}, {"DEPENDS", {"glibc"}}})},
  });
};

TEST_F(QueryDriverTest, ListsExplicitLocalPackages) {
  QueryDriver driver{database, nullptr, {}};
  auto records = driver.query_packages();
  EXPECT_EQ(names_of(records), (std::vector<std::string>{"vim", "bash"}));
  EXPECT_EQ(records[0].repository, "local");
  ASSERT_TRUE(records[0].companion);
  EXPECT_EQ(records[0].companion->version, "9.1-2");
}

TEST_F(QueryDriverTest, SkipsDependenciesUnlessAll) {
  QueryDriver driver{database, nullptr, {}};
  try {
    driver.generate_pkg_info(*database.get_package("glibc", kLocal));
    FAIL() << "expected a QueryError";
  } catch (const QueryError &e) {
    EXPECT_EQ(e.kind(), kNotExplicit);
  }

  auto records = QueryDriver{database, nullptr, {.all = true}}.query_packages();
  EXPECT_EQ(names_of(records), (std::vector<std::string>{"vim", "glibc", "bash"}));
}

TEST_F(QueryDriverTest, PrefersSyncRecordOfMatchingBuilds) {
  QueryDriver driver{database, nullptr, {.all = true}};
  auto glibc = driver.generate_pkg_info(*database.get_package("glibc", kLocal));
  EXPECT_EQ(glibc.repository, "core");
  EXPECT_EQ(glibc.install_date, 50);
  EXPECT_EQ(glibc.install_reason, kDepend);
  ASSERT_TRUE(glibc.companion);
  EXPECT_TRUE(glibc.companion->is_local());
}

TEST_F(QueryDriverTest, PlainSkipsReconciliation) {
  auto records = QueryDriver{database, nullptr, {.plain = true}}.query_packages();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_FALSE(records[0].companion);
  EXPECT_EQ(records[0].repository, "local");
}

TEST_F(QueryDriverTest, AttachesReverseDependencies) {
  QueryDriver driver{database, nullptr, {.all = true}};
  auto glibc = driver.generate_pkg_info(*database.get_package("glibc", kLocal));
  EXPECT_EQ(glibc.required_by, (std::vector<std::string>{"bash", "python", "vim"}));
  auto vim = driver.generate_pkg_info(*database.get_package("vim", kLocal));
  EXPECT_TRUE(vim.required_by.empty());
}

TEST_F(QueryDriverTest, QueriesSyncDatabases) {
  auto records = QueryDriver{database, nullptr, {.sync = true}}.query_packages();
  EXPECT_EQ(names_of(records), (std::vector<std::string>{"glibc", "bash", "vim", "python"}));
  EXPECT_EQ(records[0].repository, "core");
  EXPECT_TRUE(records[0].companion);
  EXPECT_FALSE(records[3].companion);
}

TEST_F(QueryDriverTest, DecodesKeyIds) {
  StubDecoder decoder;
  auto records = QueryDriver{database, &decoder, {.sync = true}}.query_packages();
  EXPECT_EQ(records[0].key_ids, std::vector<std::string>{"D6C055F927843F1C"});
  EXPECT_FALSE(records[1].key_ids);
}

TEST_F(QueryDriverTest, ResolvesReconciledClosure) {
  QueryDriver driver{database, nullptr, {.recurse = "vim"}};
  EXPECT_TRUE(driver.options().all);
  auto closure = driver.query_closure("vim");
  ASSERT_EQ(closure.records.size(), 2u);
  EXPECT_EQ(closure.records[0].name, "glibc");
  EXPECT_EQ(closure.records[0].repository, "core");
  EXPECT_EQ(closure.records[1].name, "vim");
  EXPECT_EQ(closure.records[1].depends_on[0].satisfier, "glibc=2.39-1");
  EXPECT_EQ(closure.ordered_keys(), (std::vector<std::string>{"glibc=2.39-1", "vim=9.1-1"}));
}

TEST_F(QueryDriverTest, ResolvesSyncClosure) {
  auto plain = QueryDriver{database, nullptr, {.sync = true, .plain = true, .recurse = "vim"}}.query_closure("vim");
  EXPECT_EQ(plain.visited_order, (std::vector<std::string>{"vim=9.1-2", "glibc=2.39-1", "python=3.12-1"}));

  // The installed vim differs from the sync one, so its own dependencies are followed.
  auto reconciled = QueryDriver{database, nullptr, {.sync = true, .recurse = "vim"}}.query_closure("vim");
  EXPECT_EQ(reconciled.visited_order, (std::vector<std::string>{"vim=9.1-2", "glibc=2.39-1"}));
  EXPECT_EQ(reconciled.records.back().repository, "local");
}

TEST_F(QueryDriverTest, RunEmitsJson) {
  auto listing = QueryDriver{database, nullptr, {}}.run();
  ASSERT_TRUE(listing.is_array());
  EXPECT_EQ(listing.size(), 2u);
  EXPECT_EQ(listing[0]["name"], "vim");
  EXPECT_TRUE(listing[0].contains("sync_info"));

  auto summary = QueryDriver{database, nullptr, {.recurse = "vim", .summary = true}}.run();
  EXPECT_EQ(summary, json({"glibc=2.39-1", "vim=9.1-1"}));

  auto detailed = QueryDriver{database, nullptr, {.recurse = "vim"}}.run();
  ASSERT_EQ(detailed.size(), 2u);
  EXPECT_EQ(detailed[0]["name"], "glibc");
  EXPECT_EQ(detailed[0]["repository"], "core");
}

TEST_F(QueryDriverTest, MissingRootYieldsEmptyResult) {
  QueryDriver driver{database, nullptr, {.recurse = "emacs"}};
  json result;
  ASSERT_NO_THROW(result = driver.run());
  EXPECT_EQ(result, json::array());

  auto summary = QueryDriver{database, nullptr, {.recurse = "python", .summary = true}}.run();
  EXPECT_EQ(summary, json::array());
}

TEST_F(QueryDriverTest, ClosureOfMissingRootIsNotFound) {
  QueryDriver driver{database, nullptr, {.recurse = "python"}};
  try {
    driver.query_closure("python");
    FAIL() << "expected a QueryError";
  } catch (const QueryError &e) {
    EXPECT_EQ(e.kind(), kNotFound);
  }
}

TEST_F(QueryDriverTest, OutputSurvivesInvalidUtf8) {
  auto latin1 = make_database({
    {"local", desc("good", "1-1", {{"DESC", {"plain ascii"}}}) + desc("bad", "1-1", {{"DESC", {"caf\xe9"}}})},
  });
  auto result = QueryDriver{latin1, nullptr, {}}.run();
  ASSERT_EQ(result.size(), 2u);
  std::string output;
  ASSERT_NO_THROW(output = dump_json(result));
  auto parsed = json::parse(output);
  EXPECT_EQ(parsed[0]["description"], "plain ascii");
  EXPECT_EQ(parsed[1]["description"], "caf\xef\xbf\xbd");
}
