#include <gtest/gtest.h>
#include "dependency.hpp"

TEST(DependencyTest, ParsesBareName) {
  auto dep = parse_dependency("  glibc ");
  EXPECT_EQ(dep.name, "glibc");
  EXPECT_EQ(dep.mod, kModAny);
  EXPECT_TRUE(dep.version.empty());
  EXPECT_TRUE(dep.description.empty());
  EXPECT_FALSE(dep.satisfier);
  EXPECT_EQ(dep.dep_string(), "glibc");
}

TEST(DependencyTest, ParsesOperators) {
  struct Case {
    std::string_view raw;
    DepMod mod;
    std::string_view version;
  };
  for (auto [raw, mod, version] : {
         Case{"python>=3.11", kModGe, "3.11"}, Case{"python<=3.11", kModLe, "3.11"},
         Case{"python=3.11-1", kModEq, "3.11-1"}, Case{"python>3", kModGt, "3"}, Case{"python<4", kModLt, "4"}}) {
    auto dep = parse_dependency(raw);
    EXPECT_EQ(dep.name, "python") << raw;
    EXPECT_EQ(dep.mod, mod) << raw;
    EXPECT_EQ(dep.version, version) << raw;
    EXPECT_EQ(dep.dep_string(), raw);
  }
}

TEST(DependencyTest, ParsesOptionalDescription) {
  auto dep = parse_dependency("python-pygments: syntax highlighting");
  EXPECT_EQ(dep.name, "python-pygments");
  EXPECT_EQ(dep.mod, kModAny);
  EXPECT_EQ(dep.description, "syntax highlighting");
  EXPECT_EQ(dep.dep_string(), "python-pygments");

  auto versioned = parse_dependency("qt6-base>=6.5: gui support");
  EXPECT_EQ(versioned.name, "qt6-base");
  EXPECT_EQ(versioned.version, "6.5");
  EXPECT_EQ(versioned.description, "gui support");
}

TEST(DependencyTest, SkipsBlankEntries) {
  auto deps = parse_dependencies({"a", "  ", "b>=1"});
  ASSERT_EQ(deps.size(), 2u);
  EXPECT_EQ(deps[0].name, "a");
  EXPECT_EQ(deps[1].name, "b");
}

TEST(DependencyTest, ComparesPacmanVersions) {
  EXPECT_LT(compare_versions("1.0-1", "1.0-2"), 0);
  EXPECT_GT(compare_versions("1:0.9-1", "2.0-1"), 0);
  EXPECT_EQ(compare_versions("2.0-1", "2.0-1"), 0);
  EXPECT_LT(compare_versions("1.9", "1.10"), 0);
}

TEST(DependencyTest, SatisfiedByNameAndVersion) {
  auto dep = parse_dependency("openssl>=3.0");
  EXPECT_TRUE(dep.satisfied_by("openssl", "3.1.4-1", {}));
  EXPECT_FALSE(dep.satisfied_by("openssl", "1.1.1w-1", {}));
  EXPECT_FALSE(dep.satisfied_by("libressl", "3.8.0-1", {}));
}

TEST(DependencyTest, SatisfiedByProvision) {
  auto unversioned = parse_dependency("sh");
  auto versioned = parse_dependency("sh>=5");
  std::vector<Dependency> bare{parse_dependency("sh")};
  std::vector<Dependency> exact{parse_dependency("sh=5.2")};

  EXPECT_TRUE(unversioned.satisfied_by("bash", "5.2.026-2", bare));
  EXPECT_FALSE(versioned.satisfied_by("bash", "5.2.026-2", bare));
  EXPECT_TRUE(versioned.satisfied_by("bash", "5.2.026-2", exact));
  EXPECT_FALSE(parse_dependency("sh<5").satisfied_by("bash", "5.2.026-2", exact));
}
