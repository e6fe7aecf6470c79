// tests/test_sysupgrade_report.cpp

#include "SysupgradeReport.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace pkgreport;

namespace
{
  InstallInfo makeInfo(const std::string& name, Origin origin = AurOrigin{})
  {
    InstallInfo info;
    info.name = name;
    info.currentVersion = "1.0";
    info.newVersion = "1.1";
    info.origin = origin;
    return info;
  }

  // One record per category, fed in reverse order
  std::vector<Category> oneOfEach()
  {
    std::vector<Category> categories;
    for (auto it = kCategoryOrder.rbegin(); it != kCategoryOrder.rend(); ++it)
    {
      auto info = makeInfo("pkg" + std::to_string(static_cast<int>(*it)), RepoOrigin{"core"});
      categories.push_back({*it, {info}});
    }
    return categories;
  }

  struct SysupgradeReportTest : public testing::Test
  {
    GettextTranslator i18n;
    ReportConfig config;
  };
}

TEST_F(SysupgradeReportTest, CategoryOrder)
{
  const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
  const std::string report = builder.build(oneOfEach(), false, false, 80);

  size_t last = 0;
  for (const auto tag : kCategoryOrder)
  {
    const auto header = std::string(":: ") + categoryTraits(tag).singular;
    const auto pos = report.find(header);
    ASSERT_NE(std::string::npos, pos) << header;
    EXPECT_GE(pos, last) << header;
    last = pos;
  }
}

TEST_F(SysupgradeReportTest, HeaderAndLines)
{
  const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
  const std::vector<Category> categories = {
    {CategoryTag::RepoUpdate, {makeInfo("foo", RepoOrigin{"core"})}},
  };
  const std::string report = builder.build(categories, false, false, 80);
  EXPECT_EQ(0u, report.find("\n:: Repository package will be installed:\n foo "));
  EXPECT_EQ('\n', report.back());
}

TEST_F(SysupgradeReportTest, PluralHeader)
{
  const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
  const std::vector<Category> categories = {
    {CategoryTag::AurUpdate, {makeInfo("foo"), makeInfo("bar")}},
  };
  const std::string report = builder.build(categories, false, false, 80);
  EXPECT_NE(std::string::npos, report.find(":: AUR packages will be installed:"));
}

TEST_F(SysupgradeReportTest, EmptyCategoriesAreSkipped)
{
  const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
  const std::vector<Category> categories = {
    {CategoryTag::RepoUpdate, {}},
    {CategoryTag::AurUpdate, {makeInfo("foo")}},
  };
  const std::string report = builder.build(categories, false, false, 80);
  EXPECT_EQ(std::string::npos, report.find("Repository package"));
  EXPECT_NE(std::string::npos, report.find("AUR package will be installed:"));

  EXPECT_EQ("", builder.build({}, false, false, 80));
}

TEST_F(SysupgradeReportTest, ManualSelectionMode)
{
  const SysupgradeReportBuilder builder(config, TextStyle::ansi(), i18n);
  const std::string report = builder.build(oneOfEach(), true, false, 80);

  EXPECT_EQ(std::string::npos, report.find('\033'));
  for (const auto tag : kCategoryOrder)
  {
    const auto traits = categoryTraits(tag);
    const bool present = report.find(traits.singular) != std::string::npos;
    EXPECT_EQ(!traits.newDependency, present) << traits.singular;
  }
}

TEST_F(SysupgradeReportTest, ColorWithoutManualMode)
{
  const SysupgradeReportBuilder builder(config, TextStyle::ansi(), i18n);
  const std::string report = builder.build(oneOfEach(), false, false, 80);
  EXPECT_NE(std::string::npos, report.find("\033[1;34m::\033[0m"));
}

TEST_F(SysupgradeReportTest, ManualModeCommentsReplacements)
{
  const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
  auto info = makeInfo("new-thing", RepoOrigin{"extra"});
  info.replaces = {"old-thing"};
  const std::vector<Category> categories = {
    {CategoryTag::RepoReplacement, {info}},
  };
  EXPECT_NE(std::string::npos,
            builder.build(categories, true, false, 80).find("\n # new-thing (replaces old-thing)"));
  EXPECT_EQ(std::string::npos,
            builder.build(categories, false, false, 80).find("# new-thing"));
}

TEST_F(SysupgradeReportTest, OriginVisibility)
{
  const std::vector<Category> categories = {
    {CategoryTag::RepoUpdate, {makeInfo("foo", RepoOrigin{"core"})}},
    {CategoryTag::ThirdpartyUpdate, {makeInfo("bar", RepoOrigin{"chaotic-aur"})}},
    {CategoryTag::AurUpdate, {makeInfo("baz")}},
  };

  {
    const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
    const std::string report = builder.build(categories, false, false, 80);
    EXPECT_EQ(std::string::npos, report.find("core/foo"));
    EXPECT_NE(std::string::npos, report.find("chaotic-aur/bar"));
    EXPECT_EQ(std::string::npos, report.find("aur/baz"));
  }

  config.alwaysShowPkgOrigin = true;
  {
    const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
    const std::string report = builder.build(categories, false, false, 80);
    EXPECT_NE(std::string::npos, report.find("core/foo"));
    EXPECT_EQ(std::string::npos, report.find("aur/baz"));
  }
}

TEST_F(SysupgradeReportTest, SortModeFromConfig)
{
  config.sortMode = SortMode::Name;
  const SysupgradeReportBuilder builder(config, TextStyle::plain(), i18n);
  InstallInfo major = makeInfo("zlib");
  major.currentVersion = "1.0";
  major.newVersion = "2.0";
  const std::vector<Category> categories = {
    {CategoryTag::AurUpdate, {major, makeInfo("acl")}},
  };
  const std::string report = builder.build(categories, false, false, 80);
  EXPECT_LT(report.find(" acl "), report.find(" zlib "));

  config.sortMode = SortMode::DiffWeight;
  const std::string byDiff = builder.build(categories, false, false, 80);
  EXPECT_LT(byDiff.find(" zlib "), byDiff.find(" acl "));
}
