// tests/test_line_template.cpp

#include "LineTemplate.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace pkgreport;

TEST(LineTemplateTest, SubstitutesPlaceholders)
{
  const auto tmpl = LineTemplate::parse("{pkgName} ({currentVersion} => {newVersion})");
  EXPECT_EQ("foo (1.0 => 1.1)",
            tmpl.render({{"pkgName", "foo"}, {"currentVersion", "1.0"}, {"newVersion", "1.1"}}));
}

TEST(LineTemplateTest, MissingValuesRenderEmpty)
{
  const auto tmpl = LineTemplate::parse("[{repository}] {pkgName}");
  EXPECT_EQ("[] foo", tmpl.render({{"pkgName", "foo"}}));
}

TEST(LineTemplateTest, LiteralOnly)
{
  const auto tmpl = LineTemplate::parse("nothing to see");
  EXPECT_EQ("nothing to see", tmpl.render({}));
  EXPECT_EQ("nothing to see", tmpl.format());
}

TEST(LineTemplateTest, RejectsUnknownPlaceholder)
{
  EXPECT_THROW(LineTemplate::parse("{pkg_name}"), std::invalid_argument);
  EXPECT_THROW(LineTemplate::parse("{}"), std::invalid_argument);
}

TEST(LineTemplateTest, RejectsUnterminatedPlaceholder)
{
  EXPECT_THROW(LineTemplate::parse("{pkgName"), std::invalid_argument);
}

TEST(LineTemplateTest, KnownPlaceholders)
{
  for (const char* name : {"pkgName", "currentVersion", "newVersion",
                           "versionSeparator", "daysOld", "repository"})
    EXPECT_TRUE(LineTemplate::isKnownPlaceholder(name)) << name;
  EXPECT_FALSE(LineTemplate::isKnownPlaceholder("description"));
}
