// tests/test_search_renderer.cpp

#include "SearchRenderer.h"

#include <gtest/gtest.h>

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <string>
#include <vector>

using namespace pkgreport;

namespace
{
  SearchRecord makeRecord(const std::string& name, const std::string& version,
                          Origin origin = AurOrigin{})
  {
    SearchRecord rec;
    rec.name = name;
    rec.version = version;
    rec.origin = origin;
    return rec;
  }

  std::vector<std::string> collect(SearchLines lines)
  {
    std::vector<std::string> out;
    std::string line;
    while (lines.next(line))
      out.push_back(line);
    return out;
  }

  class SearchRendererTest : public testing::Test
  {
  protected:
    void SetUp() override
    {
      setenv("TZ", "UTC", 1);
      tzset();
    }

    GettextTranslator i18n;
    ReportConfig config;
    SearchResultRenderer plain{config, TextStyle::plain(), i18n};
    SearchOptions options;
  };
}

TEST_F(SearchRendererTest, Relevance)
{
  auto aur = makeRecord("a", "1");
  aur.numVotes = 10;
  aur.popularity = 2.0;
  EXPECT_DOUBLE_EQ(33.0, relevanceKey(aur));

  aur.popularity.reset();
  EXPECT_DOUBLE_EQ(1.0, relevanceKey(aur));

  auto repo = makeRecord("b", "1", RepoOrigin{"extra"});
  repo.numVotes = 100;
  repo.popularity = 5.0;
  EXPECT_DOUBLE_EQ(1.0, relevanceKey(repo));
}

TEST_F(SearchRendererTest, MaximumVotesRankFirst)
{
  auto few = makeRecord("few", "1");
  few.numVotes = 3;
  few.popularity = 1.0;
  auto most = makeRecord("most", "1");
  most.numVotes = INT_MAX;
  most.popularity = 1.0;

  EXPECT_GT(relevanceKey(most), relevanceKey(few));

  options.quiet = true;
  const std::vector<std::string> expected = {"most", "few"};
  EXPECT_EQ(expected, collect(plain.render({few, most}, {}, options)));
}

TEST_F(SearchRendererTest, NonFinitePopularityIsNeutral)
{
  auto rec = makeRecord("a", "1");
  rec.numVotes = 10;
  rec.popularity = std::numeric_limits<double>::quiet_NaN();
  EXPECT_DOUBLE_EQ(1.0, relevanceKey(rec));
  rec.popularity = std::numeric_limits<double>::infinity();
  EXPECT_DOUBLE_EQ(1.0, relevanceKey(rec));

  auto ranked = makeRecord("b", "1");
  ranked.numVotes = 1;
  ranked.popularity = 1.0;
  rec.popularity = std::numeric_limits<double>::quiet_NaN();

  options.quiet = true;
  const std::vector<std::string> expected = {"b", "a", "c"};
  EXPECT_EQ(expected, collect(plain.render({rec, ranked, makeRecord("c", "1")}, {}, options)));
}

TEST_F(SearchRendererTest, OrderedByRelevanceThenInput)
{
  auto a = makeRecord("a", "1");
  a.numVotes = 10;
  a.popularity = 2.0;
  const auto b = makeRecord("b", "1", RepoOrigin{"core"});
  auto c = makeRecord("c", "1");
  c.numVotes = 5;
  c.popularity = 1.0;
  const auto d = makeRecord("d", "1");

  options.quiet = true;
  const std::vector<std::string> expected = {"a", "c", "b", "d"};
  EXPECT_EQ(expected, collect(plain.render({b, a, d, c}, {}, options)));
}

TEST_F(SearchRendererTest, TwoLinesPerRecord)
{
  auto rec = makeRecord("foo", "1.0", RepoOrigin{"extra"});
  rec.description = "Does foo things";
  const auto lines = collect(plain.render({rec, makeRecord("bar", "2.0")}, {}, options));
  ASSERT_EQ(4u, lines.size());
  EXPECT_EQ("extra/foo 1.0 ", lines[0]);
  EXPECT_EQ("    Does foo things", lines[1]);
  EXPECT_EQ("aur/bar 2.0 ", lines[2]);
  EXPECT_EQ("", lines[3]);
}

TEST_F(SearchRendererTest, ExhaustedSequenceStaysExhausted)
{
  auto lines = plain.render({makeRecord("foo", "1.0")}, {}, options);
  std::string line;
  EXPECT_TRUE(lines.next(line));
  EXPECT_TRUE(lines.next(line));
  EXPECT_FALSE(lines.next(line));
  EXPECT_FALSE(lines.next(line));
}

TEST_F(SearchRendererTest, EmptyInput)
{
  EXPECT_TRUE(collect(plain.render({}, {}, options)).empty());
}

TEST_F(SearchRendererTest, GroupsAndRating)
{
  auto repo = makeRecord("foo", "1.0", RepoOrigin{"extra"});
  repo.groups = {"g"};
  auto aur = makeRecord("bar", "2.0");
  aur.numVotes = 10;
  aur.popularity = 2.5;

  options.quiet = false;
  const auto lines = collect(plain.render({repo, aur}, {}, options));
  ASSERT_EQ(4u, lines.size());
  EXPECT_EQ("aur/bar 2.0 (10, 2.50)", lines[0]);
  EXPECT_EQ("extra/foo 1.0 (g) ", lines[2]);
}

TEST_F(SearchRendererTest, GroupsAreSorted)
{
  auto rec = makeRecord("foo", "1.0", RepoOrigin{"extra"});
  rec.groups = {"zeta", "alpha"};
  const auto lines = collect(plain.render({rec}, {}, options));
  EXPECT_EQ("extra/foo 1.0 (alpha zeta) ", lines.at(0));
}

TEST_F(SearchRendererTest, InstalledMarkers)
{
  const auto lines = collect(plain.render(
    {makeRecord("foo", "1.3.0", RepoOrigin{"extra"}), makeRecord("bar", "2.0", RepoOrigin{"extra"})},
    {{"foo", "1.2.3"}, {"bar", "2.0"}}, options));
  ASSERT_EQ(4u, lines.size());
  EXPECT_EQ("extra/foo 1.3.0 [installed: 1.2.3] ", lines[0]);
  EXPECT_EQ("extra/bar 2.0 [installed] ", lines[2]);
}

TEST_F(SearchRendererTest, Enumeration)
{
  options.enumerated = true;
  auto lines = collect(plain.render({makeRecord("foo", "1"), makeRecord("bar", "1")}, {}, options));
  EXPECT_EQ(0u, lines.at(0).find("1) aur/foo"));
  EXPECT_EQ(0u, lines.at(2).find("2) aur/bar"));

  options.enumerateFrom = 5;
  lines = collect(plain.render({makeRecord("foo", "1")}, {}, options));
  EXPECT_EQ(0u, lines.at(0).find("5) aur/foo"));
}

TEST_F(SearchRendererTest, OutOfDate)
{
  EXPECT_EQ("2023/11/15", formatOutOfDate(1700049600));
  // beyond any representable calendar year
  EXPECT_EQ("9223372036854775807", formatOutOfDate(INT64_MAX));

  auto rec = makeRecord("foo", "1.0");
  rec.outOfDateTimestamp = 1700049600;
  const auto lines = collect(plain.render({rec}, {}, options));
  EXPECT_EQ("aur/foo 1.0 [outofdate: 2023/11/15] ", lines.at(0));
}

TEST_F(SearchRendererTest, OutOfDateUsesDiffOldColor)
{
  const SearchResultRenderer ansi(config, TextStyle::ansi(), i18n);
  auto rec = makeRecord("foo", "1.0", RepoOrigin{"extra"});
  rec.outOfDateTimestamp = 1700049600;
  const auto lines = collect(ansi.render({rec}, {}, options));
  // diffOld defaults to 11
  EXPECT_NE(std::string::npos, lines.at(0).find("\033[1;33m1.0 [outofdate: 2023/11/15]\033[0m"));
}

TEST_F(SearchRendererTest, QuietPrintsNamesOnly)
{
  options.quiet = true;
  auto rec = makeRecord("foo", "1.0");
  rec.description = "ignored";
  const std::vector<std::string> expected = {"foo"};
  EXPECT_EQ(expected, collect(plain.render({rec}, {{"foo", "1.0"}}, options)));
}
