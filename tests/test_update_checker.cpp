/**
 * @file test_update_checker.cpp
 * @brief Tests for version parsing, release-feed parsing and notification dedup.
 */
#include <gtest/gtest.h>

#include "fakes.hpp"
#include "state_store.hpp"
#include "update_checker.hpp"

using namespace wanwatch;
using wanwatch::fakes::FakeHttpClient;
using wanwatch::fakes::ScratchDir;

namespace {
const std::string kFeed = "https://feed.test/releases/latest";

std::string release(const std::string& tag) {
  return R"({"tag_name":")" + tag +
         R"(","html_url":"https://github.com/noxied/wanwatcher/releases/tag/)" + tag +
         R"(","body":"## Changes\n- Faster lookups\n- Fewer retries"})";
}
} // namespace

// ---------- parse_version ----------

TEST(ParseVersion, FullAndPartial) {
  EXPECT_EQ(parse_version("1.4.0"), (SemVer{1, 4, 0}));
  EXPECT_EQ(parse_version("v2.10.3"), (SemVer{2, 10, 3}));
  EXPECT_EQ(parse_version("2"), (SemVer{2, 0, 0}));
  EXPECT_EQ(parse_version("2.1"), (SemVer{2, 1, 0}));
  EXPECT_EQ(parse_version("1.2.3-rc1"), (SemVer{1, 2, 3}));
}

TEST(ParseVersion, GarbageIsZero) {
  EXPECT_EQ(parse_version("latest"), (SemVer{0, 0, 0}));
  EXPECT_EQ(parse_version(""), (SemVer{0, 0, 0}));
}

TEST(ParseVersion, TupleOrdering) {
  EXPECT_TRUE(parse_version("1.10.0") > parse_version("1.9.9"));
  EXPECT_TRUE(parse_version("2.0") > parse_version("1.99.99"));
  EXPECT_FALSE(parse_version("1.4.1") > parse_version("1.4.1"));
}

// ---------- parse_release ----------

TEST(ParseRelease, ExtractsFields) {
  auto info = UpdateChecker::parse_release(release("v1.5.0"), "1.4.1");
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->latest_version, "1.5.0");
  EXPECT_EQ(info->current_version, "1.4.1");
  EXPECT_EQ(info->release_url, "https://github.com/noxied/wanwatcher/releases/tag/v1.5.0");
  EXPECT_NE(info->release_body.find("Faster lookups"), std::string::npos);
}

TEST(ParseRelease, MissingTagIsRejected) {
  EXPECT_FALSE(UpdateChecker::parse_release(R"({"name":"x"})", "1.0.0").has_value());
  EXPECT_FALSE(UpdateChecker::parse_release("not json", "1.0.0").has_value());
}

// ---------- check ----------

TEST(UpdateChecker, NewerReleaseIsReportedUntilMarked) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  FakeHttpClient http;
  http.respond(kFeed, 200, release("v1.4.1"));
  UpdateChecker checker(http, store, "1.4.0", kFeed);

  auto info = checker.check();
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->latest_version, "1.4.1");

  // check() never writes the mark itself
  EXPECT_FALSE(store.load_update_mark().has_value());
  EXPECT_TRUE(checker.check().has_value());

  store.save_update_mark("1.4.1");
  EXPECT_FALSE(checker.check().has_value());
}

TEST(UpdateChecker, SameOrOlderIsNotReported) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  FakeHttpClient http;
  http.respond(kFeed, 200, release("v1.4.0"));
  EXPECT_FALSE(UpdateChecker(http, store, "1.4.0", kFeed).check().has_value());
  EXPECT_FALSE(UpdateChecker(http, store, "1.5.0", kFeed).check().has_value());
}

TEST(UpdateChecker, FeedFailuresAreSilent) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  FakeHttpClient http;
  http.fail(kFeed);
  EXPECT_FALSE(UpdateChecker(http, store, "1.0.0", kFeed).check().has_value());

  FakeHttpClient http404;
  http404.respond(kFeed, 404, R"({"message":"Not Found"})");
  EXPECT_FALSE(UpdateChecker(http404, store, "1.0.0", kFeed).check().has_value());

  FakeHttpClient garbage;
  garbage.respond(kFeed, 200, "<html>rate limited</html>");
  EXPECT_FALSE(UpdateChecker(garbage, store, "1.0.0", kFeed).check().has_value());
}

TEST(UpdateChecker, SendsGithubHeaders) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  FakeHttpClient http;
  http.respond(kFeed, 200, release("v1.0.0"));
  UpdateChecker(http, store, "1.0.0", kFeed).check();

  ASSERT_EQ(http.requests.size(), 1u);
  bool accept = false, agent = false;
  for (const auto& h : http.requests[0].headers) {
    if (h.first == "Accept" && h.second == "application/vnd.github+json") accept = true;
    if (h.first == "User-Agent") agent = true;
  }
  EXPECT_TRUE(accept);
  EXPECT_TRUE(agent);
}
