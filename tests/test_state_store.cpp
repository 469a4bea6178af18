/**
 * @file test_state_store.cpp
 * @brief Tests for state persistence, legacy migration and the update mark.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "state_store.hpp"

using namespace wanwatch;
using wanwatch::fakes::ScratchDir;

namespace {
void write(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string slurp(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
} // namespace

// ---------- load ----------

TEST(StateStore, MissingFileIsFirstRun) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  EXPECT_TRUE(store.load().empty());
}

TEST(StateStore, SaveThenLoadRoundTrip) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  AddressPair p;
  p.ipv4 = "198.51.100.7";
  p.ipv6 = "2606:4700::1";
  store.save(p);
  EXPECT_EQ(store.load(), p);
  EXPECT_TRUE(store.last_updated().has_value());
}

TEST(StateStore, NullFieldsAreWrittenExplicitly) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  AddressPair p;
  p.ipv4 = "198.51.100.7";
  store.save(p);

  auto j = nlohmann::json::parse(slurp(dir.file("ipinfo.db")));
  ASSERT_TRUE(j.contains("ipv6"));
  EXPECT_TRUE(j["ipv6"].is_null());
  EXPECT_EQ(j["ipv4"], "198.51.100.7");
  EXPECT_TRUE(j["last_updated"].is_string());
  EXPECT_EQ(store.load(), p);
}

TEST(StateStore, LegacyBareIpv4IsMigrated) {
  ScratchDir dir;
  write(dir.file("ipinfo.db"), "203.0.113.5\n");
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));

  AddressPair loaded = store.load();
  ASSERT_TRUE(loaded.ipv4.has_value());
  EXPECT_EQ(*loaded.ipv4, "203.0.113.5");
  EXPECT_FALSE(loaded.ipv6.has_value());

  // The next save rewrites the file in the structured format.
  store.save(loaded);
  auto j = nlohmann::json::parse(slurp(dir.file("ipinfo.db")));
  EXPECT_TRUE(j.is_object());
  EXPECT_EQ(j["ipv4"], "203.0.113.5");
}

TEST(StateStore, LegacyQuotedValueAccepted) {
  auto p = StateStore::parse_state("\"203.0.113.5\"");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->ipv4, std::optional<std::string>("203.0.113.5"));
}

TEST(StateStore, CorruptContentIsTreatedAsEmpty) {
  ScratchDir dir;
  write(dir.file("ipinfo.db"), "{ this is not json");
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  EXPECT_TRUE(store.load().empty());

  EXPECT_FALSE(StateStore::parse_state("hello world").has_value());
  EXPECT_FALSE(StateStore::parse_state("{\"other\": 1}").has_value());
  EXPECT_FALSE(StateStore::parse_state("{\"ipv4\": 42}").has_value());
}

TEST(StateStore, ReadersAreTriedInOrder) {
  const auto& readers = StateStore::format_readers();
  ASSERT_EQ(readers.size(), 2u);
  EXPECT_STREQ(readers[0].name, "structured");
  EXPECT_STREQ(readers[1].name, "legacy-ipv4");
}

// ---------- save ----------

TEST(StateStore, SaveCreatesMissingDirectories) {
  ScratchDir dir;
  const std::string nested = (dir.path() / "a" / "b" / "ipinfo.db").string();
  StateStore store(nested, dir.file("mark.txt"));
  AddressPair p;
  p.ipv4 = "192.0.2.1";
  store.save(p);
  EXPECT_TRUE(std::filesystem::exists(nested));
  EXPECT_FALSE(std::filesystem::exists(nested + ".tmp"));
}

TEST(StateStore, SaveIntoUnwritablePathThrows) {
  ScratchDir dir;
  // A regular file where a directory is needed.
  write(dir.file("blocker"), "x");
  StateStore store((dir.path() / "blocker" / "ipinfo.db").string(), dir.file("mark.txt"));
  AddressPair p;
  p.ipv4 = "192.0.2.1";
  EXPECT_THROW(store.save(p), StateError);
}

// ---------- update mark ----------

TEST(StateStore, UpdateMarkRoundTrip) {
  ScratchDir dir;
  StateStore store(dir.file("ipinfo.db"), dir.file("mark.txt"));
  EXPECT_FALSE(store.load_update_mark().has_value());
  store.save_update_mark("1.5.0");
  ASSERT_TRUE(store.load_update_mark().has_value());
  EXPECT_EQ(*store.load_update_mark(), "1.5.0");
}
