#include "core/ConfigStore.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

using cubecycle::core::ConfigStore;
using cubecycle::core::Configuration;
using cubecycle::io::ConnectionPoint;

namespace {

  class ConfigStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
      path = ::testing::TempDir() + "cubecycle_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf";
      std::remove(path.c_str());
    }

    void TearDown() override {
      std::remove(path.c_str());
      std::remove((path + ".tmp").c_str());
    }

    void writeRaw(const std::string& text) {
      std::ofstream out(path, std::ios::trunc);
      out << text;
    }

    std::string readRaw() {
      std::ifstream in(path);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    std::string path;
  };

  Configuration complete(ConnectionPoint source, ConnectionPoint sink) {
    Configuration cfg;
    cfg.source = source;
    cfg.sink = sink;
    cfg.setupComplete = true;
    return cfg;
  }

} // namespace

TEST_F(ConfigStoreTest, SaveThenLoadRoundTrips) {
  ConfigStore store(path);
  auto cfg = complete(ConnectionPoint::North, ConnectionPoint::East);

  ASSERT_TRUE(store.save(cfg));
  auto [loaded, found] = store.load();

  EXPECT_TRUE(found);
  EXPECT_EQ(loaded, cfg);
}

TEST_F(ConfigStoreTest, WritesStableKeyValueLines) {
  ConfigStore store(path);
  ASSERT_TRUE(store.save(complete(ConnectionPoint::Down, ConnectionPoint::West)));

  EXPECT_EQ(readRaw(), "charger_side=0\ncube_side=4\nsetup_complete=true\n");
}

TEST_F(ConfigStoreTest, MissingFileIsNotFound) {
  ConfigStore store(path);
  auto [cfg, found] = store.load();
  EXPECT_FALSE(found);
  EXPECT_FALSE(cfg.setupComplete);
  EXPECT_FALSE(cfg.source.has_value());
}

TEST_F(ConfigStoreTest, TruncatedFileIsNotFound) {
  writeRaw("charger_side=2\ncube_side=3\n");
  EXPECT_FALSE(ConfigStore(path).load().second);
}

TEST_F(ConfigStoreTest, UnparseableValueIsNotFound) {
  writeRaw("charger_side=two\ncube_side=3\nsetup_complete=true\n");
  EXPECT_FALSE(ConfigStore(path).load().second);
}

TEST_F(ConfigStoreTest, OutOfRangeSideIsNotFound) {
  writeRaw("charger_side=2\ncube_side=9\nsetup_complete=true\n");
  EXPECT_FALSE(ConfigStore(path).load().second);
}

TEST_F(ConfigStoreTest, LineWithoutEqualsIsNotFound) {
  writeRaw("charger_side 2\ncube_side=3\nsetup_complete=true\n");
  EXPECT_FALSE(ConfigStore(path).load().second);
}

TEST_F(ConfigStoreTest, SameSideForBothRolesIsNotFound) {
  writeRaw("charger_side=3\ncube_side=3\nsetup_complete=true\n");
  EXPECT_FALSE(ConfigStore(path).load().second);
}

TEST_F(ConfigStoreTest, NonTrueCompletionFlagLoadsAsIncomplete) {
  writeRaw("charger_side=2\ncube_side=3\nsetup_complete=yes\n");
  auto [cfg, found] = ConfigStore(path).load();
  EXPECT_TRUE(found);
  EXPECT_FALSE(cfg.setupComplete);
}

TEST_F(ConfigStoreTest, ToleratesCrLfLineEndings) {
  writeRaw("charger_side=2\r\ncube_side=3\r\nsetup_complete=true\r\n");
  auto [cfg, found] = ConfigStore(path).load();
  ASSERT_TRUE(found);
  EXPECT_TRUE(cfg.setupComplete);
  EXPECT_EQ(cfg.sink, ConnectionPoint::South);
}

TEST_F(ConfigStoreTest, SaveRejectsIncompleteConfiguration) {
  Configuration cfg;
  cfg.source = ConnectionPoint::Up;
  EXPECT_FALSE(ConfigStore(path).save(cfg));
}

TEST_F(ConfigStoreTest, UnwritableLocationFailsAndKeepsPreviousRecord) {
  ConfigStore good(path);
  ASSERT_TRUE(good.save(complete(ConnectionPoint::Up, ConnectionPoint::Down)));

  ConfigStore bad(::testing::TempDir() + "no_such_dir/cubecycle.conf");
  EXPECT_FALSE(bad.save(complete(ConnectionPoint::North, ConnectionPoint::South)));

  auto [cfg, found] = good.load();
  ASSERT_TRUE(found);
  EXPECT_EQ(cfg.source, ConnectionPoint::Up);
}
