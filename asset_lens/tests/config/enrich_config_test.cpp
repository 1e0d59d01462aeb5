#include "config/enrich_config.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>

#include "../test_fixture.hpp"

namespace assetlens {
TEST(EnrichConfigTest, Defaults_MatchDocumentedValues) {
  EnrichConfig config;
  EXPECT_EQ(config.info_interval_.count(), 50);
  EXPECT_EQ(config.thumbnail_interval_.count(), 100);
  EXPECT_EQ(config.background_sweep_.count(), 1500);
  EXPECT_EQ(config.monitor_interval_.count(), 200);
  EXPECT_EQ(config.info_wait_retries_, 20);
  EXPECT_EQ(config.max_source_bytes_, 2ull * 1024 * 1024 * 1024);
  EXPECT_EQ(config.folder_count_cap_, 999u);
  EXPECT_FALSE(config.verify_existence_);
  EXPECT_TRUE(config.thumbnail_extensions_.contains("png"));
}

TEST(EnrichConfigTest, FromJson_OverridesOnlyGivenKeys) {
  auto config = EnrichConfig::FromJson({{"thumbnail_interval_ms", 25},
                                        {"folder_count_cap", 50},
                                        {"thumbnail_extensions", {".PNG", "jpg"}}});
  EXPECT_EQ(config.thumbnail_interval_.count(), 25);
  EXPECT_EQ(config.folder_count_cap_, 50u);
  EXPECT_EQ(config.info_interval_.count(), 50);
  EXPECT_EQ(config.thumbnail_extensions_.size(), 2u);
  EXPECT_TRUE(config.thumbnail_extensions_.contains("png"));
}

TEST(EnrichConfigTest, FromJson_InvalidValues_Throw) {
  EXPECT_THROW(EnrichConfig::FromJson({{"info_interval_ms", 0}}), std::runtime_error);
  EXPECT_THROW(EnrichConfig::FromJson({{"thumbnail_size", -1}}), std::runtime_error);
  EXPECT_THROW(EnrichConfig::FromJson({{"row_height", "tall"}}), std::runtime_error);
  EXPECT_THROW(EnrichConfig::FromJson(nlohmann::json::array()), std::runtime_error);
}

TEST(EnrichConfigTest, SaveThenLoad_PreservesValues) {
  test::TempDir dir;
  EnrichConfig  config;
  config.thumbnail_size_   = 256;
  config.verify_existence_ = true;
  config.cache_root_       = dir / "cache";
  config.SaveToFile(dir / "config.json");

  auto loaded = EnrichConfig::LoadFromFile(dir / "config.json");
  EXPECT_EQ(loaded.thumbnail_size_, 256);
  EXPECT_TRUE(loaded.verify_existence_);
  EXPECT_EQ(loaded.cache_root_, dir / "cache");
  EXPECT_EQ(loaded.thumbnail_extensions_, config.thumbnail_extensions_);
}

TEST(EnrichConfigTest, LoadFromFile_MissingOrCorrupt_Throws) {
  test::TempDir dir;
  EXPECT_THROW(EnrichConfig::LoadFromFile(dir / "missing.json"), std::runtime_error);

  std::ofstream(dir / "broken.json") << "{ not json";
  EXPECT_THROW(EnrichConfig::LoadFromFile(dir / "broken.json"), std::runtime_error);
}
};  // namespace assetlens
