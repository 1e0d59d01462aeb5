#include "sidecar/sidecar_store.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include "../test_fixture.hpp"

namespace assetlens {
TEST(JsonSidecarStoreTest, MissingFile_BehavesAsEmptyStore) {
  test::TempDir    dir;
  JsonSidecarStore store(dir / "sidecar.json");
  EXPECT_FALSE(store.Value("/shots/a.exr", "description").has_value());
}

TEST(JsonSidecarStoreTest, SetValueSaveReload_RoundTripsThroughDisk) {
  test::TempDir    dir;
  JsonSidecarStore store(dir / "nested" / "sidecar.json");
  store.SetValue("/shots/a.exr", "description", "hero plate");
  store.SetValue("/shots/a.exr", "flags", 8);
  store.Save();

  JsonSidecarStore reopened(dir / "nested" / "sidecar.json");
  auto             description = reopened.Value("/shots/a.exr", "description");
  ASSERT_TRUE(description.has_value());
  EXPECT_EQ(description->get<std::string>(), "hero plate");
  EXPECT_EQ(reopened.Value("/shots/a.exr", "flags")->get<int>(), 8);
  EXPECT_FALSE(reopened.Value("/shots/a.exr", "notes").has_value());
  EXPECT_FALSE(reopened.Value("/shots/b.exr", "flags").has_value());
}

TEST(JsonSidecarStoreTest, CorruptFile_ThrowsSidecarReadError) {
  test::TempDir dir;
  std::ofstream(dir / "sidecar.json") << "[1, 2";
  JsonSidecarStore store(dir / "sidecar.json");
  EXPECT_THROW(store.Value("/shots/a.exr", "description"), SidecarReadError);

  std::ofstream(dir / "array.json") << "[1, 2]";
  JsonSidecarStore array_store(dir / "array.json");
  EXPECT_THROW(array_store.Value("/shots/a.exr", "description"), SidecarReadError);
}

TEST(JsonSidecarStoreTest, Reload_PicksUpExternalEdits) {
  test::TempDir    dir;
  JsonSidecarStore store(dir / "sidecar.json");
  EXPECT_FALSE(store.Value("k", "description").has_value());

  std::ofstream(dir / "sidecar.json") << R"({"k": {"description": "edited"}})";
  EXPECT_FALSE(store.Value("k", "description").has_value());
  store.Reload();
  EXPECT_EQ(store.Value("k", "description")->get<std::string>(), "edited");
}
};  // namespace assetlens
