#include "workers/folder_count_worker.hpp"

#include <gtest/gtest.h>

#include <QSignalSpy>

#include <filesystem>
#include <memory>
#include <string>

#include "../test_fixture.hpp"
#include "record/record_collection.hpp"

namespace assetlens {
namespace {
auto MakeChild(record_id_t id, const std::filesystem::path& path) -> std::shared_ptr<Record> {
  std::filesystem::create_directories(path);
  return std::make_shared<Record>(id, RecordType::FOLDER, path);
}
}  // namespace

TEST(FolderCountWorkerTest, CountsVisibleEntriesPerChild) {
  test::TempDir dir;
  auto          renders = MakeChild(2, dir / "renders");
  auto          plates  = MakeChild(3, dir / "plates");
  test::WriteBytes(dir / "renders" / "a.exr", 1);
  test::WriteBytes(dir / "renders" / "b.exr", 1);
  test::WriteBytes(dir / "renders" / "v001" / "c.exr", 1);
  test::WriteBytes(dir / "renders" / ".DS_Store", 1);
  test::WriteBytes(dir / "renders" / ".hidden" / "d.exr", 1);
  test::WriteBytes(dir / "plates" / "p.dpx", 1);

  RecordCollection collection;
  RecordRef        ref = collection.Add(MakeFolderRecord(1, dir.path(), {renders, plates}, 54));

  FolderCountWorker worker(EnrichConfig{});
  QSignalSpy        spy(&worker, &Worker::ItemReady);
  worker.Queue()->Put(ref);
  worker.Activate();

  // a.exr, b.exr, v001 and v001/c.exr
  EXPECT_EQ(renders->item_count_, 4u);
  EXPECT_EQ(plates->item_count_, 1u);
  ASSERT_EQ(spy.count(), 2);
  EXPECT_EQ(spy.at(0).at(0).value<RecordRef>(), RecordRef(renders));
  EXPECT_EQ(spy.at(1).at(0).value<RecordRef>(), RecordRef(plates));
}

TEST(FolderCountWorkerTest, CountStopsAtCap) {
  test::TempDir dir;
  auto          child = MakeChild(2, dir / "big");
  for (int i = 0; i < 30; ++i) {
    test::WriteBytes(dir / "big" / ("f" + std::to_string(i)), 1);
  }
  RecordCollection collection;
  RecordRef        ref = collection.Add(MakeFolderRecord(1, dir.path(), {child}, 54));

  EnrichConfig config;
  config.folder_count_cap_ = 10;
  FolderCountWorker worker(config);
  worker.Queue()->Put(ref);
  worker.Activate();
  EXPECT_EQ(child->item_count_, 10u);
}

TEST(FolderCountWorkerTest, DiscardedParent_NothingWritten) {
  test::TempDir dir;
  auto          child = MakeChild(2, dir / "renders");
  test::WriteBytes(dir / "renders" / "a.exr", 1);
  RecordCollection collection;
  RecordRef        ref = collection.Add(MakeFolderRecord(1, dir.path(), {child}, 54));
  collection.Clear();

  FolderCountWorker worker(EnrichConfig{});
  QSignalSpy        spy(&worker, &Worker::ItemReady);
  worker.Queue()->Put(ref);
  worker.Activate();
  EXPECT_EQ(spy.count(), 0);
  EXPECT_EQ(child->item_count_, 0u);
}
};  // namespace assetlens
