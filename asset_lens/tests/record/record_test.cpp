#include "record/record.hpp"

#include <gtest/gtest.h>

#include <memory>

#include "record/record_collection.hpp"

namespace assetlens {
TEST(RecordRefTest, DefaultConstructed_IsInvalid) {
  RecordRef ref;
  EXPECT_FALSE(ref.IsValid());
  EXPECT_FALSE(ref.IsAlive());
  EXPECT_EQ(ref.Lock(), nullptr);
}

TEST(RecordRefTest, Lock_FailsOnceOwnerReleasesRecord) {
  auto      record = std::make_shared<Record>(1, RecordType::FILE, "/tmp/a.png");
  RecordRef ref(record);
  EXPECT_TRUE(ref.IsAlive());

  record.reset();
  EXPECT_TRUE(ref.IsValid());
  EXPECT_FALSE(ref.IsAlive());
}

TEST(RecordRefTest, Lock_FailsForDiscardedRecordEvenWhileStronglyHeld) {
  RecordCollection collection;
  auto             record = std::make_shared<Record>(1, RecordType::FILE, "/tmp/a.png");
  RecordRef        ref    = collection.Add(record);
  ASSERT_TRUE(ref.IsAlive());

  collection.Clear();
  // The test still owns a strong pointer, but the collection let go of the record
  EXPECT_TRUE(record != nullptr);
  EXPECT_FALSE(ref.IsAlive());
}

TEST(RecordRefTest, Equality_IsOwnershipEquality) {
  auto a = std::make_shared<Record>(1, RecordType::FILE, "/tmp/a.png");
  auto b = std::make_shared<Record>(1, RecordType::FILE, "/tmp/a.png");
  EXPECT_EQ(RecordRef(a), RecordRef(a));
  EXPECT_FALSE(RecordRef(a) == RecordRef(b));
  EXPECT_FALSE(RecordRef(a) == RecordRef());
}

TEST(RecordTest, ContentKey_SequenceUsesFrameZeroToken) {
  auto pattern = ParseSequence("/shots/sh010_0001.exr");
  ASSERT_TRUE(pattern.has_value());
  auto record = MakeSequenceRecord(3, *pattern, {"0001", "0002"}, {}, 54);
  EXPECT_EQ(record->ContentKey(), "/shots/sh010_[0].exr");
  EXPECT_EQ(record->Extension(), "exr");
  EXPECT_EQ(record->type_, RecordType::SEQUENCE);
}

TEST(RecordCollectionTest, Replace_DiscardsPreviousGeneration) {
  RecordCollection collection("shots");
  auto             child  = std::make_shared<Record>(2, RecordType::FOLDER, "/tmp/child");
  auto             folder = MakeFolderRecord(1, "/tmp", {child}, 54);
  RecordRef        folder_ref = collection.Add(folder);
  RecordRef        child_ref(child);

  collection.Replace({std::make_shared<Record>(3, RecordType::FILE, "/tmp/b.png")});
  EXPECT_FALSE(folder_ref.IsAlive());
  EXPECT_FALSE(child_ref.IsAlive());
  EXPECT_EQ(collection.Size(), 1u);
  EXPECT_EQ(collection.Generation(), 1u);
  EXPECT_FALSE(collection.IsFullyLoaded());
}

TEST(RecordCollectionTest, Sort_BySizeThenName) {
  RecordCollection collection;
  auto             a = std::make_shared<Record>(1, RecordType::FILE, "/tmp/a.png");
  auto             b = std::make_shared<Record>(2, RecordType::FILE, "/tmp/b.png");
  auto             c = std::make_shared<Record>(3, RecordType::FILE, "/tmp/c.png");
  a->size_         = 30;
  b->size_         = 10;
  c->size_         = 10;
  collection.Add(a);
  collection.Add(c);
  collection.Add(b);

  collection.Sort(SortRole::SIZE);
  EXPECT_EQ(collection.At(0), b);
  EXPECT_EQ(collection.At(1), c);
  EXPECT_EQ(collection.At(2), a);

  collection.Sort(SortRole::NAME, true);
  EXPECT_EQ(collection.At(0), c);
  EXPECT_EQ(collection.At(2), a);
}

TEST(RecordCollectionTest, ResetThumbnails_RestoresPlaceholder) {
  RecordCollection collection;
  auto             record = std::make_shared<Record>(1, RecordType::FILE, "/tmp/a.png");
  record->default_thumbnail_            = QImage(4, 4, QImage::Format_RGB32);
  record->default_thumbnail_background_ = QColor(1, 2, 3);
  record->thumbnail_                    = QImage(8, 8, QImage::Format_RGB32);
  record->thumbnail_path_               = "/tmp/cache.png";
  record->thumbnail_loaded_.store(true);
  collection.Add(record);

  collection.ResetThumbnails();
  EXPECT_FALSE(record->thumbnail_loaded_.load());
  EXPECT_EQ(record->thumbnail_.size(), QSize(4, 4));
  EXPECT_EQ(record->thumbnail_background_, QColor(1, 2, 3));
  EXPECT_TRUE(record->thumbnail_path_.empty());
}
};  // namespace assetlens
