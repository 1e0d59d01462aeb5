#include <gtest/gtest.h>

#include <QImage>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../test_fixture.hpp"
#include "thumbnail/image_cache.hpp"
#include "thumbnail/thumbnail_generator.hpp"
#include "thumbnail/thumbnail_path.hpp"

namespace assetlens {
TEST(ThumbnailPathTest, SameKey_SamePath) {
  const auto a = ThumbnailPathFor("/cache", "/shots/a_[0].exr");
  const auto b = ThumbnailPathFor("/cache", "/shots/a_[0].exr");
  const auto c = ThumbnailPathFor("/cache", "/shots/b_[0].exr");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(a.parent_path(), std::filesystem::path("/cache"));
  EXPECT_EQ(a.extension(), ".png");
  EXPECT_EQ(a.stem().string().size(), 16u);
}

TEST(ImageCacheTest, Get_ScalesToHeightAndTracksBackground) {
  test::TempDir dir;
  test::WritePng(dir / "red.png", 200, 100, QColor(255, 0, 0));

  ImageCache cache(4);
  QImage     image = cache.Get((dir / "red.png").string(), 50);
  ASSERT_FALSE(image.isNull());
  EXPECT_EQ(image.height(), 50);
  EXPECT_EQ(image.width(), 100);

  auto background = cache.BackgroundColor((dir / "red.png").string());
  ASSERT_TRUE(background.has_value());
  EXPECT_EQ(background->red(), 255);
  EXPECT_EQ(background->green(), 0);
}

TEST(ImageCacheTest, Get_MissingFile_ReturnsNullImage) {
  ImageCache cache;
  EXPECT_TRUE(cache.Get("/definitely/not/here.png", 54).isNull());
  EXPECT_EQ(cache.Size(), 0u);
}

TEST(ImageCacheTest, Invalidate_RemovesEntry) {
  test::TempDir dir;
  test::WritePng(dir / "a.png", 10, 10);
  ImageCache cache(4);
  cache.Get((dir / "a.png").string(), 10);
  EXPECT_EQ(cache.Size(), 1u);
  cache.Invalidate((dir / "a.png").string());
  EXPECT_EQ(cache.Size(), 0u);
  EXPECT_FALSE(cache.BackgroundColor((dir / "a.png").string()).has_value());
}

TEST(OpenCvThumbnailGeneratorTest, Generate_DownscalesIntoCache) {
  test::TempDir dir;
  cv::Mat       source(400, 800, CV_8UC3, cv::Scalar(10, 200, 30));
  ASSERT_TRUE(cv::imwrite((dir / "source.jpg").string(), source));

  OpenCvThumbnailGenerator generator;
  const auto               dest = dir / "cache" / "thumb.png";
  ASSERT_TRUE(generator.Generate(dir / "source.jpg", dest, 128));

  cv::Mat thumb = cv::imread(dest.string());
  ASSERT_FALSE(thumb.empty());
  EXPECT_EQ(thumb.cols, 128);
  EXPECT_EQ(thumb.rows, 64);
}

TEST(OpenCvThumbnailGeneratorTest, Generate_UndecodableSource_ReturnsFalse) {
  test::TempDir dir;
  test::WriteBytes(dir / "garbage.jpg", 64);

  OpenCvThumbnailGenerator generator;
  EXPECT_FALSE(generator.Generate(dir / "garbage.jpg", dir / "thumb.png", 128));
  EXPECT_FALSE(generator.Generate(dir / "missing.jpg", dir / "thumb.png", 128));
  EXPECT_FALSE(std::filesystem::exists(dir / "thumb.png"));
}
};  // namespace assetlens
