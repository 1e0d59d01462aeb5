/// @file test_fixture.hpp
/// @brief Shared helpers for AssetLens tests: temp directories, event-loop
/// helpers, and in-memory fakes for the sidecar store and thumbnail generator.

#pragma once

#include <gtest/gtest.h>

#include <QColor>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QImage>
#include <QString>
#include <QTimer>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include "sidecar/sidecar_store.hpp"
#include "thumbnail/thumbnail_generator.hpp"

namespace assetlens::test {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Process the Qt event loop for up to @p ms milliseconds.
inline void ProcessEvents(int ms = 50) {
  QEventLoop loop;
  QTimer::singleShot(ms, &loop, &QEventLoop::quit);
  loop.exec();
}

/// Keep the event loop running until @p done holds or @p timeout_ms passes.
inline bool WaitUntil(const std::function<bool()>& done, int timeout_ms = 10000) {
  QElapsedTimer timer;
  timer.start();
  while (!done()) {
    if (timer.elapsed() > timeout_ms) {
      return false;
    }
    ProcessEvents(10);
  }
  return true;
}

/// A unique directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("assetlens_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  auto path() const -> const std::filesystem::path& { return path_; }
  auto operator/(const std::string& name) const -> std::filesystem::path { return path_ / name; }

 private:
  std::filesystem::path path_;
};

inline void WriteBytes(const std::filesystem::path& path, size_t size) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary);
  file << std::string(size, 'x');
}

inline void WritePng(const std::filesystem::path& path, int width, int height,
                     QColor color = QColor(200, 40, 40)) {
  std::filesystem::create_directories(path.parent_path());
  QImage image(width, height, QImage::Format_RGB32);
  image.fill(color);
  ASSERT_TRUE(image.save(QString::fromStdString(path.string()), "PNG"));
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

/// Writes a solid PNG when told to succeed, otherwise reports failure.
class FakeThumbnailGenerator : public ThumbnailGenerator {
 public:
  explicit FakeThumbnailGenerator(bool succeed = true) : succeed_(succeed) {}

  auto Generate(const std::filesystem::path& source, const std::filesystem::path& dest, int size)
      -> bool override {
    ++calls_;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      last_source_ = source;
    }
    if (!succeed_.load()) {
      return false;
    }
    std::filesystem::create_directories(dest.parent_path());
    QImage image(size, size / 2, QImage::Format_RGB32);
    image.fill(QColor(20, 120, 220));
    return image.save(QString::fromStdString(dest.string()), "PNG");
  }

  auto LastSource() -> std::filesystem::path {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_source_;
  }

  std::atomic<int>  calls_ = 0;
  std::atomic<bool> succeed_;

 private:
  std::mutex            mtx_;
  std::filesystem::path last_source_;
};

/// In-memory sidecar with an optional read hook and failure switch.
class FakeSidecarStore : public SidecarStore {
 public:
  auto Value(const content_key_t& key, const sidecar_field_t& field)
      -> std::optional<nlohmann::json> override {
    if (on_read_) {
      on_read_(field);
    }
    if (fail_.load()) {
      throw SidecarReadError("sidecar unavailable");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = values_.find({key, field});
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void SetValue(const content_key_t& key, const sidecar_field_t& field,
                nlohmann::json value) override {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[{key, field}] = std::move(value);
  }

  std::atomic<bool>                        fail_ = false;
  std::function<void(const std::string&)> on_read_;

 private:
  std::mutex                                                      mtx_;
  std::map<std::pair<std::string, std::string>, nlohmann::json> values_;
};
}  // namespace assetlens::test
