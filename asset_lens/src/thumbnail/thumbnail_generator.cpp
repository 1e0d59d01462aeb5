//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "thumbnail/thumbnail_generator.hpp"

#include <algorithm>
#include <filesystem>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "utils/log/log_category.hpp"

namespace assetlens {
auto OpenCvThumbnailGenerator::Generate(const std::filesystem::path& source,
                                        const std::filesystem::path& dest, int size) -> bool {
  if (size <= 0) {
    return false;
  }
  try {
    cv::Mat image = cv::imread(source.string(), cv::IMREAD_COLOR);
    if (image.empty()) {
      qCWarning(lcThumbnail) << "Failed to decode" << source.c_str();
      return false;
    }

    const int longest = std::max(image.cols, image.rows);
    if (longest > size) {
      const double scale = static_cast<double>(size) / longest;
      cv::Mat      resized;
      cv::resize(image, resized,
                 cv::Size(std::max(1, static_cast<int>(image.cols * scale)),
                          std::max(1, static_cast<int>(image.rows * scale))),
                 0, 0, cv::INTER_AREA);
      image = std::move(resized);
    }

    std::error_code ec;
    std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
      qCWarning(lcThumbnail) << "Failed to create" << dest.parent_path().c_str() << ec.message().c_str();
      return false;
    }

    std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 3};
    if (!cv::imwrite(dest.string(), image, params)) {
      qCWarning(lcThumbnail) << "Failed to write" << dest.c_str();
      return false;
    }
    return true;
  } catch (const cv::Exception& e) {
    qCWarning(lcThumbnail) << "OpenCV error while generating thumbnail for" << source.c_str()
                           << e.what();
  } catch (const std::exception& e) {
    qCWarning(lcThumbnail) << "Error while generating thumbnail for" << source.c_str() << e.what();
  }
  return false;
}
};  // namespace assetlens
