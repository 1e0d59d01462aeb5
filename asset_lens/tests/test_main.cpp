/// @file test_main.cpp
/// @brief Custom main() shared by every AssetLens test executable.
///
/// Creates a QCoreApplication before running GoogleTest so queued signals and
/// QSignalSpy work in headless environments.

#include <QCoreApplication>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
