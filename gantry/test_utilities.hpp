#pragma once

#include "gtest/gtest.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace gantry::test {

/** @brief Unique directory under the system temporary directory, removed on destruction */
class temporary_directory {
public:
  temporary_directory()
  {
    static std::atomic<int> counter{ 0 };
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() / ("gantry-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(path);
  }

  ~temporary_directory()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  temporary_directory(const temporary_directory &)            = delete;
  temporary_directory &operator=(const temporary_directory &) = delete;

  std::filesystem::path path;
};

inline void write_file(const std::filesystem::path &path, const std::string &content)
{
  if (path.has_parent_path())
    std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << content;
}

inline std::string read_file(const std::filesystem::path &path)
{
  std::ifstream file(path, std::ios::binary);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

inline size_t count_lines(const std::filesystem::path &path)
{
  std::ifstream file(path);
  size_t lines = 0;
  std::string line;
  while (std::getline(file, line))
    ++lines;
  return lines;
}

} // namespace gantry::test
