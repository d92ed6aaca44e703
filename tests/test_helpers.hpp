#ifndef CHUNKVAULT_TEST_HELPERS_HPP
#define CHUNKVAULT_TEST_HELPERS_HPP

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace test_helpers {

// Helper function to create a vector of bytes from a string literal
inline std::vector<std::byte> string_to_byte_vector(const std::string &str) {
  std::vector<std::byte> vec(str.length());
  std::transform(str.begin(), str.end(), vec.begin(),
                 [](char c) { return std::byte(c); });
  return vec;
}

inline std::string byte_vector_to_string(const std::vector<std::byte> &vec) {
  return std::string(reinterpret_cast<const char *>(vec.data()), vec.size());
}

// Helper function to create a vector of bytes with sequential values
inline std::vector<std::byte> create_byte_vector(size_t size) {
  std::vector<std::byte> vec(size);
  for (size_t i = 0; i < size; ++i) {
    vec[i] = std::byte(i % 256);
  }
  return vec;
}

// Incompressible bytes from a fixed seed
inline std::vector<std::byte> create_random_byte_vector(size_t size,
                                                        unsigned seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::byte> vec(size);
  for (auto &b : vec) {
    b = std::byte(dist(gen));
  }
  return vec;
}

/**
 * @brief Fresh directory below the system temp dir, removed on destruction.
 *
 * The name includes the running test so parallel test processes never share
 * a store.
 */
class TempDir {
public:
  TempDir() {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "_" +
                                  info->name()
                            : std::string("chunkvault");
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("chunkvault_" + name + "_" + std::to_string(rd()));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }
  std::string str() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

} // namespace test_helpers

#endif // CHUNKVAULT_TEST_HELPERS_HPP
