/**
 * @file test_support.hpp
 * @brief Scratch directories and small polling helpers shared by the tests.
 */

#ifndef ORCA_TESTS_TEST_SUPPORT_HPP_
#define ORCA_TESTS_TEST_SUPPORT_HPP_

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include <ftw.h>
#include <unistd.h>

namespace orca_test {

/// mkdtemp directory removed recursively on destruction.
class TempDir {
 public:
  TempDir() {
    const char* tmp = std::getenv("TMPDIR");
    std::string tmpl = (tmp != nullptr && tmp[0] != '\0') ? tmp : "/tmp";
    tmpl += "/orca-test-XXXXXX";
    path_.assign(tmpl);
    if (::mkdtemp(&path_[0]) == nullptr) path_.clear();
  }

  ~TempDir() {
    if (!path_.empty()) {
      ::nftw(path_.c_str(), &TempDir::RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
    }
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

  /// Write @p content to @p name inside the directory; returns the full path.
  std::string WriteFile(const std::string& name, const std::string& content) const {
    std::string full = path_ + "/" + name;
    FILE* f = std::fopen(full.c_str(), "wb");
    if (f != nullptr) {
      std::fwrite(content.data(), 1, content.size(), f);
      std::fclose(f);
    }
    return full;
  }

 private:
  static int RemoveEntry(const char* p, const struct stat*, int, struct FTW*) {
    return ::remove(p);
  }

  std::string path_;
};

/// Poll @p pred every 10ms until true or @p timeout passes.
template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

inline bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace orca_test

#endif  // ORCA_TESTS_TEST_SUPPORT_HPP_
