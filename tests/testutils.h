#ifndef _BURROW_TESTUTILS_H_
#define _BURROW_TESTUTILS_H_

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include "inference.h"

namespace testutils {

  // Unique directory under the system temp dir, removed on destruction.
  class TempDir {
  public:
    TempDir() {
      std::random_device rd;
      auto base = std::filesystem::temp_directory_path();
      do {
        path_ = base / ("burrow-test-" + std::to_string(rd()));
      } while (std::filesystem::exists(path_));
      std::filesystem::create_directories(path_);
    }
    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path &path() const { return path_; }
    std::string str() const { return path_.string(); }
    std::string file(const std::string &name) const { return (path_ / name).string(); }

  private:
    std::filesystem::path path_;
  };

  inline std::string writeFile(const std::filesystem::path &p, const std::string &content) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
    return p.string();
  }

  // Sets both atime and mtime to `epochSeconds`.
  inline void setMtime(const std::string &path, double epochSeconds) {
    struct timespec ts[2];
    ts[0].tv_sec = static_cast<time_t>(epochSeconds);
    ts[0].tv_nsec = static_cast<long>((epochSeconds - static_cast<double>(ts[0].tv_sec)) * 1e9);
    ts[1] = ts[0];
    if (utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
      throw std::runtime_error("utimensat failed for " + path);
    }
  }

  // Deterministic embeddings: letter histogram of the first bytes of the text.
  // Text containing "EMBED_FAIL" makes the call throw.
  class FakeEmbedder : public EmbeddingProvider {
  public:
    explicit FakeEmbedder(std::chrono::milliseconds delay = std::chrono::milliseconds(0)) : delay_(delay) {}

    std::vector<float> generateEmbedding(const std::string &text) const override {
      calls_++;
      if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
      if (text.find("EMBED_FAIL") != std::string::npos) {
        throw std::runtime_error("embedding service rejected input");
      }
      std::vector<float> v(8, 0.0f);
      for (unsigned char c : text) {
        v[c % 8] += 1.0f;
      }
      v[7] += 1.0f;
      return v;
    }

    std::string modelName() const override { return "fake-embed"; }

    size_t calls() const { return calls_; }

  private:
    std::chrono::milliseconds delay_;
    mutable std::atomic<size_t> calls_{ 0 };
  };

} // namespace testutils

#endif // _BURROW_TESTUTILS_H_
