#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <iostream>
#include <random>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

#define JR_CHECK(cond, msg)                                                   \
  do {                                                                        \
    if (!(cond)) {                                                            \
      std::cerr << "[FAIL] " << msg << "  (" #cond ", line " << __LINE__ << ")\n"; \
      return 1;                                                               \
    }                                                                         \
  } while (0)

namespace jr_test {

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  explicit TempDir(const std::string& tag) {
    std::random_device rd;
    path_ = fs::temp_directory_path() /
            ("jr-" + tag + "-" + std::to_string(rd()) + std::to_string(rd()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  fs::path operator/(const std::string& name) const { return path_ / name; }

private:
  fs::path path_;
};

inline void write_text(const fs::path& p, const std::string& data) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline void append_text(const fs::path& p, const std::string& data) {
  std::ofstream out(p, std::ios::binary | std::ios::app);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string read_text(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// {"id":i,"name":"item-i"} per line, '\n' terminated.
inline std::string numbered_jsonl(std::size_t from, std::size_t to) {
  std::string s;
  for (std::size_t i = from; i < to; ++i)
    s += "{\"id\":" + std::to_string(i) + ",\"name\":\"item-" + std::to_string(i) + "\"}\n";
  return s;
}

// Move the mtime forward so appends are visible even on coarse clocks.
inline void bump_mtime(const fs::path& p, int seconds = 2) {
  auto t = fs::last_write_time(p);
  fs::last_write_time(p, t + std::chrono::seconds(seconds));
}

// True when `fn` throws exactly an E (or subclass).
template <class E>
bool throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (const std::exception& e) {
    std::cerr << "  unexpected exception: " << e.what() << "\n";
    return false;
  }
  return false;
}

}
