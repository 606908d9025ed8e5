#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace jr {

class MetricsRegistry;

// Read-only handle on the data file. Positional reads are serialized by an
// internal mutex so one handle can be shared by concurrent readers.
class SourceFile {
public:
  // Throws CorruptSourceError when the file cannot be opened.
  explicit SourceFile(std::string path, MetricsRegistry* metrics = nullptr);
  ~SourceFile();

  SourceFile(const SourceFile&) = delete;
  SourceFile& operator=(const SourceFile&) = delete;

  // Reads up to `n` bytes at `offset`; returns the count (short only at EOF).
  std::size_t read_at(std::uint64_t offset, char* dst, std::size_t n);

  // Reads exactly `n` bytes at `offset` or throws CorruptSourceError.
  void read_exact(std::uint64_t offset, std::size_t n, std::string& out);

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  std::mutex mu_;
};

// Span of one line inside the file; `length` includes the '\n' terminator
// when the line has one.
struct LineSpan {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
};

// Chunked forward line splitter over [start, end) of a SourceFile.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024;   // 512 KiB
  };

  ChunkReader(SourceFile& file, std::uint64_t start, std::uint64_t end);
  ChunkReader(SourceFile& file, std::uint64_t start, std::uint64_t end, Config cfg);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Next line span. When `content` is given it receives the line bytes.
  // Returns false once `end` is reached. Throws CorruptSourceError if the
  // file ends before `end`.
  bool next(LineSpan& out, std::string* content = nullptr);

  // Drop lines until `n` have been skipped or `end` is reached; returns the
  // number skipped.
  std::uint64_t skip(std::uint64_t n);

  using LineCallback = std::function<bool(const LineSpan&)>;

  // Push-style walk; stops early when the callback returns false.
  void for_each_line(const LineCallback& cb);

  std::uint64_t position() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

// View of `line` without its trailing "\n" or "\r\n".
std::string_view trim_eol(std::string_view line) noexcept;

}
