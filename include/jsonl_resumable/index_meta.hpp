#pragma once
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace jr {

// One resolved line: [byte_offset, byte_offset + byte_length) including '\n'.
struct LineRecord {
  std::uint64_t line_number = 0;
  std::uint64_t byte_offset = 0;
  std::uint64_t byte_length = 0;

  std::uint64_t end_offset() const noexcept { return byte_offset + byte_length; }

  bool operator==(const LineRecord& o) const noexcept {
    return line_number == o.line_number && byte_offset == o.byte_offset &&
           byte_length == o.byte_length;
  }
  bool operator!=(const LineRecord& o) const noexcept { return !(*this == o); }
};

// (size, mtime) pair used for freshness checks. Content hashes are not taken,
// so a same-size rewrite that restores the mtime is not detected.
struct FileIdentity {
  std::uint64_t size = 0;
  std::int64_t  mtime_ns = 0;

  bool operator==(const FileIdentity& o) const noexcept {
    return size == o.size && mtime_ns == o.mtime_ns;
  }
  bool operator!=(const FileIdentity& o) const noexcept { return !(*this == o); }
};

struct Checkpoint {
  std::uint64_t line = 0;
  std::uint64_t offset = 0;
};

// Sparse line -> offset table. Sorted by line; holds every multiple of the
// interval plus the last indexed line.
class CheckpointTable {
public:
  bool empty() const noexcept { return cps_.empty(); }
  std::size_t size() const noexcept { return cps_.size(); }

  const Checkpoint& operator[](std::size_t i) const { return cps_[i]; }
  const Checkpoint& back() const { return cps_.back(); }

  // Caller keeps keys strictly increasing.
  void push_back(Checkpoint cp) { cps_.push_back(cp); }
  void pop_back() { cps_.pop_back(); }

  // Greatest checkpoint with line <= `line`. Table must be non-empty and
  // start at line 0.
  const Checkpoint& floor(std::uint64_t line) const {
    auto it = std::upper_bound(cps_.begin(), cps_.end(), line,
                               [](std::uint64_t l, const Checkpoint& c){ return l < c.line; });
    return *(it - 1);
  }

private:
  std::vector<Checkpoint> cps_;
};

struct IndexMeta {
  static constexpr int kFormatVersion = 1;

  std::string source_path;
  FileIdentity identity;
  std::uint64_t total_lines = 0;
  std::uint64_t checkpoint_interval = 100;
  CheckpointTable checkpoints;
  std::string indexed_at;   // ISO-8601 UTC

  bool is_fresh(const FileIdentity& live) const noexcept { return identity == live; }
};

}
