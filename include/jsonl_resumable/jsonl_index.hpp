#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "jsonl_resumable/decode_policy.hpp"
#include "jsonl_resumable/index_meta.hpp"
#include "jsonl_resumable/metrics.hpp"

namespace jr {

class SourceFile;

struct Line {
  LineRecord record;
  std::string bytes;   // exactly record.byte_length bytes, terminator included
};

struct ParsedLine {
  std::uint64_t line_number = 0;
  Record record;
};

// Lazy forward cursor returned by JsonlIndex::iterate_from. Holds a read
// handle until exhausted, closed or destroyed; abandoning it early is fine.
// A cursor may outlive the index that created it.
class LineCursor {
public:
  LineCursor();
  LineCursor(LineCursor&&) noexcept;
  LineCursor& operator=(LineCursor&&) noexcept;
  ~LineCursor();

  bool next(Line& out);

  using LineCallback = std::function<bool(const Line&)>;
  // Stops early when the callback returns false.
  void for_each(const LineCallback& cb);

  std::uint64_t position() const noexcept;   // next line number to yield
  std::uint64_t yielded() const noexcept;
  bool holds_handle() const noexcept;
  void close();

private:
  friend class JsonlIndex;
  struct Impl;
  std::unique_ptr<Impl> p_;
};

// LineCursor plus a decode policy; Skip drops undecodable lines.
class RecordCursor {
public:
  RecordCursor(LineCursor lines, DecodePolicy policy);

  bool next(ParsedLine& out);
  std::uint64_t position() const noexcept { return lines_.position(); }
  void close() { lines_.close(); }

private:
  LineCursor lines_;
  DecodePolicy policy_;
  Line scratch_;
};

// Sparse byte-offset index over one JSONL file.
//
// Reads (resolve/read*/iterate*/sample*) may run concurrently. rebuild(),
// update() and save() take the index exclusively and wait for in-flight
// reads; cursors snapshot their bounds and are unaffected by later updates.
class JsonlIndex {
public:
  static constexpr std::uint64_t kUnbounded = std::numeric_limits<std::uint64_t>::max();

  struct Config {
    std::uint64_t checkpoint_interval = 100;
    std::string   index_path;                  // empty -> "<source>.idx"
    bool          auto_save          = true;   // persist after rebuild/update
    bool          keep_open          = false;  // one handle for the index lifetime
    bool          rebuild_on_invalid = false;  // rebuild instead of throwing on a bad sidecar
    std::size_t   chunk_bytes        = 512 * 1024;
    bool          verbose            = false;  // "[index]" lines on stderr
  };

  // Loads "<source>.idx" when fresh, otherwise scans the file.
  // Throws CorruptSourceError (missing/unreadable source) or
  // InvalidCheckpointError (bad sidecar, unless rebuild_on_invalid).
  explicit JsonlIndex(std::string path);
  JsonlIndex(std::string path, Config cfg);
  ~JsonlIndex();

  JsonlIndex(const JsonlIndex&) = delete;
  JsonlIndex& operator=(const JsonlIndex&) = delete;

  const std::string& source_path() const noexcept;
  const std::string& index_path() const noexcept;
  const Config& config() const noexcept;

  std::uint64_t total_lines() const;
  FileIdentity identity() const;        // as recorded in the index
  FileIdentity live_identity() const;   // current file on disk
  bool is_fresh() const;
  IndexMeta meta() const;               // snapshot copy
  MetricsRegistry& metrics() const noexcept;

  // Full scan from offset 0. rebuild() and update() read through a newly
  // opened handle, which also replaces the keep_open/Session handle.
  void rebuild();

  // Index bytes appended since the last scan; returns the number of new
  // lines. Falls back to rebuild() (returning the new total) when the file
  // shrank, got an older mtime, or changed without growing.
  std::uint64_t update();

  void save() const;

  // Throws LineOutOfRangeError for line < 0 or >= total_lines().
  LineRecord resolve(std::int64_t line) const;
  std::string read(std::int64_t line) const;
  std::optional<Record> read_parsed(std::int64_t line, const DecodePolicy& policy = {}) const;

  // Results follow the input order; one handle acquisition per call.
  std::vector<std::string> read_many(const std::vector<std::int64_t>& lines) const;
  std::vector<std::optional<Record>> read_many_parsed(const std::vector<std::int64_t>& lines,
                                                      const DecodePolicy& policy = {}) const;

  // Negative start is clamped to 0; start past the end yields nothing.
  LineCursor iterate_from(std::int64_t start = 0, std::uint64_t limit = kUnbounded) const;
  RecordCursor iterate_parsed_from(std::int64_t start, std::uint64_t limit,
                                   DecodePolicy policy = {}) const;

  // n distinct line numbers, uniform without replacement, reproducible for
  // a given (total_lines, n, seed). Throws SampleSizeError if n > total.
  std::vector<std::uint64_t> sample_lines(std::uint64_t n,
                                          std::optional<std::uint64_t> seed = std::nullopt) const;
  std::vector<Line> sample(std::uint64_t n, std::optional<std::uint64_t> seed = std::nullopt) const;

  // Scoped persistent handle: reads issued while a Session is alive share
  // one open file. The handle closes when the last Session ends (unless
  // keep_open). A Session must not outlive its index.
  class Session {
  public:
    Session(Session&& o) noexcept : owner_(o.owner_) { o.owner_ = nullptr; }
    Session& operator=(Session&&) = delete;
    Session(const Session&) = delete;
    ~Session();
  private:
    friend class JsonlIndex;
    explicit Session(const JsonlIndex* owner) : owner_(owner) {}
    const JsonlIndex* owner_;
  };

  Session open_session() const;

  // Release the keep_open handle now (cursors already holding it keep it).
  void close();

private:
  struct Impl; Impl* p_;
};

}
