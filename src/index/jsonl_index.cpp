#include "jsonl_resumable/jsonl_index.hpp"
#include "jsonl_resumable/chunk_reader.hpp"
#include "jsonl_resumable/date_parse.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/index_codec.hpp"
#include "jsonl_resumable/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <numeric>
#include <random>
#include <shared_mutex>
#include <unordered_set>
#include <utility>

namespace jr {

// ---------------------------------------------------------------- cursor

struct LineCursor::Impl {
  std::shared_ptr<SourceFile> file;
  std::unique_ptr<ChunkReader> reader;
  std::shared_ptr<MetricsRegistry> metrics;   // co-owned; the cursor may outlive its index
  std::uint64_t next_line{0};
  std::uint64_t remaining{0};
  std::uint64_t yielded{0};
  std::uint64_t scan_lines{0};

  void release() {
    if (reader && metrics) metrics->add_scan(reader->bytes_read(), scan_lines);
    reader.reset();
    file.reset();
  }
  ~Impl() { release(); }
};

LineCursor::LineCursor() = default;
LineCursor::LineCursor(LineCursor&&) noexcept = default;
LineCursor& LineCursor::operator=(LineCursor&&) noexcept = default;
LineCursor::~LineCursor() = default;

bool LineCursor::next(Line& out) {
  if (!p_ || !p_->reader) return false;
  if (p_->remaining == 0) { p_->release(); return false; }

  LineSpan span;
  if (!p_->reader->next(span, &out.bytes)) {
    p_->release();
    return false;
  }
  ++p_->scan_lines;
  out.record = LineRecord{p_->next_line, span.offset, span.length};
  ++p_->next_line;
  ++p_->yielded;
  if (--p_->remaining == 0) p_->release();
  return true;
}

void LineCursor::for_each(const LineCallback& cb) {
  Line l;
  while (next(l)) {
    if (!cb(l)) break;
  }
}

std::uint64_t LineCursor::position() const noexcept { return p_ ? p_->next_line : 0; }
std::uint64_t LineCursor::yielded() const noexcept { return p_ ? p_->yielded : 0; }
bool LineCursor::holds_handle() const noexcept { return p_ && p_->file != nullptr; }
void LineCursor::close() { if (p_) p_->release(); }

RecordCursor::RecordCursor(LineCursor lines, DecodePolicy policy)
  : lines_(std::move(lines)), policy_(std::move(policy)) {}

bool RecordCursor::next(ParsedLine& out) {
  while (lines_.next(scratch_)) {
    auto rec = policy_.decode(scratch_.record.line_number, scratch_.bytes);
    if (!rec) continue;
    out.line_number = scratch_.record.line_number;
    out.record = std::move(*rec);
    return true;
  }
  return false;
}

// ---------------------------------------------------------------- index

struct JsonlIndex::Impl {
  std::string source;
  std::string index_file;
  Config cfg;
  IndexMeta meta;
  std::shared_ptr<MetricsRegistry> metrics = std::make_shared<MetricsRegistry>();

  mutable std::shared_mutex mu;          // readers shared, rebuild/update exclusive

  mutable std::mutex handle_mu;
  mutable std::shared_ptr<SourceFile> persistent;
  mutable int sessions{0};

  Impl(std::string path, Config c) : cfg(std::move(c)) {
    source = std::filesystem::absolute(std::filesystem::path(path)).lexically_normal().string();
    index_file = cfg.index_path.empty() ? default_index_path(source).string() : cfg.index_path;
  }

  void log(const std::string& msg) const {
    if (cfg.verbose) std::cerr << "[index] " << source << ": " << msg << "\n";
  }

  ChunkReader::Config reader_cfg() const {
    ChunkReader::Config rc;
    rc.chunk_bytes = cfg.chunk_bytes;
    return rc;
  }

  std::shared_ptr<SourceFile> acquire() const {
    std::lock_guard<std::mutex> lk(handle_mu);
    if (persistent) return persistent;
    return std::make_shared<SourceFile>(source, metrics.get());
  }

  // rebuild/update must read the file now at `source`, not whatever inode a
  // held handle still points at (atomic rewrites replace the file by rename).
  // A held persistent handle is swapped for the new one.
  std::shared_ptr<SourceFile> reopen() const {
    auto f = std::make_shared<SourceFile>(source, metrics.get());
    std::lock_guard<std::mutex> lk(handle_mu);
    if (persistent) persistent = f;
    return f;
  }

  // Append lines in [start, end) to `m`, numbering from `first_line`.
  void scan_into(IndexMeta& m, SourceFile& f, std::uint64_t start,
                 std::uint64_t first_line, std::uint64_t end) const {
    ChunkReader r(f, start, end, reader_cfg());
    std::uint64_t line = first_line;
    std::uint64_t last_offset = 0;
    LineSpan s;
    while (r.next(s)) {
      if (line % m.checkpoint_interval == 0) m.checkpoints.push_back(Checkpoint{line, s.offset});
      last_offset = s.offset;
      ++line;
    }
    if (line > first_line && (line - 1) % m.checkpoint_interval != 0)
      m.checkpoints.push_back(Checkpoint{line - 1, last_offset});
    m.total_lines = line;
    metrics->add_scan(r.bytes_read(), line - first_line);
  }

  void rebuild_locked() {
    metrics->start_stage("rebuild");
    IndexMeta m;
    m.source_path = source;
    m.checkpoint_interval = cfg.checkpoint_interval;
    m.identity = file_identity(source);
    if (m.identity.size > 0) {
      auto f = reopen();
      scan_into(m, *f, 0, 0, m.identity.size);
    }
    m.indexed_at = now_iso8601();
    meta = std::move(m);
    metrics->add_rebuild();
    metrics->end_stage("rebuild");
    log("indexed " + std::to_string(meta.total_lines) + " lines");
    if (cfg.auto_save) IndexCodec::save(meta, index_file);
  }

  std::uint64_t update_locked() {
    const FileIdentity live = file_identity(source);
    const FileIdentity& old = meta.identity;
    if (live == old) return 0;

    if (live.size < old.size) {
      log("file shrank from " + std::to_string(old.size) + " to " + std::to_string(live.size) + " bytes; rebuilding");
      rebuild_locked();
      return meta.total_lines;
    }
    if (live.mtime_ns < old.mtime_ns || live.size == old.size) {
      log("file rewritten in place; rebuilding");
      rebuild_locked();
      return meta.total_lines;
    }

    metrics->start_stage("update");
    auto f = reopen();
    IndexMeta m = meta;
    const std::uint64_t old_total = m.total_lines;
    std::uint64_t start = old.size;
    std::uint64_t first_line = old_total;

    if (old_total > 0) {
      char last = 0;
      if (f->read_at(old.size - 1, &last, 1) != 1)
        throw CorruptSourceError(source, "cannot read byte " + std::to_string(old.size - 1));
      if (last != '\n') {
        // Unterminated last line may have grown: rescan it from its start.
        const Checkpoint tail = m.checkpoints.back();
        m.checkpoints.pop_back();
        start = tail.offset;
        first_line = tail.line;
      } else if (m.checkpoints.back().line % m.checkpoint_interval != 0) {
        m.checkpoints.pop_back();
      }
    }

    scan_into(m, *f, start, first_line, live.size);
    m.identity = live;
    m.indexed_at = now_iso8601();
    meta = std::move(m);
    metrics->add_update();
    metrics->end_stage("update");

    const std::uint64_t added = meta.total_lines - old_total;
    log("appended " + std::to_string(added) + " lines");
    if (cfg.auto_save) IndexCodec::save(meta, index_file);
    return added;
  }

  void check_range(std::int64_t line) const {
    if (line < 0 || static_cast<std::uint64_t>(line) >= meta.total_lines)
      throw LineOutOfRangeError(line, meta.total_lines);
  }

  LineRecord resolve_in(SourceFile& f, std::uint64_t line) const {
    const Checkpoint& cp = meta.checkpoints.floor(line);
    ChunkReader r(f, cp.offset, meta.identity.size, reader_cfg());
    const std::uint64_t gap = line - cp.line;
    LineSpan s;
    if (r.skip(gap) != gap || !r.next(s, nullptr))
      throw CorruptSourceError(source, "line " + std::to_string(line) + " not found where the index expects it");
    metrics->add_resolve();
    metrics->add_scan(r.bytes_read(), gap + 1);
    return LineRecord{line, s.offset, s.length};
  }

  // Lines in input order; reads sweep forward in ascending line order.
  std::vector<Line> read_lines(const std::vector<std::int64_t>& lines) const {
    for (auto n : lines) check_range(n);
    std::vector<Line> out(lines.size());
    if (lines.empty()) return out;

    std::vector<std::size_t> order(lines.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b){ return lines[a] < lines[b]; });

    auto f = acquire();
    std::unique_ptr<ChunkReader> r;
    std::uint64_t cur = 0;            // line number r yields next
    std::uint64_t bytes = 0, scanned = 0;
    const Line* prev = nullptr;

    for (std::size_t idx : order) {
      const auto t = static_cast<std::uint64_t>(lines[idx]);
      if (prev && prev->record.line_number == t) { out[idx] = *prev; continue; }

      const Checkpoint& cp = meta.checkpoints.floor(t);
      if (!r || cur > t || cp.line > cur) {
        if (r) bytes += r->bytes_read();
        r = std::make_unique<ChunkReader>(*f, cp.offset, meta.identity.size, reader_cfg());
        cur = cp.line;
      }
      const std::uint64_t gap = t - cur;
      LineSpan s;
      if (r->skip(gap) != gap || !r->next(s, &out[idx].bytes))
        throw CorruptSourceError(source, "line " + std::to_string(t) + " not found where the index expects it");
      scanned += gap + 1;
      out[idx].record = LineRecord{t, s.offset, s.length};
      cur = t + 1;
      prev = &out[idx];
    }
    if (r) bytes += r->bytes_read();
    metrics->add_scan(bytes, scanned);
    return out;
  }
};

JsonlIndex::JsonlIndex(std::string path)
  : JsonlIndex(std::move(path), Config{}) {}

JsonlIndex::JsonlIndex(std::string path, Config cfg)
  : p_(new Impl(std::move(path), std::move(cfg))) {
  try {
    if (p_->cfg.checkpoint_interval == 0) throw Error("checkpoint_interval must be > 0");

    const FileIdentity live = file_identity(p_->source);
    bool loaded = false;
    std::error_code ec;
    if (std::filesystem::exists(p_->index_file, ec)) {
      try {
        IndexMeta m = IndexCodec::load(p_->index_file);
        if (m.checkpoint_interval != p_->cfg.checkpoint_interval) {
          p_->log("checkpoint interval changed; rebuilding");
        } else if (!m.is_fresh(live)) {
          p_->log("index is stale; rebuilding");
        } else {
          p_->meta = std::move(m);
          loaded = true;
        }
      } catch (const InvalidCheckpointError& e) {
        if (!p_->cfg.rebuild_on_invalid) throw;
        p_->log(std::string("invalid index (") + e.what() + "); rebuilding");
      }
    }
    if (!loaded) p_->rebuild_locked();

    if (p_->cfg.keep_open) p_->persistent = std::make_shared<SourceFile>(p_->source, p_->metrics.get());
  } catch (...) {
    delete p_;
    throw;
  }
}

JsonlIndex::~JsonlIndex() { delete p_; }

const std::string& JsonlIndex::source_path() const noexcept { return p_->source; }
const std::string& JsonlIndex::index_path() const noexcept { return p_->index_file; }
const JsonlIndex::Config& JsonlIndex::config() const noexcept { return p_->cfg; }
MetricsRegistry& JsonlIndex::metrics() const noexcept { return *p_->metrics; }

std::uint64_t JsonlIndex::total_lines() const {
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  return p_->meta.total_lines;
}

FileIdentity JsonlIndex::identity() const {
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  return p_->meta.identity;
}

FileIdentity JsonlIndex::live_identity() const { return file_identity(p_->source); }

bool JsonlIndex::is_fresh() const { return identity() == live_identity(); }

IndexMeta JsonlIndex::meta() const {
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  return p_->meta;
}

void JsonlIndex::rebuild() {
  std::unique_lock<std::shared_mutex> lk(p_->mu);
  p_->rebuild_locked();
}

std::uint64_t JsonlIndex::update() {
  std::unique_lock<std::shared_mutex> lk(p_->mu);
  return p_->update_locked();
}

void JsonlIndex::save() const {
  std::unique_lock<std::shared_mutex> lk(p_->mu);
  IndexCodec::save(p_->meta, p_->index_file);
}

LineRecord JsonlIndex::resolve(std::int64_t line) const {
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  p_->check_range(line);
  auto f = p_->acquire();
  return p_->resolve_in(*f, static_cast<std::uint64_t>(line));
}

std::string JsonlIndex::read(std::int64_t line) const {
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  p_->check_range(line);
  auto f = p_->acquire();
  LineRecord rec = p_->resolve_in(*f, static_cast<std::uint64_t>(line));
  std::string out;
  f->read_exact(rec.byte_offset, static_cast<std::size_t>(rec.byte_length), out);
  return out;
}

std::optional<Record> JsonlIndex::read_parsed(std::int64_t line, const DecodePolicy& policy) const {
  std::string bytes = read(line);
  return policy.decode(static_cast<std::uint64_t>(line), bytes);
}

std::vector<std::string> JsonlIndex::read_many(const std::vector<std::int64_t>& lines) const {
  std::vector<Line> got;
  {
    std::shared_lock<std::shared_mutex> lk(p_->mu);
    got = p_->read_lines(lines);
  }
  std::vector<std::string> out;
  out.reserve(got.size());
  for (auto& l : got) out.push_back(std::move(l.bytes));
  return out;
}

std::vector<std::optional<Record>> JsonlIndex::read_many_parsed(const std::vector<std::int64_t>& lines,
                                                                const DecodePolicy& policy) const {
  std::vector<Line> got;
  {
    std::shared_lock<std::shared_mutex> lk(p_->mu);
    got = p_->read_lines(lines);
  }
  std::vector<std::optional<Record>> out;
  out.reserve(got.size());
  for (auto& l : got) out.push_back(policy.decode(l.record.line_number, l.bytes));
  return out;
}

LineCursor JsonlIndex::iterate_from(std::int64_t start, std::uint64_t limit) const {
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  LineCursor c;
  if (start < 0) start = 0;
  const auto first = static_cast<std::uint64_t>(start);
  if (first >= p_->meta.total_lines || limit == 0) return c;

  c.p_ = std::make_unique<LineCursor::Impl>();
  auto& ci = *c.p_;
  ci.metrics = p_->metrics;
  ci.file = p_->acquire();

  const Checkpoint& cp = p_->meta.checkpoints.floor(first);
  ci.reader = std::make_unique<ChunkReader>(*ci.file, cp.offset, p_->meta.identity.size, p_->reader_cfg());
  const std::uint64_t gap = first - cp.line;
  if (ci.reader->skip(gap) != gap)
    throw CorruptSourceError(p_->source, "line " + std::to_string(first) + " not found where the index expects it");
  ci.scan_lines = gap;
  ci.next_line = first;
  ci.remaining = std::min(limit, p_->meta.total_lines - first);
  return c;
}

RecordCursor JsonlIndex::iterate_parsed_from(std::int64_t start, std::uint64_t limit,
                                             DecodePolicy policy) const {
  return RecordCursor(iterate_from(start, limit), std::move(policy));
}

std::vector<std::uint64_t> JsonlIndex::sample_lines(std::uint64_t n,
                                                    std::optional<std::uint64_t> seed) const {
  const std::uint64_t total = total_lines();
  if (n > total) throw SampleSizeError(n, total);

  std::mt19937_64 rng(seed ? *seed : std::random_device{}());
  // Floyd's algorithm: n draws, O(n) memory regardless of total.
  std::unordered_set<std::uint64_t> chosen;
  std::vector<std::uint64_t> out;
  out.reserve(static_cast<std::size_t>(n));
  for (std::uint64_t j = total - n; j < total; ++j) {
    std::uniform_int_distribution<std::uint64_t> dist(0, j);
    std::uint64_t t = dist(rng);
    if (!chosen.insert(t).second) {
      t = j;
      chosen.insert(t);
    }
    out.push_back(t);
  }
  std::shuffle(out.begin(), out.end(), rng);
  return out;
}

std::vector<Line> JsonlIndex::sample(std::uint64_t n, std::optional<std::uint64_t> seed) const {
  auto picks = sample_lines(n, seed);
  std::vector<std::int64_t> lines(picks.begin(), picks.end());
  std::shared_lock<std::shared_mutex> lk(p_->mu);
  return p_->read_lines(lines);
}

JsonlIndex::Session JsonlIndex::open_session() const {
  std::lock_guard<std::mutex> lk(p_->handle_mu);
  if (!p_->persistent) p_->persistent = std::make_shared<SourceFile>(p_->source, p_->metrics.get());
  ++p_->sessions;
  return Session(this);
}

JsonlIndex::Session::~Session() {
  if (!owner_) return;
  auto* impl = owner_->p_;
  std::lock_guard<std::mutex> lk(impl->handle_mu);
  if (--impl->sessions == 0 && !impl->cfg.keep_open) impl->persistent.reset();
}

void JsonlIndex::close() {
  std::lock_guard<std::mutex> lk(p_->handle_mu);
  if (p_->sessions == 0) p_->persistent.reset();
}

}
