#include "jsonl_resumable/chunk_reader.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/metrics.hpp"
#include <cerrno>
#include <cstring>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace jr {

SourceFile::SourceFile(std::string path, MetricsRegistry* metrics)
  : path_(std::move(path)) {
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) throw CorruptSourceError(path_, std::string("open failed: ") + std::strerror(errno));
  if (metrics) metrics->add_file_open();
}

SourceFile::~SourceFile() {
  if (f_) std::fclose(f_);
}

std::size_t SourceFile::read_at(std::uint64_t offset, char* dst, std::size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fseeko(f_, static_cast<off_t>(offset), SEEK_SET) != 0)
    throw CorruptSourceError(path_, "seek to " + std::to_string(offset) + " failed");
  std::size_t got = std::fread(dst, 1, n, f_);
  if (got < n && std::ferror(f_)) {
    std::clearerr(f_);
    throw CorruptSourceError(path_, "read failed at offset " + std::to_string(offset));
  }
  std::clearerr(f_);
  return got;
}

void SourceFile::read_exact(std::uint64_t offset, std::size_t n, std::string& out) {
  out.resize(n);
  std::size_t got = n ? read_at(offset, &out[0], n) : 0;
  if (got != n) {
    throw CorruptSourceError(path_, "short read at offset " + std::to_string(offset) +
                             " (wanted " + std::to_string(n) + ", got " + std::to_string(got) + ")");
  }
}

struct ChunkReader::Impl {
  SourceFile& file;
  Config cfg;
  std::uint64_t end;
  std::uint64_t pos;        // file offset of buf[head]
  std::uint64_t bytes{0};
  std::vector<char> buf;
  std::size_t head{0};
  std::size_t tail{0};

  Impl(SourceFile& f, std::uint64_t start, std::uint64_t e, Config c)
    : file(f), cfg(c), end(e), pos(start) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 512 * 1024;
  }

  // Refill the window from `pos`; returns false at `end`.
  bool fill() {
    if (pos >= end) return false;
    std::uint64_t want64 = end - pos;
    std::size_t want = want64 < cfg.chunk_bytes ? static_cast<std::size_t>(want64) : cfg.chunk_bytes;
    if (buf.size() < cfg.chunk_bytes) buf.resize(cfg.chunk_bytes);
    std::size_t n = file.read_at(pos, buf.data(), want);
    if (n == 0) {
      throw CorruptSourceError(file.path(), "unexpected EOF at offset " + std::to_string(pos) +
                               " (expected data up to " + std::to_string(end) + ")");
    }
    bytes += n;
    head = 0;
    tail = n;
    return true;
  }

  bool next(LineSpan& out, std::string* content) {
    if (content) content->clear();
    if (head == tail && !fill()) return false;

    const std::uint64_t start = pos;
    while (true) {
      const char* base = buf.data() + head;
      const std::size_t avail = tail - head;
      const void* hit = std::memchr(base, '\n', avail);
      std::size_t take = hit ? static_cast<std::size_t>(static_cast<const char*>(hit) - base) + 1 : avail;
      if (content) content->append(base, take);
      head += take;
      pos += take;
      if (hit) break;
      // Unterminated so far: keep going until newline or `end`.
      if (!fill()) break;
    }
    out.offset = start;
    out.length = pos - start;
    return true;
  }
};

ChunkReader::ChunkReader(SourceFile& file, std::uint64_t start, std::uint64_t end)
  : ChunkReader(file, start, end, Config{}) {}

ChunkReader::ChunkReader(SourceFile& file, std::uint64_t start, std::uint64_t end, Config cfg)
  : p_(new Impl(file, start, end, cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::next(LineSpan& out, std::string* content) { return p_->next(out, content); }

std::uint64_t ChunkReader::skip(std::uint64_t n) {
  std::uint64_t done = 0;
  LineSpan s;
  while (done < n && p_->next(s, nullptr)) ++done;
  return done;
}

void ChunkReader::for_each_line(const LineCallback& cb) {
  LineSpan s;
  while (p_->next(s, nullptr)) {
    if (!cb(s)) break;
  }
}

std::uint64_t ChunkReader::position() const noexcept { return p_->pos; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

std::string_view trim_eol(std::string_view line) noexcept {
  if (!line.empty() && line.back() == '\n') line.remove_suffix(1);
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

}
