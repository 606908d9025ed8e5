#include "jsonl_resumable/chunk_reader.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/metrics.hpp"
#include "test_support.hpp"

#include <vector>

using jr_test::TempDir;

static int split_lines(std::size_t chunk) {
  TempDir dir("chunk");
  const fs::path f = dir / "mixed.jsonl";
  jr_test::write_text(f, "a\nbb\r\nccc");

  jr::SourceFile file(f.string());
  jr::ChunkReader::Config cfg;
  cfg.chunk_bytes = chunk;
  jr::ChunkReader r(file, 0, fs::file_size(f), cfg);

  std::vector<jr::LineSpan> spans;
  std::vector<std::string> text;
  jr::LineSpan s;
  std::string content;
  while (r.next(s, &content)) { spans.push_back(s); text.push_back(content); }

  JR_CHECK(spans.size() == 3, "chunk=" << chunk << ": expected 3 lines, got " << spans.size());
  JR_CHECK(spans[0].offset == 0 && spans[0].length == 2, "chunk=" << chunk << ": line 0 span");
  JR_CHECK(spans[1].offset == 2 && spans[1].length == 4, "chunk=" << chunk << ": line 1 span (CRLF kept)");
  JR_CHECK(spans[2].offset == 6 && spans[2].length == 3, "chunk=" << chunk << ": unterminated last line");
  JR_CHECK(text[1] == "bb\r\n", "chunk=" << chunk << ": line 1 bytes");
  JR_CHECK(jr::trim_eol(text[1]) == "bb", "trim_eol strips CRLF");
  JR_CHECK(jr::trim_eol(text[2]) == "ccc", "trim_eol leaves unterminated text");
  JR_CHECK(r.bytes_read() == 9, "bytes_read counts every byte once");
  return 0;
}

static int bounded_and_truncated() {
  TempDir dir("chunk");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, "one\ntwo\nthree\n");

  jr::MetricsRegistry m;
  jr::SourceFile file(f.string(), &m);
  JR_CHECK(m.file_opens() == 1, "open counted");

  {
    jr::ChunkReader r(file, 4, 8);
    jr::LineSpan s;
    JR_CHECK(r.next(s) && s.offset == 4 && s.length == 4, "reads [4,8) as one line");
    JR_CHECK(!r.next(s), "stops at end bound");
  }
  {
    jr::ChunkReader r(file, 0, 14);
    JR_CHECK(r.skip(2) == 2, "skip two lines");
    jr::LineSpan s;
    JR_CHECK(r.position() == 8, "position after skip");
    JR_CHECK(r.next(s) && s.offset == 8, "third line after skip");
    JR_CHECK(r.skip(5) == 0, "skip past end");
  }
  {
    jr::ChunkReader r(file, 0, 100);
    bool threw = jr_test::throws<jr::CorruptSourceError>([&]{
      jr::LineSpan s;
      while (r.next(s)) {}
    });
    JR_CHECK(threw, "EOF before the end bound raises CorruptSourceError");
  }
  {
    jr::ChunkReader r(file, 0, 0);
    jr::LineSpan s;
    JR_CHECK(!r.next(s), "empty range yields nothing");
  }
  {
    std::size_t seen = 0;
    jr::ChunkReader r(file, 0, 14);
    r.for_each_line([&](const jr::LineSpan&){ return ++seen < 2; });
    JR_CHECK(seen == 2, "for_each_line stops when the callback returns false");
  }

  std::string out;
  file.read_exact(4, 3, out);
  JR_CHECK(out == "two", "read_exact");
  JR_CHECK(jr_test::throws<jr::CorruptSourceError>([&]{ file.read_exact(10, 10, out); }),
           "short read_exact raises");
  JR_CHECK(jr_test::throws<jr::CorruptSourceError>([&]{ jr::SourceFile missing((dir / "nope").string()); }),
           "missing file raises");
  return 0;
}

int main() {
  for (std::size_t chunk : {std::size_t{1}, std::size_t{3}, std::size_t{512 * 1024}}) {
    if (split_lines(chunk)) return 1;
  }
  if (bounded_and_truncated()) return 1;
  std::cout << "[PASS] chunk_reader\n";
  return 0;
}
