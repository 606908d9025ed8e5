#include "jsonl_resumable/chunk_reader.hpp"
#include "jsonl_resumable/config.hpp"
#include "jsonl_resumable/decode_policy.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/json_record.hpp"
#include "jsonl_resumable/jsonl_index.hpp"
#include "jsonl_resumable/path_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string command;                 // info|read|sample
  std::string file;
  std::vector<std::string> args;       // positional after <file>
  std::optional<std::uint64_t> interval;
  std::string index_path;
  std::optional<std::uint64_t> seed;
  bool json = false;
  bool verbose = false;
};

void usage(std::ostream& os) {
  os <<
    "Usage: jsonl-index info   <file> [--json]\n"
    "       jsonl-index read   <file> <line>...\n"
    "       jsonl-index sample <file> <n> [--seed=S] [--json]\n"
    "Options: [--interval=N] [--index=PATH] [--verbose]\n";
}

[[noreturn]] void die_usage(const std::string& msg) {
  std::cerr << "[jsonl-index] " << msg << "\n";
  usage(std::cerr);
  std::exit(2);
}

std::uint64_t to_u64(const std::string& flag, const std::string& v) {
  auto n = jr::parse_u64(v);
  if (!n) die_usage(flag + " expects a non-negative integer, got \"" + v + "\"");
  return *n;
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  std::vector<std::string> pos;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--interval=", &v)) { c.interval = to_u64("--interval", v); continue; }
    if (eat("--index=", &c.index_path)) continue;
    if (eat("--seed=", &v)) { c.seed = to_u64("--seed", v); continue; }
    if (a == "--json")    { c.json = true; continue; }
    if (a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.size() > 1 && a[0] == '-' && a[1] == '-') die_usage("unknown option " + a);
    pos.push_back(std::move(a));
  }
  if (pos.size() < 2) die_usage("missing command or file");
  c.command = pos[0];
  c.file = pos[1];
  c.args.assign(pos.begin() + 2, pos.end());
  return c;
}

jr::JsonlIndex::Config index_config(const Cli& c) {
  jr::JsonlIndex::Config cfg;
  jr::apply_env(cfg);
  if (c.interval) cfg.checkpoint_interval = *c.interval;
  cfg.index_path = c.index_path;
  cfg.rebuild_on_invalid = true;
  cfg.verbose = c.verbose;
  return cfg;
}

std::string format_size(std::uint64_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double size = static_cast<double>(bytes);
  for (const char* u : units) {
    if (size < 1024) {
      char buf[32];
      if (u == units[0]) std::snprintf(buf, sizeof buf, "%llu B", static_cast<unsigned long long>(bytes));
      else std::snprintf(buf, sizeof buf, "%.1f %s", size, u);
      return buf;
    }
    size /= 1024;
  }
  char buf[32];
  std::snprintf(buf, sizeof buf, "%.1f PB", size);
  return buf;
}

int cmd_info(const Cli& c) {
  auto cfg = index_config(c);
  const std::string idx_path = cfg.index_path.empty()
      ? jr::default_index_path(std::filesystem::absolute(c.file).lexically_normal()).string()
      : cfg.index_path;
  std::error_code ec;
  const bool index_existed = std::filesystem::exists(idx_path, ec);

  jr::JsonlIndex index(c.file, cfg);
  const jr::IndexMeta m = index.meta();

  if (c.json) {
    std::string o = "{\"file\":";
    jr::append_json_string(o, index.source_path());
    o += ",\"lines\":" + std::to_string(m.total_lines);
    o += ",\"size_bytes\":" + std::to_string(m.identity.size);
    o += ",\"index_path\":"; jr::append_json_string(o, index.index_path());
    o += std::string(",\"index_exists\":") + (index_existed ? "true" : "false");
    o += ",\"checkpoint_interval\":" + std::to_string(m.checkpoint_interval);
    o += ",\"checkpoints\":" + std::to_string(m.checkpoints.size());
    o += ",\"indexed_at\":"; jr::append_json_string(o, m.indexed_at);
    o += "}";
    std::cout << o << "\n";
  } else {
    std::cout << "File: " << index.source_path() << "\n"
              << "Lines: " << m.total_lines << "\n"
              << "Size: " << format_size(m.identity.size) << "\n"
              << "Index: " << index.index_path() << (index_existed ? "" : " (created)") << "\n"
              << "Checkpoints: " << m.checkpoints.size()
              << " (every " << m.checkpoint_interval << " lines)\n";
  }
  return 0;
}

int cmd_read(const Cli& c) {
  if (c.args.empty()) die_usage("read: no line numbers given");
  std::vector<std::int64_t> lines;
  for (const auto& a : c.args) {
    try {
      std::size_t used = 0;
      long long n = std::stoll(a, &used);
      if (used != a.size()) throw std::invalid_argument(a);
      lines.push_back(n);
    } catch (const std::logic_error&) {
      die_usage("read: bad line number \"" + a + "\"");
    }
  }

  jr::JsonlIndex index(c.file, index_config(c));
  jr::DecodePolicy policy;
  int rc = 0;
  for (auto n : lines) {
    try {
      const std::string bytes = index.read(n);
      // Validity check only; the line is printed as stored.
      policy.decode(static_cast<std::uint64_t>(n), bytes);
      std::cout << jr::trim_eol(bytes) << "\n";
    } catch (const jr::LineOutOfRangeError& e) {
      std::cerr << "[jsonl-index] " << e.what() << "\n";
      rc = 1;
    } catch (const jr::DecodeError& e) {
      std::cerr << "[jsonl-index] " << e.what() << "\n";
      rc = 1;
    }
  }
  return rc;
}

int cmd_sample(const Cli& c) {
  if (c.args.size() != 1) die_usage("sample: expected exactly one sample size");
  const std::uint64_t n = to_u64("sample size", c.args[0]);

  jr::JsonlIndex index(c.file, index_config(c));
  const auto picked = index.sample(n, c.seed);

  if (c.json) {
    std::string o = "[";
    for (std::size_t i = 0; i < picked.size(); ++i) {
      if (i) o += ",";
      o += "{\"line\":" + std::to_string(picked[i].record.line_number) + ",\"text\":";
      jr::append_json_string(o, jr::trim_eol(picked[i].bytes));
      o += "}";
    }
    o += "]";
    std::cout << o << "\n";
  } else {
    for (const auto& l : picked) std::cout << jr::trim_eol(l.bytes) << "\n";
  }
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli = parse_cli(argc, argv);
  try {
    if (cli.command == "info")   return cmd_info(cli);
    if (cli.command == "read")   return cmd_read(cli);
    if (cli.command == "sample") return cmd_sample(cli);
  } catch (const jr::Error& e) {
    std::cerr << "[jsonl-index] " << e.what() << "\n";
    return 1;
  }
  die_usage("unknown command \"" + cli.command + "\"");
}
