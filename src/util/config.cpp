#include "jsonl_resumable/config.hpp"
#include "jsonl_resumable/errors.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fast_float/fast_float.h>

namespace jr {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static const char* env_get(const char* k) {
  const char* v = std::getenv(k);
  return (v && *v) ? v : nullptr;
}

[[noreturn]] static void bad_env(const char* k, const char* v, const char* expect) {
  throw Error(std::string(k) + "=\"" + v + "\": expected " + expect);
}

std::string env_or(const char* k, const char* defv) {
  const char* v = env_get(k);
  return v ? std::string(v) : std::string(defv);
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
  std::uint64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
  return out;
}

// Keeps seconds * 1000 well inside std::chrono::milliseconds.
constexpr double kMaxSeconds = 1e9;

std::optional<double> parse_seconds(std::string_view s) {
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (!std::isfinite(out) || out < 0 || out > kMaxSeconds) return std::nullopt;
  return out;
}

std::optional<bool> parse_flag(std::string_view s) {
  static constexpr std::string_view yes[] = {"1", "true", "yes", "on"};
  static constexpr std::string_view no[]  = {"0", "false", "no", "off"};
  for (auto t : yes) if (ieq(s, t)) return true;
  for (auto f : no)  if (ieq(s, f)) return false;
  return std::nullopt;
}

void apply_env(JsonlIndex::Config& cfg) {
  if (const char* v = env_get("JR_CHECKPOINT_INTERVAL")) {
    auto n = parse_u64(v);
    if (!n || *n == 0) bad_env("JR_CHECKPOINT_INTERVAL", v, "a positive integer");
    cfg.checkpoint_interval = *n;
  }
  if (const char* v = env_get("JR_KEEP_OPEN")) {
    auto b = parse_flag(v);
    if (!b) bad_env("JR_KEEP_OPEN", v, "a boolean");
    cfg.keep_open = *b;
  }
  if (const char* v = env_get("JR_CHUNK_BYTES")) {
    auto n = parse_u64(v);
    if (!n || *n == 0) bad_env("JR_CHUNK_BYTES", v, "a positive integer");
    cfg.chunk_bytes = static_cast<std::size_t>(*n);
  }
}

void apply_env(BatchProcessor::Config& cfg) {
  if (const char* v = env_get("JR_PROGRESS_DIR")) cfg.progress_dir = v;
  if (const char* v = env_get("JR_CHECKPOINT_EVERY_LINES")) {
    auto n = parse_u64(v);
    if (!n) bad_env("JR_CHECKPOINT_EVERY_LINES", v, "a non-negative integer");
    cfg.checkpoint_every_lines = *n;
  }
  if (const char* v = env_get("JR_CHECKPOINT_EVERY_SEC")) {
    auto s = parse_seconds(v);
    if (!s) bad_env("JR_CHECKPOINT_EVERY_SEC", v, "a number of seconds in [0, 1e9]");
    cfg.checkpoint_every = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(*s * 1000.0)));
  }
}

}
