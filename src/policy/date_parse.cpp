#include "jsonl_resumable/date_parse.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string_view>

// NOTE: small subset ISO-8601 parser (YYYY-MM-DD[THH:MM:SS[.ms]][Z]).
// Offsets are treated as Z; every stamp this library writes is UTC.

namespace jr {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  if (s.size() < 10) return std::nullopt;
  int Y,M,D,h=0,m=0,sec=0,ms=0;

  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;
  if (M < 1 || M > 12 || D < 1 || D > 31) return std::nullopt;

  size_t i = 10;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    if (i+8 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i,2), h) && s[i+2]==':' && parse_int(s.substr(i+3,2), m) && s[i+5]==':' && parse_int(s.substr(i+6,2), sec)))
      return std::nullopt;
    i += 8;
    if (i < s.size() && s[i]=='.') {
      size_t j=i+1, k=j;
      while (k < s.size() && is_digit(s[k]) && (k-j) < 3) ++k; // up to 3 digits
      int frac=0; if (!parse_int(s.substr(j,k-j), frac)) return std::nullopt;
      if ((k-j)==1) ms = frac*100;
      else if ((k-j)==2) ms = frac*10;
      else ms = frac;
      i = k;
      while (i < s.size() && is_digit(s[i])) ++i; // drop sub-millisecond digits
    }
  }

  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;
  std::time_t t = timegm(&tm);
  if (t == (std::time_t)-1) return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + ms);
}

std::string format_iso8601_ms(std::int64_t ms) {
  std::int64_t secs = ms / 1000;
  int frac = static_cast<int>(ms % 1000);
  if (frac < 0) { frac += 1000; --secs; }
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
  return buf;
}

std::string now_iso8601() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return format_iso8601_ms(static_cast<std::int64_t>(ms));
}

}
