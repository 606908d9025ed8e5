#include "jsonl_resumable/path_utils.hpp"
#include "jsonl_resumable/errors.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <iomanip>
#if defined(JR_USE_OPENSSL)
  #include <openssl/sha.h>
#endif

namespace jr {

std::filesystem::path default_index_path(const std::filesystem::path& source) {
  std::filesystem::path p = source;
  p += ".idx";
  return p;
}

std::filesystem::path default_progress_dir(const std::filesystem::path& source) {
  std::filesystem::path p = source;
  p += ".progress";
  return p;
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool write_file_atomic(const std::filesystem::path& p, std::string_view data,
                       std::string* err_out) {
  if (!ensure_parent_dirs(p)) {
    if (err_out) *err_out = "cannot create parent directory of " + p.string();
    return false;
  }
  std::filesystem::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      if (err_out) *err_out = "failed to open " + tmp.string();
      return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      if (err_out) *err_out = "failed to write " + tmp.string();
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    if (err_out) *err_out = "rename " + tmp.string() + " -> " + p.string() + ": " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

FileIdentity file_identity(const std::filesystem::path& p) {
  std::error_code ec;
  auto st = std::filesystem::status(p, ec);
  if (ec || !std::filesystem::exists(st))
    throw CorruptSourceError(p.string(), "file not found");
  if (!std::filesystem::is_regular_file(st))
    throw CorruptSourceError(p.string(), "not a regular file");

  FileIdentity id;
  id.size = std::filesystem::file_size(p, ec);
  if (ec) throw CorruptSourceError(p.string(), "stat failed: " + ec.message());
  auto mt = std::filesystem::last_write_time(p, ec);
  if (ec) throw CorruptSourceError(p.string(), "stat failed: " + ec.message());
  id.mtime_ns = static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(mt.time_since_epoch()).count());
  return id;
}

std::string hex_hash_prefix(std::string_view data, int len) {
#ifdef JR_USE_OPENSSL
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
#else
  // Fallback (non-crypto)
  size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << std::setw(16) << std::setfill('0') << h;
  auto s = o.str(); if ((int)s.size() > len) s.resize(len); return s;
#endif
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) {
      const bool ok = (c>='a'&&c<='z') || (c>='A'&&c<='Z') || (c>='0'&&c<='9') || c=='-' || c=='_';
      if (!ok) c = '-';
    }
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

std::string job_file_name(std::string_view job_id) {
  // The prefix alone can collide ("a/b" vs "a-b"); the hash keeps them apart.
  return make_slug(job_id, "keypath", 40) + "-" + make_slug(job_id, "hashprefix", 12) + ".json";
}

}
