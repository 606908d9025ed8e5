#include "jsonl_resumable/index_codec.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/json_record.hpp"
#include "jsonl_resumable/path_utils.hpp"

#include <simdjson.h>
#include <cstdint>
#include <string>

namespace jr {

std::string IndexCodec::to_json(const IndexMeta& m) {
  std::string o;
  o.reserve(256 + m.checkpoints.size() * 24);
  o += "{\"format_version\":" + std::to_string(IndexMeta::kFormatVersion) + ",";
  o += "\"source_path\":"; append_json_string(o, m.source_path); o += ",";
  o += "\"source_size\":" + std::to_string(m.identity.size) + ",";
  o += "\"source_mtime_ns\":" + std::to_string(m.identity.mtime_ns) + ",";
  o += "\"total_lines\":" + std::to_string(m.total_lines) + ",";
  o += "\"checkpoint_interval\":" + std::to_string(m.checkpoint_interval) + ",";
  o += "\"indexed_at\":"; append_json_string(o, m.indexed_at); o += ",";

  o += "\"checkpoints\":[";
  for (std::size_t i = 0; i < m.checkpoints.size(); ++i) {
    if (i) o += ",";
    o += "[" + std::to_string(m.checkpoints[i].line) + "," +
         std::to_string(m.checkpoints[i].offset) + "]";
  }
  o += "]}";
  return o;
}

void IndexCodec::validate(const IndexMeta& m, const std::string& origin) {
  auto fail = [&](const std::string& why) {
    throw InvalidCheckpointError(origin + ": " + why);
  };
  if (m.checkpoint_interval == 0) fail("checkpoint_interval must be > 0");

  const auto& cps = m.checkpoints;
  if (m.total_lines == 0) {
    if (!cps.empty()) fail("checkpoints present for an empty file");
    return;
  }
  if (cps.empty()) fail("no checkpoints for " + std::to_string(m.total_lines) + " lines");
  if (cps[0].line != 0 || cps[0].offset != 0) fail("first checkpoint must be [0,0]");

  for (std::size_t i = 0; i < cps.size(); ++i) {
    const Checkpoint& c = cps[i];
    if (i > 0) {
      if (c.line <= cps[i-1].line) fail("checkpoint lines not strictly increasing at entry " + std::to_string(i));
      if (c.offset <= cps[i-1].offset) fail("checkpoint offsets not strictly increasing at entry " + std::to_string(i));
    }
    if (c.line >= m.total_lines) fail("checkpoint line " + std::to_string(c.line) + " beyond total_lines");
    if (c.offset >= m.identity.size) fail("checkpoint offset " + std::to_string(c.offset) + " beyond source_size");
    const bool last = (i + 1 == cps.size());
    if (!last && c.line % m.checkpoint_interval != 0)
      fail("checkpoint line " + std::to_string(c.line) + " off the interval stride");
  }
  if (cps.back().line != m.total_lines - 1) fail("last checkpoint is not the last line");

  // Every stride line must be present.
  const std::uint64_t expect = (m.total_lines - 1) / m.checkpoint_interval + 1 +
                               ((m.total_lines - 1) % m.checkpoint_interval ? 1 : 0);
  if (cps.size() != expect) fail("checkpoint table has gaps");
}

IndexMeta IndexCodec::from_json(std::string_view json, const std::string& origin) {
  IndexMeta m;
  bool has_version = false, has_path = false, has_size = false, has_mtime = false,
       has_total = false, has_interval = false, has_cps = false;

  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    simdjson::ondemand::document doc = parser.iterate(padded);
    simdjson::ondemand::object root = doc.get_object();

    for (simdjson::ondemand::field f : root) {
      std::string_view key = f.unescaped_key();
      simdjson::ondemand::value v = f.value();
      if (key == "format_version") {
        std::int64_t ver = v.get_int64();
        if (ver != IndexMeta::kFormatVersion)
          throw InvalidCheckpointError(origin + ": unsupported format_version " + std::to_string(ver));
        has_version = true;
      } else if (key == "source_path") {
        m.source_path = std::string(std::string_view(v.get_string()));
        has_path = true;
      } else if (key == "source_size") {
        m.identity.size = v.get_uint64();
        has_size = true;
      } else if (key == "source_mtime_ns") {
        m.identity.mtime_ns = v.get_int64();
        has_mtime = true;
      } else if (key == "total_lines") {
        m.total_lines = v.get_uint64();
        has_total = true;
      } else if (key == "checkpoint_interval") {
        m.checkpoint_interval = v.get_uint64();
        has_interval = true;
      } else if (key == "indexed_at") {
        m.indexed_at = std::string(std::string_view(v.get_string()));
      } else if (key == "checkpoints") {
        simdjson::ondemand::array arr = v.get_array();
        for (simdjson::ondemand::value entry : arr) {
          simdjson::ondemand::array pair = entry.get_array();
          std::uint64_t vals[2];
          std::size_t n = 0;
          for (simdjson::ondemand::value x : pair) {
            if (n >= 2) throw InvalidCheckpointError(origin + ": checkpoint entry with more than 2 values");
            vals[n++] = x.get_uint64();
          }
          if (n != 2) throw InvalidCheckpointError(origin + ": checkpoint entry with fewer than 2 values");
          m.checkpoints.push_back(Checkpoint{vals[0], vals[1]});
        }
        has_cps = true;
      }
      // unknown keys are ignored (forward-compatible additions)
    }
    if (!doc.at_end()) throw InvalidCheckpointError(origin + ": trailing content");
  } catch (const simdjson::simdjson_error& e) {
    throw InvalidCheckpointError(origin + ": malformed index document: " + e.what());
  }

  if (!has_version) throw InvalidCheckpointError(origin + ": missing format_version");
  if (!has_path)    throw InvalidCheckpointError(origin + ": missing source_path");
  if (!has_size)    throw InvalidCheckpointError(origin + ": missing source_size");
  if (!has_mtime)   throw InvalidCheckpointError(origin + ": missing source_mtime_ns");
  if (!has_total)   throw InvalidCheckpointError(origin + ": missing total_lines");
  if (!has_interval) throw InvalidCheckpointError(origin + ": missing checkpoint_interval");
  if (!has_cps)     throw InvalidCheckpointError(origin + ": missing checkpoints");

  validate(m, origin);
  return m;
}

void IndexCodec::save(const IndexMeta& meta, const std::filesystem::path& path) {
  validate(meta, path.string());
  std::string err;
  if (!write_file_atomic(path, to_json(meta), &err))
    throw Error("index save failed: " + err);
}

IndexMeta IndexCodec::load(const std::filesystem::path& path) {
  simdjson::padded_string text;
  auto err = simdjson::padded_string::load(path.string()).get(text);
  if (err) throw InvalidCheckpointError(path.string() + ": unreadable: " + simdjson::error_message(err));
  return from_json(std::string_view(text), path.string());
}

}
