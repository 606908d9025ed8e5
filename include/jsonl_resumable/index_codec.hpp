#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "jsonl_resumable/index_meta.hpp"

namespace jr {

// Sidecar codec:
// {"format_version":1,"source_path":"..","source_size":N,"source_mtime_ns":N,
//  "total_lines":N,"checkpoint_interval":N,"indexed_at":"..",
//  "checkpoints":[[line,offset],...]}
class IndexCodec {
public:
  static std::string to_json(const IndexMeta& meta);

  // Throws InvalidCheckpointError on malformed, version-incompatible or
  // inconsistent documents. `origin` only labels error messages.
  static IndexMeta from_json(std::string_view json, const std::string& origin = "<memory>");

  // Structural checks shared by from_json and save.
  static void validate(const IndexMeta& meta, const std::string& origin);

  // Atomic replace. Throws Error on I/O failure.
  static void save(const IndexMeta& meta, const std::filesystem::path& path);

  // Throws InvalidCheckpointError (including when the file is unreadable).
  static IndexMeta load(const std::filesystem::path& path);
};

}
