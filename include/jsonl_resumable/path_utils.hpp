#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "jsonl_resumable/index_meta.hpp"

namespace jr {

// "<source>.idx"
std::filesystem::path default_index_path(const std::filesystem::path& source);

// "<source>.progress" (a directory)
std::filesystem::path default_progress_dir(const std::filesystem::path& source);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Write `data` to a sibling temp file and rename it over `p`.
bool write_file_atomic(const std::filesystem::path& p, std::string_view data,
                       std::string* err_out = nullptr);

// Live (size, mtime) of a regular file. Throws CorruptSourceError if the
// file is missing or not a regular file.
FileIdentity file_identity(const std::filesystem::path& p);

// Slug generation: "hashprefix" or "keypath" (sanitized key, truncated).
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Hash helper (stable) used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

// File name for a job record: readable prefix + hash, safe on any filesystem.
std::string job_file_name(std::string_view job_id);

}
