#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "jsonl_resumable/batch_processor.hpp"
#include "jsonl_resumable/jsonl_index.hpp"

namespace jr {

// Environment overrides. Unset or empty variables leave the field alone;
// malformed values throw Error naming the variable.
//
//   JR_CHECKPOINT_INTERVAL     JsonlIndex::Config::checkpoint_interval (> 0)
//   JR_KEEP_OPEN               JsonlIndex::Config::keep_open (1/0, true/false, yes/no, on/off)
//   JR_CHUNK_BYTES             JsonlIndex::Config::chunk_bytes (> 0)
//   JR_PROGRESS_DIR            BatchProcessor::Config::progress_dir
//   JR_CHECKPOINT_EVERY_LINES  BatchProcessor::Config::checkpoint_every_lines
//   JR_CHECKPOINT_EVERY_SEC    BatchProcessor::Config::checkpoint_every (fractional seconds)
void apply_env(JsonlIndex::Config& cfg);
void apply_env(BatchProcessor::Config& cfg);

std::string env_or(const char* key, const char* defv);

std::optional<std::uint64_t> parse_u64(std::string_view s);
std::optional<double> parse_seconds(std::string_view s);   // finite, in [0, 1e9]
std::optional<bool> parse_flag(std::string_view s);

}
