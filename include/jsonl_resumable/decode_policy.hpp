#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "jsonl_resumable/json_record.hpp"

namespace jr {

// Pluggable parse function: line text (terminator trimmed) -> Record.
// Signals failure by throwing any std::exception.
using ParseFn = std::function<Record(std::string_view)>;

struct DecodePolicy {
  // Behavior when a line fails to parse:
  // Raise -> DecodeError; Skip -> no record; ReturnRaw -> Record{raw=true, text}
  enum class OnError { Raise, Skip, ReturnRaw };

  OnError on_error = OnError::Raise;
  ParseFn parse;   // empty -> parse_json_record

  // Decode one line's bytes (terminator included or not). nullopt only
  // under Skip. Throws DecodeError under Raise.
  std::optional<Record> decode(std::uint64_t line_number, std::string_view bytes) const;
};

using OnDecodeError = DecodePolicy::OnError;

}
