#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jr {

// Decoded JSONL line.
// Objects: one (key, value) per member in document order. Strings are
// unescaped, numbers keep their source text, nested arrays/objects are
// compact JSON. Any other top-level value becomes one field with an empty key.
struct Record {
  std::vector<std::pair<std::string, std::string>> fields;

  // True when decoding failed and the caller asked for the raw text instead.
  bool raw = false;
  std::string text;

  const std::string* get(std::string_view key) const {
    for (auto& kv : fields) if (kv.first == key) return &kv.second;
    return nullptr;
  }
};

// Default parse function (simdjson ondemand). Throws std::runtime_error on
// malformed input, trailing content, or an empty line.
Record parse_json_record(std::string_view line);

// Append `s` as a quoted, escaped JSON string.
void append_json_string(std::string& out, std::string_view s);

}
