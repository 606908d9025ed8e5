#include "jsonl_resumable/decode_policy.hpp"
#include "jsonl_resumable/chunk_reader.hpp"
#include "jsonl_resumable/errors.hpp"
#include <exception>
#include <string>

namespace jr {

std::optional<Record> DecodePolicy::decode(std::uint64_t line_number, std::string_view bytes) const {
  const std::string_view text = trim_eol(bytes);
  std::string why;
  try {
    return parse ? parse(text) : parse_json_record(text);
  } catch (const std::exception& e) {
    why = e.what();
  }

  switch (on_error) {
    case OnError::Raise:
      throw DecodeError(line_number, why);
    case OnError::Skip:
      return std::nullopt;
    case OnError::ReturnRaw: {
      Record r;
      r.raw = true;
      r.text = std::string(text);
      return r;
    }
  }
  throw DecodeError(line_number, why);
}

}
