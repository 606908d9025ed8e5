#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jr {

// Fast parse of a limited ISO-8601 subset: returns epoch millis on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

// Epoch millis -> "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_iso8601_ms(std::int64_t ms);

// Current UTC time formatted as above.
std::string now_iso8601();

}
