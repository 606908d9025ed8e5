#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace jr {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Line argument outside [0, total_lines).
struct LineOutOfRangeError : Error {
  LineOutOfRangeError(std::int64_t line, std::uint64_t total)
    : Error("line " + std::to_string(line) + " out of range (total_lines=" +
            std::to_string(total) + ")"),
      line(line), total_lines(total) {}
  std::int64_t line;
  std::uint64_t total_lines;
};

// Record bytes rejected by the parse function.
struct DecodeError : Error {
  DecodeError(std::uint64_t line, const std::string& why)
    : Error("decode failed at line " + std::to_string(line) + ": " + why),
      line_number(line) {}
  std::uint64_t line_number;
};

// Data file missing, unreadable, or shorter than the index says.
struct CorruptSourceError : Error {
  CorruptSourceError(std::string path, const std::string& why)
    : Error(path + ": " + why), path(std::move(path)) {}
  std::string path;
};

// Sidecar or progress record that cannot be trusted.
struct InvalidCheckpointError : Error {
  using Error::Error;
};

// Job progress recorded against a different version of the data file.
struct StaleCheckpointError : Error {
  using Error::Error;
};

struct SampleSizeError : Error {
  SampleSizeError(std::uint64_t n, std::uint64_t total)
    : Error("sample size " + std::to_string(n) + " exceeds total_lines " +
            std::to_string(total)) {}
};

}
