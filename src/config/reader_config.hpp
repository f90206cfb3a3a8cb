#pragma once

#include <string>
#include <vector>

#include "pacing/pacing_clock.hpp"
#include "runtime/reader.hpp"

namespace rsvp_reader {

/// Everything the command-line front end reads from a YAML config file.
///
/// Example (configs/default_reader.yaml):
///
///   pacing:
///     words_per_minute: 300
///     chunk_size: 1
///     catch_up: fixed_step      # or catch_up
///   reader:
///     placeholder_text: "Upload a document to begin."
///   frame:
///     fps: 60
///   logging:
///     log_chunks: false
///
/// Every key is optional; missing keys keep the defaults below.
struct ReaderConfig {
  PacingConfig pacing;
  std::string placeholder_text = Reader::kDefaultPlaceholder;
  double fps = 60.0;
  bool log_chunks = false;

  /// Throws ConfigError if any value is out of range.
  void validate() const;
};

/// Parse a config from YAML text. Throws ConfigError.
ReaderConfig parse_reader_config(const std::string& yaml_text);

/// Load a config file. Throws ConfigError if it cannot be read or parsed.
ReaderConfig load_reader_config(const std::string& path);

/// Sorted list of *.yaml / *.yml files in `dir` (empty if it does not exist).
std::vector<std::string> list_config_files(const std::string& dir);

CatchUpPolicy parse_catch_up_policy(const std::string& name);
const char* to_string(CatchUpPolicy policy);

}  // namespace rsvp_reader
