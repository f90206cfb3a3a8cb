#include "config/reader_config.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "errors.hpp"
#include "text/tokenizer.hpp"

namespace rsvp_reader {

namespace {

ReaderConfig from_yaml(const YAML::Node& root) {
  ReaderConfig cfg;
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) {
    throw ConfigError("reader config: top level must be a mapping");
  }

  if (const auto pacing = root["pacing"]) {
    if (pacing["words_per_minute"]) cfg.pacing.words_per_minute = pacing["words_per_minute"].as<double>();
    if (pacing["chunk_size"]) cfg.pacing.chunk_size = pacing["chunk_size"].as<int>();
    if (pacing["catch_up"]) cfg.pacing.catch_up = parse_catch_up_policy(pacing["catch_up"].as<std::string>());
  }
  if (const auto reader = root["reader"]) {
    if (reader["placeholder_text"]) cfg.placeholder_text = reader["placeholder_text"].as<std::string>();
  }
  if (const auto frame = root["frame"]) {
    if (frame["fps"]) cfg.fps = frame["fps"].as<double>();
  }
  if (const auto logging = root["logging"]) {
    if (logging["log_chunks"]) cfg.log_chunks = logging["log_chunks"].as<bool>();
  }

  cfg.validate();
  return cfg;
}

}  // namespace

void ReaderConfig::validate() const {
  try {
    validate_pacing(pacing.words_per_minute, pacing.chunk_size);
  } catch (const InvalidParameterError& e) {
    throw ConfigError(std::string("reader config: ") + e.what());
  }
  if (!std::isfinite(fps) || fps <= 0.0) {
    throw ConfigError("reader config: frame.fps must be > 0");
  }
  if (tokenize(placeholder_text).empty()) {
    throw ConfigError("reader config: reader.placeholder_text must contain at least one word");
  }
}

ReaderConfig parse_reader_config(const std::string& yaml_text) {
  try {
    return from_yaml(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("reader config: ") + e.what());
  }
}

ReaderConfig load_reader_config(const std::string& path) {
  try {
    return from_yaml(YAML::LoadFile(path));
  } catch (const YAML::BadFile&) {
    throw ConfigError("reader config: cannot open file: " + path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("reader config: " + path + ": " + e.what());
  }
}

std::vector<std::string> list_config_files(const std::string& dir) {
  namespace fs = std::filesystem;
  std::vector<std::string> files;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    const auto ext = entry.path().extension().string();
    if (ext == ".yaml" || ext == ".yml") {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

CatchUpPolicy parse_catch_up_policy(const std::string& name) {
  if (name == "fixed_step") return CatchUpPolicy::FixedStep;
  if (name == "catch_up") return CatchUpPolicy::CatchUp;
  throw ConfigError("reader config: unknown catch_up policy '" + name +
                    "' (expected fixed_step or catch_up)");
}

const char* to_string(CatchUpPolicy policy) {
  switch (policy) {
    case CatchUpPolicy::FixedStep: return "fixed_step";
    case CatchUpPolicy::CatchUp: return "catch_up";
  }
  return "unknown";
}

}  // namespace rsvp_reader
