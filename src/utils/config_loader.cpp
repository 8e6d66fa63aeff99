#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>

#include "codec/wire_format.hpp"
#include "logger.hpp"
#include "transparent_hash.hpp"

namespace batchwire {

namespace {

void
parse_verbosity(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["verbose"]) {
    cfg.verbosity = parse_verbosity_level(root["verbose"].as<std::string>());
  } else if (root["verbosity"]) {
    cfg.verbosity = parse_verbosity_level(root["verbosity"].as<std::string>());
  }
}

auto
validate_allowed_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  static const std::unordered_set<std::string, TransparentHash, std::equal_to<>>
      kAllowedKeys{
          "verbose",          "verbosity", "batch_dim",
          "meta_header",      "vendor_namespace",
          "max_parts",        "max_message_bytes",
          "inputs",           "output",    "indices_output"};

  for (const auto& kvalue : root) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (!kAllowedKeys.contains(key)) {
      log_error(std::string("Unknown configuration option: ") + key);
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

auto
parse_positive_size(const YAML::Node& node, std::string_view key)
    -> std::size_t
{
  const auto value = node.as<long long>();
  if (value <= 0) {
    throw std::invalid_argument(std::string(key) + " must be > 0");
  }
  return static_cast<std::size_t>(value);
}

void
parse_batch_dim(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (!root["batch_dim"]) {
    return;
  }
  cfg.batch_dim = root["batch_dim"].as<int>();
  if (cfg.batch_dim < 0 || cfg.batch_dim > kMaxBatchDim) {
    log_error(
        "batch_dim must be between 0 and " + std::to_string(kMaxBatchDim));
    cfg.valid = false;
  }
}

void
parse_wire_format(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["meta_header"]) {
    cfg.wire.meta_header = root["meta_header"].as<std::string>();
    if (!is_header_token(cfg.wire.meta_header)) {
      log_error("meta_header must be a non-empty header token");
      cfg.valid = false;
    }
  }
  if (root["vendor_namespace"]) {
    cfg.wire.vendor_namespace = root["vendor_namespace"].as<std::string>();
    if (!is_header_token(cfg.wire.vendor_namespace)) {
      log_error("vendor_namespace must be a non-empty media type token");
      cfg.valid = false;
    }
  }
  if (root["max_parts"]) {
    cfg.wire.max_parts = parse_positive_size(root["max_parts"], "max_parts");
  }
  if (root["max_message_bytes"]) {
    cfg.wire.max_message_bytes =
        parse_positive_size(root["max_message_bytes"], "max_message_bytes");
  }
}

void
parse_io_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (const YAML::Node inputs = root["inputs"]; inputs) {
    if (!inputs.IsSequence()) {
      log_error("inputs must be a sequence of file paths");
      cfg.valid = false;
      return;
    }
    if (inputs.size() > kMaxInputFiles) {
      log_error(
          "inputs must list at most " + std::to_string(kMaxInputFiles) +
          " files");
      cfg.valid = false;
      return;
    }
    cfg.input_paths.clear();
    for (const auto& entry : inputs) {
      cfg.input_paths.push_back(entry.as<std::string>());
    }
  }
  if (root["output"]) {
    cfg.output_path = root["output"].as<std::string>();
  }
  if (root["indices_output"]) {
    cfg.indices_output_path = root["indices_output"].as<std::string>();
  }
}

}  // namespace

auto
load_config(const std::string& path) -> RuntimeConfig
{
  RuntimeConfig cfg;
  const auto mark_invalid = [&cfg](const std::string& message) {
    log_error(std::string("Failed to load config: ") + message);
    cfg.valid = false;
  };
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (!root || !root.IsMap()) {
      log_error("Config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    parse_verbosity(root, cfg);
    if (!validate_allowed_keys(root, cfg)) {
      return cfg;
    }
    parse_batch_dim(root, cfg);
    parse_wire_format(root, cfg);
    parse_io_nodes(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }
  return cfg;
}

}  // namespace batchwire
