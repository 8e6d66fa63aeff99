#include "args_parser.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "codec/wire_format.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"
#include "utils/transparent_hash.hpp"

namespace batchwire {

// =============================================================================
// Argument Parsing Utilities: Helpers for options taking a value
// =============================================================================

static void
check_required(
    const bool condition, const std::string& option_name,
    std::vector<std::string>& missing)
{
  if (!condition) {
    missing.push_back(option_name);
  }
}

static auto
missing_value_error(std::string_view option_name) -> bool
{
  log_error(std::string(option_name) + " option requires a value.");
  return false;
}

template <typename Func>
auto
try_parse(const char* val, Func&& parser) -> bool
{
  try {
    std::forward<Func>(parser)(val);
    return true;
  }
  catch (const std::invalid_argument& e) {
    log_error(e.what());
  }
  catch (const std::out_of_range& e) {
    log_error(e.what());
  }
  return false;
}

template <typename Func>
auto
expect_and_parse(
    std::string_view option_name, size_t& idx, std::span<char*> args,
    Func&& parser) -> bool
{
  if (idx + 1 >= args.size()) {
    return missing_value_error(option_name);
  }
  ++idx;
  return try_parse(args[idx], std::forward<Func>(parser));
}

static auto
parse_non_empty(std::string_view option_name, const char* val) -> std::string
{
  std::string value(val);
  if (value.empty()) {
    throw std::invalid_argument(
        std::string(option_name) + " must not be empty.");
  }
  return value;
}

static auto
parse_header_token(std::string_view option_name, const char* val)
    -> std::string
{
  std::string value = parse_non_empty(option_name, val);
  if (!is_header_token(value)) {
    throw std::invalid_argument(
        std::string(option_name) +
        " may only contain letters, digits, '-', '_' and '.'.");
  }
  return value;
}

static auto
parse_positive_size(std::string_view option_name, const char* val)
    -> std::size_t
{
  std::size_t consumed = 0;
  const long long value = std::stoll(val, &consumed);
  if (consumed != std::string_view(val).size() || value <= 0) {
    throw std::invalid_argument(
        std::string(option_name) + " must be a positive integer.");
  }
  return static_cast<std::size_t>(value);
}

// =============================================================================
// Individual Argument Parsers
// =============================================================================

static auto
parse_config(RuntimeConfig& opts, size_t& idx, std::span<char*> args) -> bool
{
  if (idx + 1 >= args.size()) {
    return missing_value_error("--config");
  }
  ++idx;
  opts.config_path = args[idx];
  if (!std::filesystem::exists(opts.config_path)) {
    log_error("Config file not found: " + opts.config_path);
    return false;
  }
  return true;
}

static auto
parse_input(RuntimeConfig& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& inputs = opts.input_paths;
  return expect_and_parse("--input", idx, args, [&inputs](const char* val) {
    if (inputs.size() >= kMaxInputFiles) {
      throw std::invalid_argument(
          "At most " + std::to_string(kMaxInputFiles) +
          " --input files are supported.");
    }
    inputs.push_back(parse_non_empty("--input", val));
  });
}

static auto
parse_output(RuntimeConfig& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& output = opts.output_path;
  return expect_and_parse("--output", idx, args, [&output](const char* val) {
    output = parse_non_empty("--output", val);
  });
}

static auto
parse_indices_output(RuntimeConfig& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& output = opts.indices_output_path;
  return expect_and_parse(
      "--indices-output", idx, args, [&output](const char* val) {
        output = parse_non_empty("--indices-output", val);
      });
}

static auto
parse_batch_dim(RuntimeConfig& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& batch_dim = opts.batch_dim;
  return expect_and_parse(
      "--batch-dim", idx, args, [&batch_dim](const char* val) {
        std::size_t consumed = 0;
        const int value = std::stoi(val, &consumed);
        if (consumed != std::string_view(val).size() || value < 0 ||
            value > kMaxBatchDim) {
          throw std::invalid_argument(
              "--batch-dim must be between 0 and " +
              std::to_string(kMaxBatchDim) + ".");
        }
        batch_dim = value;
      });
}

static auto
parse_meta_header(RuntimeConfig& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& header = opts.wire.meta_header;
  return expect_and_parse(
      "--meta-header", idx, args, [&header](const char* val) {
        header = parse_header_token("--meta-header", val);
      });
}

static auto
parse_namespace(RuntimeConfig& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& vendor_namespace = opts.wire.vendor_namespace;
  return expect_and_parse(
      "--namespace", idx, args, [&vendor_namespace](const char* val) {
        vendor_namespace = parse_header_token("--namespace", val);
      });
}

static auto
parse_max_parts(RuntimeConfig& opts, size_t& idx, std::span<char*> args)
    -> bool
{
  auto& max_parts = opts.wire.max_parts;
  return expect_and_parse(
      "--max-parts", idx, args, [&max_parts](const char* val) {
        max_parts = parse_positive_size("--max-parts", val);
      });
}

static auto
parse_max_message_bytes(
    RuntimeConfig& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& max_bytes = opts.wire.max_message_bytes;
  return expect_and_parse(
      "--max-message-bytes", idx, args, [&max_bytes](const char* val) {
        max_bytes = parse_positive_size("--max-message-bytes", val);
      });
}

static auto
parse_verbose(RuntimeConfig& opts, size_t& idx, std::span<char*> args) -> bool
{
  auto& verbosity = opts.verbosity;
  return expect_and_parse(
      "--verbose", idx, args, [&verbosity](const char* val) {
        verbosity = parse_verbosity_level(val);
      });
}

// =============================================================================
// Dispatch Argument Parser (Main parser loop)
// =============================================================================

static auto
parse_argument_values(std::span<char*> args_span, RuntimeConfig& opts) -> bool
{
  using Parser = bool (*)(RuntimeConfig&, size_t&, std::span<char*>);
  const static std::unordered_map<
      std::string_view, Parser, TransparentHash, std::equal_to<>>
      dispatch = {
          {"--config", parse_config},
          {"-c", parse_config},
          {"--input", parse_input},
          {"--output", parse_output},
          {"--indices-output", parse_indices_output},
          {"--batch-dim", parse_batch_dim},
          {"--meta-header", parse_meta_header},
          {"--namespace", parse_namespace},
          {"--max-parts", parse_max_parts},
          {"--max-message-bytes", parse_max_message_bytes},
          {"--verbose", parse_verbose},
      };

  for (size_t idx = 1; idx < args_span.size(); ++idx) {
    const std::string_view arg = args_span[idx];

    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
      return true;
    }
    if (auto iter = dispatch.find(arg); iter != dispatch.end()) {
      if (!iter->second(opts, idx, args_span)) {
        return false;
      }
    } else {
      log_error(
          "Unknown argument: " + std::string(arg) +
          ". Use --help to see valid options.");
      return false;
    }
  }

  return true;
}

// =============================================================================
// Config Validation: Ensures all required fields are present
// =============================================================================

static auto
validate_config(RuntimeConfig& opts) -> void
{
  std::vector<std::string> missing;
  check_required(!opts.input_paths.empty(), "--input", missing);
  check_required(!opts.output_path.empty(), "--output", missing);

  if (!missing.empty()) {
    for (const auto& opt : missing) {
      log_error(opt + " option is required.");
    }
    opts.valid = false;
  }
}

// =============================================================================
// Top-Level Entry: Parses all arguments into a RuntimeConfig object
// =============================================================================

auto
parse_arguments(std::span<char*> args_span, RuntimeConfig opts) -> RuntimeConfig
{
  if (!parse_argument_values(args_span, opts)) {
    opts.valid = false;
    return opts;
  }

  if (!opts.show_help) {
    validate_config(opts);
  }

  return opts;
}

}  // namespace batchwire
