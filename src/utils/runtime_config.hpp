#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "codec/wire_format.hpp"
#include "logger.hpp"

namespace batchwire {
// =============================================================================
// Compile-time limits for the merge tool
// =============================================================================
inline constexpr int kMaxBatchDim = 8;
inline constexpr std::size_t kMaxInputFiles = 1024;

// =============================================================================
// RuntimeConfig
// -----------------------------------------------------------------------------
// Options of the batchwire_merge tool, filled from the YAML configuration file
// and then overridden by command line arguments.
//
// Contains:
//   - Input wire messages and output destinations
//   - Batch dimension used by the containers
//   - Wire format (header names, vendor namespace, decode limits)
//   - Logging level
// =============================================================================
struct RuntimeConfig {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string output_path;
  std::string indices_output_path;

  int batch_dim = 0;
  WireFormat wire;

  VerbosityLevel verbosity = VerbosityLevel::Info;
  bool show_help = false;
  bool valid = true;
};

}  // namespace batchwire
