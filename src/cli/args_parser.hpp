#pragma once
#include <span>
#include <string>

#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace batchwire {

inline auto
get_help_message(const char* prog_name) -> std::string
{
  std::string msg = "Usage: ";
  msg += prog_name;
  msg +=
      " [OPTIONS]\n"
      "\nMerges several encoded calls into one batched call.\n"
      "\nOptions:\n"
      "  --config, -c [file]     YAML configuration file\n"
      "  --input [file]          Encoded call to merge (repeatable, in call "
      "order)\n"
      "  --output [file]         Destination of the batched message\n"
      "  --indices-output [file] Write the per-call row counts as JSON\n"
      "  --batch-dim N           Dimension along which calls are merged "
      "(default: 0)\n"
      "  --meta-header NAME      Part header carrying payload metadata\n"
      "                          (default: Payload-Meta)\n"
      "  --namespace NS          Vendor namespace of part content types\n"
      "                          (default: batchwire)\n"
      "  --max-parts N           Maximum parts per message (default: 256)\n"
      "  --max-message-bytes N   Maximum body size per message\n"
      "  --verbose [0-4]         Verbosity level: 0=silent to 4=trace\n"
      "  --help                  Show this help message\n";
  return msg;
}

inline void
display_help(const char* prog_name)
{
  log_info(VerbosityLevel::Info, get_help_message(prog_name));
}

// Inputs listed in the configuration file and on the command line accumulate.
auto parse_arguments(std::span<char*> args_span, RuntimeConfig opts = {})
    -> RuntimeConfig;
}  // namespace batchwire
