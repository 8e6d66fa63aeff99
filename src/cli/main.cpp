#include <cstddef>
#include <exception>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include "args_parser.hpp"
#include "containers/container_registry.hpp"
#include "merge_command.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

#ifdef BATCHWIRE_WITH_TORCH
#include "containers/torch_tensor_container.hpp"
#endif

auto
main(int argc, char* argv[]) -> int
{
  std::span<char*> args_span(argv, static_cast<size_t>(argc));

  std::string config_path;
  auto args_without_program = args_span.subspan(1);
  for (auto it = args_without_program.begin(); it != args_without_program.end();
       ++it) {
    std::string_view arg(*it);
    if (arg == "--config" || arg == "-c") {
      if (auto value_it = std::next(it);
          value_it != args_without_program.end()) {
        config_path = *value_it;
      }
      break;
    }
  }

  batchwire::RuntimeConfig opts;
  if (!config_path.empty()) {
    opts = batchwire::load_config(config_path);
    opts.config_path = config_path;
  }

  if (opts.valid) {
    opts = batchwire::parse_arguments(args_span, opts);
  }

  if (opts.show_help) {
    batchwire::display_help("batchwire_merge");
    return 0;
  }

  if (!opts.valid) {
    batchwire::log_error("Invalid program options.");
    return 1;
  }

  batchwire::log_info(
      opts.verbosity,
      "Inputs          : " + std::to_string(opts.input_paths.size()));
  batchwire::log_info(
      opts.verbosity, "Batch dimension : " + std::to_string(opts.batch_dim));
  batchwire::log_info(
      opts.verbosity, "Vendor namespace: " + opts.wire.vendor_namespace);

  try {
    auto registry = batchwire::make_default_registry();
#ifdef BATCHWIRE_WITH_TORCH
    batchwire::register_torch_containers(*registry);
#endif
    batchwire::run_merge(opts, *registry);
  }
  catch (const batchwire::BatchProtocolException& e) {
    batchwire::log_error(std::string("Protocol Error: ") + e.what());
    return 2;
  }
  catch (const std::exception& e) {
    batchwire::log_error(std::string("General Error: ") + e.what());
    return 1;
  }

  return 0;
}
