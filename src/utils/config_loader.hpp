#pragma once
#include <string>

#include "runtime_config.hpp"

namespace batchwire {

// Loads a YAML configuration file. Problems are logged and reported through
// RuntimeConfig::valid rather than thrown.
auto load_config(const std::string& path) -> RuntimeConfig;

}  // namespace batchwire
