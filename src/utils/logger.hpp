#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace batchwire {
// Logging utilities
// -----------------
// Progress of the protocol goes to stdout, gated by the configured verbosity.
// Failures go to stderr unconditionally. One mutex serializes both streams so
// that lines from concurrent aggregations stay whole.

inline std::mutex log_mutex;

enum class VerbosityLevel : std::uint8_t {
  Silent = 0,
  Info = 1,
  Stats = 2,
  Debug = 3,
  Trace = 4
};

struct VerbosityStyle {
  std::string_view name;
  const char* color;
  const char* label;
};

// Indexed by the numeric level.
inline constexpr std::array<VerbosityStyle, 5> kVerbosityStyles{{
    {"silent", "", ""},
    {"info", "\x1b[1;32m", "[INFO] "},
    {"stats", "\x1b[1;35m", "[STATS] "},
    {"debug", "\x1b[1;34m", "[DEBUG] "},
    {"trace", "\x1b[1;90m", "[TRACE] "},
}};

// =============================================================================
// Parsing: accepts a level number (0-4) or its name, case-insensitively
// =============================================================================

inline auto
parse_verbosity_level(const std::string& val) -> VerbosityLevel
{
  constexpr std::string_view kSpaces = " \t\n\r\f\v";
  const auto first = val.find_first_not_of(kSpaces);
  const std::string trimmed =
      first == std::string::npos
          ? std::string{}
          : val.substr(first, val.find_last_not_of(kSpaces) - first + 1);

  std::string lower = trimmed;
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (std::size_t level = 0; level < kVerbosityStyles.size(); ++level) {
    if (lower == kVerbosityStyles[level].name ||
        lower == std::to_string(level)) {
      return static_cast<VerbosityLevel>(level);
    }
  }
  throw std::invalid_argument("Invalid verbosity level: " + trimmed);
}

inline auto
verbosity_style(const VerbosityLevel level)
    -> std::pair<const char*, const char*>
{
  const auto index = static_cast<std::size_t>(std::to_underlying(level));
  if (index == 0 || index >= kVerbosityStyles.size()) {
    return {"", ""};
  }
  return {kVerbosityStyles[index].color, kVerbosityStyles[index].label};
}

inline auto
should_log(const VerbosityLevel level, const VerbosityLevel current_level)
    -> bool
{
  return std::to_underlying(current_level) >= std::to_underlying(level);
}

// =============================================================================
// Verbosity-gated progress on stdout
// =============================================================================

inline void
log_verbose(
    const VerbosityLevel level, const VerbosityLevel current_level,
    const std::string& message)
{
  if (!should_log(level, current_level)) {
    return;
  }
  const auto [color, label] = verbosity_style(level);
  const std::scoped_lock lock(log_mutex);
  std::cout << color << label << message << "\x1b[0m\n" << std::flush;
}

inline void
log_info(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Info, lvl, msg);
}

inline void
log_stats(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Stats, lvl, msg);
}

inline void
log_debug(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Debug, lvl, msg);
}

inline void
log_trace(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Trace, lvl, msg);
}

// Configuration, argument and protocol failures.
inline void
log_error(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;31m[ERROR] " << message << "\x1b[0m\n" << std::flush;
}
}  // namespace batchwire
