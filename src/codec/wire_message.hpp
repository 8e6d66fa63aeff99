#pragma once

#include <filesystem>
#include <iosfwd>

#include "wire_format.hpp"

namespace batchwire {

// =============================================================================
// Wire message envelope
// -----------------------------------------------------------------------------
// Stores a WireMessage outside of an HTTP exchange:
//
//   Content-Type: multipart/form-data; boundary=...\r\n
//   \r\n
//   <body bytes>
// =============================================================================

void write_wire_message(std::ostream& output, const WireMessage& message);
auto read_wire_message(std::istream& input) -> WireMessage;

void save_wire_message(
    const std::filesystem::path& path, const WireMessage& message);
auto load_wire_message(const std::filesystem::path& path) -> WireMessage;

}  // namespace batchwire
