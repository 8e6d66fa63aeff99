#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wire_format.hpp"

namespace batchwire {

struct MultipartHeader {
  std::string name;
  std::string value;
};

using MultipartHeaders = std::vector<MultipartHeader>;

struct MultipartPart {
  std::string name;
  MultipartHeaders headers;
  std::string body;

  // Case-insensitive header lookup; nullptr when absent.
  [[nodiscard]] auto header(std::string_view key) const -> const std::string*;
};

// A header value split into its leading token and its ;-separated
// parameters. Parameter names are lower-cased, quoted values unescaped.
struct HeaderValue {
  std::string token;
  std::map<std::string, std::string, std::less<>> params;
};

auto iequals(std::string_view lhs, std::string_view rhs) -> bool;
auto parse_header_value(std::string_view value) -> HeaderValue;
auto quote_header_param(std::string_view value) -> std::string;

// =============================================================================
// MultipartWriter
// -----------------------------------------------------------------------------
// Builds a multipart/form-data body (RFC 7578). When no boundary is forced,
// a random one is drawn and redrawn if it occurs inside a part body.
// =============================================================================

class MultipartWriter {
 public:
  MultipartWriter();
  explicit MultipartWriter(std::string boundary);

  void append(std::string body, MultipartHeaders headers);

  [[nodiscard]] auto part_count() const -> std::size_t
  {
    return parts_.size();
  }

  [[nodiscard]] auto finish() const -> WireMessage;

 private:
  struct PendingPart {
    MultipartHeaders headers;
    std::string body;
  };

  [[nodiscard]] auto collides(std::string_view boundary) const -> bool;

  std::optional<std::string> boundary_;
  std::vector<PendingPart> parts_;
};

auto generate_boundary() -> std::string;

// Boundary parameter of a multipart Content-Type header.
auto extract_boundary(std::string_view content_type) -> std::string;

// Splits a buffered multipart/form-data body into named parts, in message
// order. Every part must carry Content-Disposition: form-data; name="...".
auto parse_multipart(std::string_view body, std::string_view content_type)
    -> std::vector<MultipartPart>;

}  // namespace batchwire
