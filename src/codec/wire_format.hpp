#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace batchwire {

inline constexpr std::string_view kDefaultMetaHeader = "Payload-Meta";
inline constexpr std::string_view kDefaultVendorNamespace = "batchwire";
inline constexpr std::size_t kDefaultMaxParts = 256;
inline constexpr std::size_t kBytesPerKiB = 1024ULL;
inline constexpr std::size_t kBytesPerMiB = kBytesPerKiB * 1024ULL;
inline constexpr std::size_t kDefaultMaxMessageBytes = 32ULL * kBytesPerMiB;

// Header names and vendor namespaces end up inside header lines and media
// types, so both are restricted to this token alphabet.
inline auto
is_header_token(std::string_view text) -> bool
{
  return !text.empty() &&
         std::ranges::all_of(text, [](unsigned char c) noexcept {
           return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
         });
}

// =============================================================================
// WireFormat
// -----------------------------------------------------------------------------
// Header names and decode limits shared by both ends of the runner link.
// Parts carry Content-Type "application/vnd.<vendor_namespace>.<container>".
// =============================================================================
struct WireFormat {
  std::string meta_header{kDefaultMetaHeader};
  std::string vendor_namespace{kDefaultVendorNamespace};
  std::size_t max_parts = kDefaultMaxParts;
  std::size_t max_message_bytes = kDefaultMaxMessageBytes;

  [[nodiscard]] auto content_type_prefix() const -> std::string
  {
    return "application/vnd." + vendor_namespace + ".";
  }
};

// A complete message: the multipart Content-Type (with its boundary) and the
// buffered body.
struct WireMessage {
  std::string content_type;
  std::string body;
};

}  // namespace batchwire
