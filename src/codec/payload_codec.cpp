#include "payload_codec.hpp"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include "utils/exceptions.hpp"
#include "utils/json_utils.hpp"
#include "utils/logger.hpp"

namespace batchwire {
namespace {

auto
is_all_digits(std::string_view text) -> bool
{
  return !text.empty() && std::ranges::all_of(text, [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

auto
parse_positional_index(std::string_view name) -> std::size_t
{
  std::size_t index = 0;
  const auto [end, error] =
      std::from_chars(name.data(), name.data() + name.size(), index);
  if (error != std::errc{} || end != name.data() + name.size()) {
    throw MalformedMultipartException(
        "Positional part index out of range: " + std::string(name));
  }
  return index;
}

auto
decode_meta(const MultipartPart& part, const WireFormat& format) -> Json::Value
{
  const auto* header = part.header(format.meta_header);
  if (header == nullptr) {
    throw MalformedMetadataException(
        "Part '" + part.name + "' lacks the " + format.meta_header +
        " header");
  }
  std::string errors;
  auto meta = parse_json(*header, &errors);
  if (!meta.has_value()) {
    throw MalformedMetadataException(
        "Part '" + part.name + "' has invalid JSON metadata: " + errors);
  }
  if (meta->isNull()) {
    return Json::Value(Json::objectValue);
  }
  if (!meta->isObject()) {
    throw MalformedMetadataException(
        "Part '" + part.name + "' metadata is not a JSON object");
  }
  return *std::move(meta);
}

auto
decode_payload(const MultipartPart& part, const WireFormat& format) -> Payload
{
  const auto* content_type = part.header("Content-Type");
  if (content_type == nullptr) {
    throw MalformedMetadataException(
        "Part '" + part.name + "' lacks a Content-Type header");
  }
  Payload payload;
  payload.data = part.body;
  payload.meta = decode_meta(part, format);
  payload.container = container_from_content_type(*content_type, format);
  return payload;
}

}  // namespace

auto
payload_content_type(std::string_view container, const WireFormat& format)
    -> std::string
{
  return format.content_type_prefix() + std::string(container);
}

auto
container_from_content_type(
    std::string_view content_type, const WireFormat& format) -> std::string
{
  const std::string media_type = parse_header_value(content_type).token;
  const std::string prefix = format.content_type_prefix();
  if (media_type.size() <= prefix.size() ||
      !iequals(std::string_view(media_type).substr(0, prefix.size()), prefix)) {
    throw MalformedMetadataException(
        "Content-Type does not name a " + format.vendor_namespace +
        " container: " + std::string(content_type));
  }
  return media_type.substr(prefix.size());
}

// =============================================================================
// Encode
// =============================================================================

auto
encode_payload_params(const Params<Payload>& params, const WireFormat& format)
    -> WireMessage
{
  MultipartWriter writer;
  for (const auto& [address, payload] : params.items()) {
    if (const auto* key = std::get_if<std::string>(&address);
        key != nullptr && (key->empty() || is_all_digits(*key))) {
      throw ArgumentMismatchException(
          "Named slot '" + *key +
          "' cannot be encoded: part names must be non-empty and not "
          "all digits");
    }
    if (payload.container.empty()) {
      throw MalformedMetadataException(
          "Payload for slot '" + slot_address_to_string(address) +
          "' has no container tag");
    }
    writer.append(
        payload.data,
        MultipartHeaders{
            {format.meta_header, to_compact_json(payload.meta)},
            {"Content-Type", payload_content_type(payload.container, format)},
            {"Content-Disposition",
             "form-data; name=" +
                 quote_header_param(slot_address_to_string(address))}});
  }
  return writer.finish();
}

// =============================================================================
// Decode
// =============================================================================

auto
parts_to_payload_params(
    std::span<const MultipartPart> parts, const WireFormat& format,
    VerbosityLevel verbosity) -> Params<Payload>
{
  std::map<std::size_t, Payload> positional_parts;
  Params<Payload>::NamedMap named;
  bool has_positional = false;
  std::size_t max_index = 0;

  for (const auto& part : parts) {
    Payload payload = decode_payload(part, format);
    log_trace(
        verbosity, "Decoded part '" + part.name + "' (" + payload.container +
                       ", " + std::to_string(payload.data.size()) + " bytes)");
    if (is_all_digits(part.name)) {
      const std::size_t index = parse_positional_index(part.name);
      if (!positional_parts.emplace(index, std::move(payload)).second) {
        throw MalformedMultipartException(
            "Positional slot " + std::to_string(index) +
            " appears more than once");
      }
      max_index = has_positional ? std::max(max_index, index) : index;
      has_positional = true;
    } else {
      named.emplace(part.name, std::move(payload));
    }
  }

  Params<Payload>::PositionalList positional;
  if (has_positional) {
    positional.reserve(positional_parts.size());
    for (std::size_t index = 0; index <= max_index; ++index) {
      const auto iter = positional_parts.find(index);
      if (iter == positional_parts.end()) {
        throw MissingSlotException(
            "Missing positional slot " + std::to_string(index) +
            " (highest positional slot is " + std::to_string(max_index) +
            ")");
      }
      positional.push_back(std::move(iter->second));
    }
  }
  return Params<Payload>(std::move(positional), std::move(named));
}

auto
decode_payload_params(
    const WireMessage& message, const WireFormat& format,
    VerbosityLevel verbosity) -> Params<Payload>
{
  if (message.body.size() > format.max_message_bytes) {
    throw MessageSizeOverflowException(
        "Message body of " + std::to_string(message.body.size()) +
        " bytes exceeds the limit of " +
        std::to_string(format.max_message_bytes));
  }
  const auto parts = parse_multipart(message.body, message.content_type);
  if (parts.size() > format.max_parts) {
    throw MessageSizeOverflowException(
        "Message holds " + std::to_string(parts.size()) +
        " parts, limit is " + std::to_string(format.max_parts));
  }
  log_debug(
      verbosity, "Decoding " + std::to_string(parts.size()) +
                     " multipart parts");
  return parts_to_payload_params(parts, format, verbosity);
}

}  // namespace batchwire
