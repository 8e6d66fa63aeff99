#pragma once

#include <span>
#include <string>
#include <string_view>

#include "core/params.hpp"
#include "core/payload.hpp"
#include "multipart.hpp"
#include "utils/logger.hpp"
#include "wire_format.hpp"

namespace batchwire {

// =============================================================================
// Wire codec for Params<Payload>
// -----------------------------------------------------------------------------
// One multipart part per slot, named by the slot address ("0", "1", ... for
// positional slots, the keyword otherwise). Each part carries:
//   <meta_header>:        compact JSON of Payload::meta
//   Content-Type:         application/vnd.<namespace>.<Payload::container>
//   Content-Disposition:  form-data; name="<slot>"
// =============================================================================

auto encode_payload_params(
    const Params<Payload>& params,
    const WireFormat& format = WireFormat{}) -> WireMessage;

auto decode_payload_params(
    const WireMessage& message, const WireFormat& format = WireFormat{},
    VerbosityLevel verbosity = VerbosityLevel::Silent) -> Params<Payload>;

// Rebuilds the container from already framed parts. Positional parts must
// cover every index from 0 to the highest one seen.
auto parts_to_payload_params(
    std::span<const MultipartPart> parts,
    const WireFormat& format = WireFormat{},
    VerbosityLevel verbosity = VerbosityLevel::Silent) -> Params<Payload>;

auto payload_content_type(
    std::string_view container, const WireFormat& format = WireFormat{})
    -> std::string;

// Container tag of a part Content-Type; throws MalformedMetadataException
// when the vendor prefix or the tag is missing.
auto container_from_content_type(
    std::string_view content_type,
    const WireFormat& format = WireFormat{}) -> std::string;

}  // namespace batchwire
