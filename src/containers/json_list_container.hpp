#pragma once

#include <json/json.h>

#include <span>
#include <string_view>
#include <vector>

#include "payload_container.hpp"

namespace batchwire {

// =============================================================================
// JsonListContainer
// -----------------------------------------------------------------------------
// Payload data is a UTF-8 JSON array whose elements are the rows of the
// batch. Batching concatenates the arrays; only batch dimension 0 exists.
// =============================================================================

class JsonListContainer : public PayloadContainer {
 public:
  static constexpr std::string_view kTag = "JsonList";

  [[nodiscard]] auto tag() const -> std::string_view override { return kTag; }

  [[nodiscard]] auto from_batch_payloads(
      std::span<const Payload> payloads,
      int batch_dim) const -> BatchedValue<Payload> override;

  [[nodiscard]] auto batch_to_payloads(
      const Payload& batch, const IndexList& indices,
      int batch_dim) const -> std::vector<Payload> override;

  [[nodiscard]] static auto to_payload(const Json::Value& rows) -> Payload;
  [[nodiscard]] static auto from_payload(const Payload& payload)
      -> Json::Value;
};

}  // namespace batchwire
