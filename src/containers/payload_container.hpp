#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "core/batch_aggregation.hpp"
#include "core/payload.hpp"

namespace batchwire {

// =============================================================================
// PayloadBatcher
// -----------------------------------------------------------------------------
// Batching capability for Payload values, as consumed by aggregate_to_batch
// and split_batch_result.
//
// from_batch_payloads: concatenates `payloads` along `batch_dim`; indices[i]
//   is the number of rows contributed by payloads[i].
// batch_to_payloads:   splits `batch` back into indices.size() payloads.
// =============================================================================

class PayloadBatcher {
 public:
  PayloadBatcher() = default;
  PayloadBatcher(const PayloadBatcher&) = delete;
  auto operator=(const PayloadBatcher&) -> PayloadBatcher& = delete;
  PayloadBatcher(PayloadBatcher&&) = delete;
  auto operator=(PayloadBatcher&&) -> PayloadBatcher& = delete;
  virtual ~PayloadBatcher() = default;

  [[nodiscard]] virtual auto from_batch_payloads(
      std::span<const Payload> payloads,
      int batch_dim) const -> BatchedValue<Payload> = 0;

  [[nodiscard]] virtual auto batch_to_payloads(
      const Payload& batch, const IndexList& indices,
      int batch_dim) const -> std::vector<Payload> = 0;
};

// A batching capability bound to one container tag.
class PayloadContainer : public PayloadBatcher {
 public:
  [[nodiscard]] virtual auto tag() const -> std::string_view = 0;
};

}  // namespace batchwire
