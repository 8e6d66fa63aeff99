#pragma once
#include <torch/torch.h>

#include <span>
#include <string_view>
#include <vector>

#include "container_registry.hpp"
#include "payload_container.hpp"

namespace batchwire {

// =============================================================================
// TorchTensorContainer
// -----------------------------------------------------------------------------
// Payload data holds the contiguous bytes of a CPU tensor; meta carries
//   {"dtype": "<Triton datatype>", "shape": [d0, d1, ...]}.
// Batching concatenates the tensors along the batch dimension.
// =============================================================================

class TorchTensorContainer : public PayloadContainer {
 public:
  static constexpr std::string_view kTag = "TorchTensor";

  [[nodiscard]] auto tag() const -> std::string_view override { return kTag; }

  [[nodiscard]] auto from_batch_payloads(
      std::span<const Payload> payloads,
      int batch_dim) const -> BatchedValue<Payload> override;

  [[nodiscard]] auto batch_to_payloads(
      const Payload& batch, const IndexList& indices,
      int batch_dim) const -> std::vector<Payload> override;

  [[nodiscard]] static auto to_payload(const torch::Tensor& tensor)
      -> Payload;
  [[nodiscard]] static auto from_payload(const Payload& payload)
      -> torch::Tensor;
};

void register_torch_containers(ContainerRegistry& registry);

}  // namespace batchwire
