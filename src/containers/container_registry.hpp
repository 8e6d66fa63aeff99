#pragma once

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "payload_container.hpp"
#include "utils/transparent_hash.hpp"

namespace batchwire {

// =============================================================================
// ContainerRegistry
// -----------------------------------------------------------------------------
// Dispatches batching to the container registered for the payloads' tag.
// Registration happens before the registry is shared; lookups afterwards are
// read-only and may run from several threads.
// =============================================================================

class ContainerRegistry : public PayloadBatcher {
 public:
  void register_container(std::unique_ptr<PayloadContainer> container);

  [[nodiscard]] auto contains(std::string_view tag) const -> bool;
  [[nodiscard]] auto find(std::string_view tag) const
      -> const PayloadContainer*;
  [[nodiscard]] auto at(std::string_view tag) const -> const PayloadContainer&;
  [[nodiscard]] auto tags() const -> std::vector<std::string>;

  [[nodiscard]] auto from_batch_payloads(
      std::span<const Payload> payloads,
      int batch_dim) const -> BatchedValue<Payload> override;

  [[nodiscard]] auto batch_to_payloads(
      const Payload& batch, const IndexList& indices,
      int batch_dim) const -> std::vector<Payload> override;

 private:
  std::unordered_map<
      std::string, std::unique_ptr<PayloadContainer>, TransparentHash,
      std::equal_to<>>
      containers_;
};

// Registry with every container built into the library.
auto make_default_registry() -> std::unique_ptr<ContainerRegistry>;

}  // namespace batchwire
