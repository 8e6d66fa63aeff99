#include "container_registry.hpp"

#include <algorithm>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "json_list_container.hpp"
#include "utils/exceptions.hpp"

namespace batchwire {

void
ContainerRegistry::register_container(
    std::unique_ptr<PayloadContainer> container)
{
  if (container == nullptr) {
    throw std::invalid_argument("Cannot register a null payload container");
  }
  std::string tag(container->tag());
  if (tag.empty()) {
    throw std::invalid_argument("Payload container tag must not be empty");
  }
  if (containers_.contains(tag)) {
    throw std::invalid_argument(
        "Payload container already registered for tag: " + tag);
  }
  containers_.emplace(std::move(tag), std::move(container));
}

auto
ContainerRegistry::contains(std::string_view tag) const -> bool
{
  return containers_.find(tag) != containers_.end();
}

auto
ContainerRegistry::find(std::string_view tag) const -> const PayloadContainer*
{
  const auto iter = containers_.find(tag);
  if (iter == containers_.end()) {
    return nullptr;
  }
  return iter->second.get();
}

auto
ContainerRegistry::at(std::string_view tag) const -> const PayloadContainer&
{
  const auto* container = find(tag);
  if (container == nullptr) {
    throw UnsupportedContainerException(
        "No payload container registered for tag: " + std::string(tag));
  }
  return *container;
}

auto
ContainerRegistry::tags() const -> std::vector<std::string>
{
  std::vector<std::string> result;
  result.reserve(containers_.size());
  for (const auto& [tag, container] : containers_) {
    result.push_back(tag);
  }
  std::ranges::sort(result);
  return result;
}

// =============================================================================
// Dispatch on the tag of the first payload; a slot mixing tags cannot be
// concatenated.
// =============================================================================

auto
ContainerRegistry::from_batch_payloads(
    std::span<const Payload> payloads,
    int batch_dim) const -> BatchedValue<Payload>
{
  if (payloads.empty()) {
    throw ArgumentMismatchException("Cannot batch an empty list of payloads");
  }
  const std::string& tag = payloads.front().container;
  const auto mismatch = std::ranges::find_if(
      payloads,
      [&tag](const Payload& payload) { return payload.container != tag; });
  if (mismatch != payloads.end()) {
    throw ArgumentMismatchException(
        "Cannot batch payloads of different containers: " + tag + " and " +
        mismatch->container);
  }
  return at(tag).from_batch_payloads(payloads, batch_dim);
}

auto
ContainerRegistry::batch_to_payloads(
    const Payload& batch, const IndexList& indices,
    int batch_dim) const -> std::vector<Payload>
{
  return at(batch.container).batch_to_payloads(batch, indices, batch_dim);
}

auto
make_default_registry() -> std::unique_ptr<ContainerRegistry>
{
  auto registry = std::make_unique<ContainerRegistry>();
  registry->register_container(std::make_unique<JsonListContainer>());
  return registry;
}

}  // namespace batchwire
