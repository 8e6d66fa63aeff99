#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "containers/container_registry.hpp"
#include "containers/json_list_container.hpp"
#include "containers/payload_container.hpp"
#include "core/payload.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace batchwire;

namespace {

// Counts payloads instead of concatenating them.
class CountingContainer : public PayloadContainer {
 public:
  explicit CountingContainer(std::string tag) : tag_(std::move(tag)) {}

  [[nodiscard]] auto tag() const -> std::string_view override { return tag_; }

  [[nodiscard]] auto from_batch_payloads(
      std::span<const Payload> payloads,
      int /*batch_dim*/) const -> BatchedValue<Payload> override
  {
    return BatchedValue<Payload>{
        make_payload(std::to_string(payloads.size()), tag_),
        IndexList(payloads.size(), 1)};
  }

  [[nodiscard]] auto batch_to_payloads(
      const Payload& /*batch*/, const IndexList& indices,
      int /*batch_dim*/) const -> std::vector<Payload> override
  {
    return std::vector<Payload>(indices.size(), make_payload("piece", tag_));
  }

 private:
  std::string tag_;
};

}  // namespace

TEST(ContainerRegistry_Unit, DefaultRegistryKnowsJsonList)
{
  const auto registry = make_default_registry();
  EXPECT_TRUE(registry->contains("JsonList"));
  EXPECT_EQ(registry->at("JsonList").tag(), JsonListContainer::kTag);
  EXPECT_EQ(registry->tags(), (std::vector<std::string>{"JsonList"}));
}

TEST(ContainerRegistry_Unit, DispatchesOnPayloadTag)
{
  ContainerRegistry registry;
  registry.register_container(std::make_unique<CountingContainer>("Count"));
  registry.register_container(std::make_unique<JsonListContainer>());

  const std::vector<Payload> counted{
      make_payload("a", "Count"), make_payload("b", "Count")};
  const auto batched = registry.from_batch_payloads(counted, 0);
  EXPECT_EQ(batched.batch.data, "2");
  EXPECT_EQ(batched.indices, (IndexList{1, 1}));

  const std::vector<Payload> rows{
      make_json_list_payload({1}), make_json_list_payload({2, 3})};
  EXPECT_EQ(registry.from_batch_payloads(rows, 0).indices, (IndexList{1, 2}));

  const auto pieces = registry.batch_to_payloads(batched.batch, {1, 1}, 0);
  ASSERT_EQ(pieces.size(), 2U);
  EXPECT_EQ(pieces[0].data, "piece");
}

TEST(ContainerRegistry_Unit, TagsAreSorted)
{
  ContainerRegistry registry;
  registry.register_container(std::make_unique<CountingContainer>("Zeta"));
  registry.register_container(std::make_unique<CountingContainer>("Alpha"));
  EXPECT_EQ(
      registry.tags(), (std::vector<std::string>{"Alpha", "Zeta"}));
}

TEST(ContainerRegistry_Unit, FindReturnsNullForUnknownTag)
{
  const ContainerRegistry registry;
  EXPECT_EQ(registry.find("Missing"), nullptr);
  EXPECT_FALSE(registry.contains("Missing"));
  EXPECT_THROW((void)registry.at("Missing"), UnsupportedContainerException);
}

TEST(ContainerRegistry_Unit, RejectsInvalidRegistrations)
{
  ContainerRegistry registry;
  EXPECT_THROW(registry.register_container(nullptr), std::invalid_argument);
  EXPECT_THROW(
      registry.register_container(std::make_unique<CountingContainer>("")),
      std::invalid_argument);
  registry.register_container(std::make_unique<CountingContainer>("Dup"));
  EXPECT_THROW(
      registry.register_container(std::make_unique<CountingContainer>("Dup")),
      std::invalid_argument);
}

TEST(ContainerRegistry_Unit, MixedTagsInOneSlotAreRejected)
{
  const auto registry = make_default_registry();
  const std::vector<Payload> payloads{
      make_json_list_payload({1}), make_payload("x", "Other")};
  EXPECT_THROW(
      (void)registry->from_batch_payloads(payloads, 0),
      ArgumentMismatchException);
}

TEST(ContainerRegistry_Unit, SplitOfUnknownContainerIsUnsupported)
{
  const auto registry = make_default_registry();
  EXPECT_THROW(
      (void)registry->batch_to_payloads(make_payload("x", "Other"), {1}, 0),
      UnsupportedContainerException);
}
