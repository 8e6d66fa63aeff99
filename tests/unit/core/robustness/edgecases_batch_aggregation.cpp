#include <gtest/gtest.h>

#include <json/json.h>

#include <vector>

#include "containers/container_registry.hpp"
#include "containers/json_list_container.hpp"
#include "core/batch_aggregation.hpp"
#include "core/params.hpp"
#include "core/payload.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace batchwire;

TEST(BatchAggregation_Robustness, SingleCallKeepsItsRows)
{
  const auto registry = make_default_registry();
  const std::vector<Params<Payload>> calls{
      Params<Payload>({make_json_list_payload({1, 2, 3})})};

  const auto result = aggregate_to_batch(calls, 0, *registry);

  EXPECT_EQ(result.indices, (IndexList{3}));
  EXPECT_EQ(
      JsonListContainer::from_payload(result.batched.sample()),
      make_json_rows({1, 2, 3}));
}

TEST(BatchAggregation_Robustness, EmptyRowsContributeZeroIndices)
{
  const auto registry = make_default_registry();
  const std::vector<Params<Payload>> calls{
      Params<Payload>({make_json_list_payload({})}),
      Params<Payload>({make_json_list_payload({7})})};

  const auto result = aggregate_to_batch(calls, 0, *registry);
  EXPECT_EQ(result.indices, (IndexList{0, 1}));

  const auto split =
      split_batch_result(result.batched, result.indices, 0, *registry);
  ASSERT_EQ(split.size(), 2U);
  EXPECT_EQ(
      JsonListContainer::from_payload(split[0].sample()),
      Json::Value(Json::arrayValue));
  EXPECT_EQ(
      JsonListContainer::from_payload(split[1].sample()), make_json_rows({7}));
}

TEST(BatchAggregation_Robustness, SlotsWithDifferentRowCountsDisagree)
{
  const auto registry = make_default_registry();
  const std::vector<Params<Payload>> calls{
      Params<Payload>(
          {make_json_list_payload({1})},
          {{"mask", make_json_list_payload({1, 1})}}),
      Params<Payload>(
          {make_json_list_payload({2})},
          {{"mask", make_json_list_payload({1})}})};

  EXPECT_THROW(
      (void)aggregate_to_batch(calls, 0, *registry), ArgumentMismatchException);
}

TEST(BatchAggregation_Robustness, MixedContainersInOneSlotAreRejected)
{
  const auto registry = make_default_registry();
  const std::vector<Params<Payload>> calls{
      Params<Payload>({make_json_list_payload({1})}),
      Params<Payload>({make_payload("raw", "Blob")})};

  EXPECT_THROW(
      (void)aggregate_to_batch(calls, 0, *registry), ArgumentMismatchException);
}

TEST(BatchAggregation_Robustness, UnknownContainerIsUnsupported)
{
  const auto registry = make_default_registry();
  const std::vector<Params<Payload>> calls{
      Params<Payload>({make_payload("raw", "Blob")}),
      Params<Payload>({make_payload("raw", "Blob")})};

  EXPECT_THROW(
      (void)aggregate_to_batch(calls, 0, *registry),
      UnsupportedContainerException);
}

TEST(BatchAggregation_Robustness, SplitWithIndicesNotCoveringBatchFails)
{
  const auto registry = make_default_registry();
  const Params<Payload> batched({make_json_list_payload({1, 2, 3})});

  EXPECT_THROW(
      (void)split_batch_result(batched, IndexList{1, 1}, 0, *registry),
      ArgumentMismatchException);
}

TEST(BatchAggregation_Robustness, SplitRejectsNegativeBatchDimension)
{
  const IntRowsBatcher batcher;
  const Params<std::vector<int>> batched({{1, 2}});
  EXPECT_THROW(
      (void)split_batch_result(batched, IndexList{2}, -1, batcher),
      InvalidBatchDimensionException);
}
