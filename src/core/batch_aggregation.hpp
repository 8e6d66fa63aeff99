#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "params.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace batchwire {

// Number of batch-dimension rows contributed by each merged call, in call
// order.
using IndexList = std::vector<std::int64_t>;

template <typename Value>
struct BatchedValue {
  Value batch;
  IndexList indices;
};

template <typename Value>
struct BatchAggregation {
  Params<Value> batched;
  IndexList indices;
};

inline auto
index_list_to_string(const IndexList& indices) -> std::string
{
  std::string text = "[";
  for (std::size_t idx = 0; idx < indices.size(); ++idx) {
    if (idx != 0) {
      text += ", ";
    }
    text += std::to_string(indices[idx]);
  }
  text += "]";
  return text;
}

// =============================================================================
// aggregate_to_batch
// -----------------------------------------------------------------------------
// Merges the arguments of several calls into one batched call.
//
// `batcher` is any type exposing
//   from_batch_payloads(std::span<const Value>, int batch_dim)
//       -> BatchedValue<Value>
// and is the only component that knows how values are concatenated along
// the batch dimension. Every slot must report the same index list, otherwise
// the calls do not agree on their batch layout.
// =============================================================================

template <typename Value, typename Batcher>
auto
aggregate_to_batch(
    std::span<const Params<Value>> params_list, int batch_dim,
    const Batcher& batcher,
    VerbosityLevel verbosity = VerbosityLevel::Silent)
    -> BatchAggregation<Value>
{
  if (params_list.empty()) {
    throw ArgumentMismatchException("Cannot aggregate an empty list of calls");
  }
  if (batch_dim < 0) {
    throw InvalidBatchDimensionException(
        "batch_dim must be >= 0, got " + std::to_string(batch_dim));
  }

  const auto converted = Params<Value>::agg(
      params_list, [&batcher, batch_dim](std::span<const Value> values) {
        BatchedValue<Value> result =
            batcher.from_batch_payloads(values, batch_dim);
        return std::pair<Value, IndexList>(
            std::move(result.batch), std::move(result.indices));
      });
  auto [batched, index_params] = converted.unzip();

  if (!index_params.all_equal()) {
    std::string detail;
    for (const auto& [address, indices] : index_params.items()) {
      if (!detail.empty()) {
        detail += ", ";
      }
      detail += slot_address_to_string(address) + ": " +
                index_list_to_string(indices);
    }
    throw ArgumentMismatchException(
        "Argument lengths for parameters do not match: " + detail);
  }

  IndexList indices = index_params.sample();
  log_trace(
      verbosity, "Aggregated " + std::to_string(params_list.size()) +
                     " calls over " + std::to_string(batched.size()) +
                     " slots, indices " + index_list_to_string(indices));
  return BatchAggregation<Value>{std::move(batched), std::move(indices)};
}

template <typename Value, typename Batcher>
auto
aggregate_to_batch(
    const std::vector<Params<Value>>& params_list, int batch_dim,
    const Batcher& batcher,
    VerbosityLevel verbosity = VerbosityLevel::Silent)
    -> BatchAggregation<Value>
{
  return aggregate_to_batch(
      std::span<const Params<Value>>(params_list), batch_dim, batcher,
      verbosity);
}

// =============================================================================
// split_batch_result
// -----------------------------------------------------------------------------
// Inverse of aggregate_to_batch: splits every slot of a batched result with
// `batcher.batch_to_payloads(value, indices, batch_dim)` and regroups the
// pieces into one Params per original call, in call order.
// =============================================================================

template <typename Value, typename Batcher>
auto
split_batch_result(
    const Params<Value>& batched_results, const IndexList& indices,
    int batch_dim, const Batcher& batcher,
    VerbosityLevel verbosity = VerbosityLevel::Silent)
    -> std::vector<Params<Value>>
{
  if (batch_dim < 0) {
    throw InvalidBatchDimensionException(
        "batch_dim must be >= 0, got " + std::to_string(batch_dim));
  }
  if (batched_results.empty()) {
    return std::vector<Params<Value>>(indices.size());
  }

  const auto per_slot = batched_results.map(
      [&batcher, &indices, batch_dim](const Value& batch) {
        std::vector<Value> pieces =
            batcher.batch_to_payloads(batch, indices, batch_dim);
        if (pieces.size() != indices.size()) {
          throw ArgumentMismatchException(
              "Splitting with indices " + index_list_to_string(indices) +
              " produced " + std::to_string(pieces.size()) + " values");
        }
        return pieces;
      });

  auto calls = per_slot.iter();
  log_trace(
      verbosity, "Split batched result over " +
                     std::to_string(batched_results.size()) + " slots into " +
                     std::to_string(calls.size()) + " calls");
  return calls;
}

}  // namespace batchwire
