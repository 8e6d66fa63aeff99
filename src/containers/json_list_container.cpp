#include "json_list_container.hpp"

#include <json/json.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "utils/exceptions.hpp"
#include "utils/json_utils.hpp"

namespace batchwire {
namespace {
void
validate_batch_dim(int batch_dim)
{
  if (batch_dim != 0) {
    throw InvalidBatchDimensionException(
        "JsonList payloads only batch along dimension 0, got " +
        std::to_string(batch_dim));
  }
}
}  // namespace

auto
JsonListContainer::to_payload(const Json::Value& rows) -> Payload
{
  if (!rows.isArray()) {
    throw PayloadDecodeException("JsonList payload rows must be a JSON array");
  }
  Payload payload;
  payload.data = to_compact_json(rows);
  payload.container = std::string(kTag);
  return payload;
}

auto
JsonListContainer::from_payload(const Payload& payload) -> Json::Value
{
  std::string errors;
  auto rows = parse_json(payload.data, &errors);
  if (!rows.has_value()) {
    throw PayloadDecodeException("Invalid JsonList payload: " + errors);
  }
  if (!rows->isArray()) {
    throw PayloadDecodeException("JsonList payload is not a JSON array");
  }
  return *std::move(rows);
}

auto
JsonListContainer::from_batch_payloads(
    std::span<const Payload> payloads,
    int batch_dim) const -> BatchedValue<Payload>
{
  validate_batch_dim(batch_dim);
  if (payloads.empty()) {
    throw ArgumentMismatchException("Cannot batch an empty list of payloads");
  }

  Json::Value combined(Json::arrayValue);
  IndexList indices;
  indices.reserve(payloads.size());
  for (const auto& payload : payloads) {
    const Json::Value rows = from_payload(payload);
    for (const auto& row : rows) {
      combined.append(row);
    }
    indices.push_back(static_cast<std::int64_t>(rows.size()));
  }
  return BatchedValue<Payload>{to_payload(combined), std::move(indices)};
}

auto
JsonListContainer::batch_to_payloads(
    const Payload& batch, const IndexList& indices,
    int batch_dim) const -> std::vector<Payload>
{
  validate_batch_dim(batch_dim);
  const Json::Value rows = from_payload(batch);

  std::int64_t total = 0;
  for (const auto count : indices) {
    if (count < 0) {
      throw ArgumentMismatchException(
          "Index list contains a negative row count: " +
          index_list_to_string(indices));
    }
    total += count;
  }
  if (total != static_cast<std::int64_t>(rows.size())) {
    throw ArgumentMismatchException(
        "Index list " + index_list_to_string(indices) + " covers " +
        std::to_string(total) + " rows but the batch holds " +
        std::to_string(rows.size()));
  }

  std::vector<Payload> pieces;
  pieces.reserve(indices.size());
  Json::ArrayIndex cursor = 0;
  for (const auto count : indices) {
    Json::Value slice(Json::arrayValue);
    for (std::int64_t row = 0; row < count; ++row) {
      slice.append(rows[cursor++]);
    }
    pieces.push_back(to_payload(slice));
  }
  return pieces;
}

}  // namespace batchwire
