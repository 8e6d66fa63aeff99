#include "torch_tensor_container.hpp"

#include <ATen/core/ScalarType.h>
#include <c10/util/Exception.h>
#include <json/json.h>
#include <torch/torch.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "utils/datatype_utils.hpp"
#include "utils/exceptions.hpp"

namespace batchwire {
namespace {

auto
parse_shape(const Json::Value& shape_node) -> std::vector<int64_t>
{
  if (!shape_node.isArray()) {
    throw PayloadDecodeException("Tensor payload meta lacks a shape array");
  }
  std::vector<int64_t> shape;
  shape.reserve(shape_node.size());
  for (const auto& dim : shape_node) {
    if (!dim.isIntegral() || dim.asInt64() < 0) {
      throw PayloadDecodeException(
          "Tensor payload shape entries must be non-negative integers");
    }
    shape.push_back(dim.asInt64());
  }
  return shape;
}

auto
expected_byte_size(const std::vector<int64_t>& shape, at::ScalarType dtype)
    -> std::size_t
{
  std::size_t numel = 1;
  for (const int64_t dim : shape) {
    const auto dim_size = static_cast<std::size_t>(dim);
    if (dim_size != 0 &&
        numel > std::numeric_limits<std::size_t>::max() / dim_size) {
      throw PayloadDecodeException("Tensor payload shape overflows size_t");
    }
    numel *= dim_size;
  }
  const std::size_t type_size = element_size(dtype);
  if (numel > std::numeric_limits<std::size_t>::max() / type_size) {
    throw PayloadDecodeException("Tensor payload byte size overflows size_t");
  }
  return numel * type_size;
}

void
validate_batch_dim(const torch::Tensor& tensor, int batch_dim)
{
  if (batch_dim < 0 || batch_dim >= tensor.dim()) {
    throw InvalidBatchDimensionException(
        "batch_dim " + std::to_string(batch_dim) +
        " is out of range for a tensor of rank " +
        std::to_string(tensor.dim()));
  }
}

}  // namespace

// =============================================================================
// Tensor <-> Payload
// =============================================================================

auto
TorchTensorContainer::to_payload(const torch::Tensor& tensor) -> Payload
{
  if (!tensor.defined()) {
    throw PayloadDecodeException("Cannot serialize an undefined tensor");
  }
  const torch::Tensor host = tensor.to(torch::kCPU).contiguous();

  Payload payload;
  payload.container = std::string(kTag);
  payload.meta["dtype"] = scalar_type_to_datatype(host.scalar_type());
  Json::Value shape(Json::arrayValue);
  for (const int64_t dim : host.sizes()) {
    shape.append(Json::Int64{dim});
  }
  payload.meta["shape"] = shape;
  payload.data.assign(
      static_cast<const char*>(host.data_ptr()),
      static_cast<std::size_t>(host.nbytes()));
  return payload;
}

auto
TorchTensorContainer::from_payload(const Payload& payload) -> torch::Tensor
{
  if (!payload.meta.isObject() || !payload.meta.isMember("dtype") ||
      !payload.meta["dtype"].isString()) {
    throw PayloadDecodeException("Tensor payload meta lacks a dtype string");
  }
  const at::ScalarType dtype =
      datatype_to_scalar_type(payload.meta["dtype"].asString());
  const std::vector<int64_t> shape = parse_shape(payload.meta["shape"]);

  const std::size_t bytes = expected_byte_size(shape, dtype);
  if (bytes != payload.data.size()) {
    throw PayloadDecodeException(
        "Tensor payload holds " + std::to_string(payload.data.size()) +
        " bytes but its meta describes " + std::to_string(bytes));
  }

  torch::Tensor tensor =
      torch::empty(shape, torch::TensorOptions().dtype(dtype));
  if (bytes != 0) {
    std::memcpy(tensor.data_ptr(), payload.data.data(), bytes);
  }
  return tensor;
}

// =============================================================================
// Batching along the batch dimension
// =============================================================================

auto
TorchTensorContainer::from_batch_payloads(
    std::span<const Payload> payloads,
    int batch_dim) const -> BatchedValue<Payload>
{
  if (payloads.empty()) {
    throw ArgumentMismatchException("Cannot batch an empty list of payloads");
  }

  std::vector<torch::Tensor> tensors;
  tensors.reserve(payloads.size());
  IndexList indices;
  indices.reserve(payloads.size());
  for (const auto& payload : payloads) {
    torch::Tensor tensor = from_payload(payload);
    validate_batch_dim(tensor, batch_dim);
    indices.push_back(tensor.size(batch_dim));
    tensors.push_back(std::move(tensor));
  }

  torch::Tensor batch;
  try {
    batch = torch::cat(tensors, batch_dim);
  }
  catch (const c10::Error& error) {
    throw ArgumentMismatchException(
        std::string("Tensors cannot be concatenated: ") +
        error.what_without_backtrace());
  }
  return BatchedValue<Payload>{to_payload(batch), std::move(indices)};
}

auto
TorchTensorContainer::batch_to_payloads(
    const Payload& batch, const IndexList& indices,
    int batch_dim) const -> std::vector<Payload>
{
  const torch::Tensor tensor = from_payload(batch);
  validate_batch_dim(tensor, batch_dim);

  int64_t total = 0;
  for (const int64_t count : indices) {
    if (count < 0) {
      throw ArgumentMismatchException(
          "Index list contains a negative row count: " +
          index_list_to_string(indices));
    }
    total += count;
  }
  if (total != tensor.size(batch_dim)) {
    throw ArgumentMismatchException(
        "Index list " + index_list_to_string(indices) + " covers " +
        std::to_string(total) + " rows but the batch holds " +
        std::to_string(tensor.size(batch_dim)));
  }

  std::vector<Payload> pieces;
  pieces.reserve(indices.size());
  for (const auto& piece : tensor.split_with_sizes(indices, batch_dim)) {
    pieces.push_back(to_payload(piece));
  }
  return pieces;
}

void
register_torch_containers(ContainerRegistry& registry)
{
  registry.register_container(std::make_unique<TorchTensorContainer>());
}

}  // namespace batchwire
