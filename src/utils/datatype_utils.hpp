#pragma once
#include <ATen/core/ScalarType.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "exceptions.hpp"
#include "transparent_hash.hpp"

namespace batchwire {
// =============================================================================
// datatype_utils
// -----------------------------------------------------------------------------
// Conversions between torch scalar types and the Triton-style datatype names
// carried in tensor payload metadata, plus the element size of each type.
// =============================================================================
inline auto
scalar_type_to_datatype(at::ScalarType type) -> std::string
{
  switch (type) {
    case at::kFloat:
      return "FP32";
    case at::kDouble:
      return "FP64";
    case at::kHalf:
      return "FP16";
    case at::kBFloat16:
      return "BF16";
    case at::kInt:
      return "INT32";
    case at::kLong:
      return "INT64";
    case at::kShort:
      return "INT16";
    case at::kChar:
      return "INT8";
    case at::kByte:
      return "UINT8";
    case at::kBool:
      return "BOOL";
    default:
      throw UnsupportedDtypeException(
          std::string("Unsupported tensor scalar type: ") +
          c10::toString(type));
  }
}

inline auto
datatype_to_scalar_type(std::string_view dtype) -> at::ScalarType
{
  std::string dtype_upper(dtype);
  std::ranges::transform(
      dtype_upper, dtype_upper.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::toupper(c));
      });

  static const std::unordered_map<
      std::string, at::ScalarType, TransparentHash, std::equal_to<>>
      type_map = {{"FP32", at::kFloat},  {"FP64", at::kDouble},
                  {"FP16", at::kHalf},   {"BF16", at::kBFloat16},
                  {"INT32", at::kInt},   {"INT64", at::kLong},
                  {"INT16", at::kShort}, {"INT8", at::kChar},
                  {"UINT8", at::kByte},  {"BOOL", at::kBool}};

  const auto iter = type_map.find(dtype_upper);
  if (iter == type_map.end()) {
    throw UnsupportedDtypeException(
        "Unsupported tensor datatype: " + std::string(dtype));
  }
  return iter->second;
}

inline auto
element_size(at::ScalarType type) -> size_t
{
  switch (type) {
    case at::kFloat:
      return sizeof(float);
    case at::kDouble:
      return sizeof(double);
    case at::kHalf:
    case at::kBFloat16:
      return 2U;
    case at::kInt:
      return sizeof(int32_t);
    case at::kLong:
      return sizeof(int64_t);
    case at::kShort:
      return sizeof(int16_t);
    case at::kChar:
      return sizeof(int8_t);
    case at::kByte:
      return sizeof(uint8_t);
    case at::kBool:
      return sizeof(bool);
    default:
      throw UnsupportedDtypeException(
          std::string("Unsupported tensor scalar type: ") +
          c10::toString(type));
  }
}
}  // namespace batchwire
