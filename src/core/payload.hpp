#pragma once

#include <json/json.h>

#include <string>

#include "utils/json_utils.hpp"

namespace batchwire {

// =============================================================================
// Payload: one serialized argument exchanged with the runner
// -----------------------------------------------------------------------------
// `data` holds raw bytes. `container` names the scheme that can decode
// `data`; it is opaque to the protocol and only round-tripped by the codec.
// `meta` compares by JSON value, so numeric kinds lost by serialization do
// not break equality.
// =============================================================================

struct Payload {
  std::string data;
  Json::Value meta = Json::Value(Json::objectValue);
  std::string container;

  auto operator==(const Payload& other) const -> bool
  {
    return data == other.data && json_equivalent(meta, other.meta) &&
           container == other.container;
  }
};

}  // namespace batchwire
