#pragma once

#include <json/json.h>

#include <span>

#include "codec/wire_format.hpp"
#include "containers/payload_container.hpp"
#include "core/batch_aggregation.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace batchwire {

struct MergeResult {
  WireMessage message;
  IndexList indices;
};

// Decodes every call, aggregates them along `batch_dim` and encodes the
// batched call with the same wire format.
auto merge_wire_messages(
    std::span<const WireMessage> calls, int batch_dim, const WireFormat& format,
    const PayloadBatcher& batcher,
    VerbosityLevel verbosity = VerbosityLevel::Silent) -> MergeResult;

auto indices_to_json(const IndexList& indices) -> Json::Value;

// Reads opts.input_paths, merges them and writes opts.output_path (and
// opts.indices_output_path when set). Protocol failures propagate as
// BatchProtocolException, I/O failures as std::runtime_error.
void run_merge(const RuntimeConfig& opts, const PayloadBatcher& batcher);

}  // namespace batchwire
