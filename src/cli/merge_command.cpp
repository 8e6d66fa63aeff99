#include "merge_command.hpp"

#include <json/json.h>

#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "codec/payload_codec.hpp"
#include "codec/wire_message.hpp"
#include "core/params.hpp"
#include "core/payload.hpp"
#include "utils/json_utils.hpp"

namespace batchwire {

auto
merge_wire_messages(
    std::span<const WireMessage> calls, int batch_dim, const WireFormat& format,
    const PayloadBatcher& batcher, VerbosityLevel verbosity) -> MergeResult
{
  std::vector<Params<Payload>> decoded;
  decoded.reserve(calls.size());
  for (const auto& call : calls) {
    decoded.push_back(decode_payload_params(call, format, verbosity));
  }

  auto aggregation = aggregate_to_batch(decoded, batch_dim, batcher, verbosity);
  log_debug(
      verbosity, "Merged " + std::to_string(calls.size()) +
                     " calls into one batch with indices " +
                     index_list_to_string(aggregation.indices));
  return MergeResult{
      encode_payload_params(aggregation.batched, format),
      std::move(aggregation.indices)};
}

auto
indices_to_json(const IndexList& indices) -> Json::Value
{
  Json::Value array(Json::arrayValue);
  for (const auto count : indices) {
    array.append(Json::Value(static_cast<Json::Int64>(count)));
  }
  return array;
}

void
run_merge(const RuntimeConfig& opts, const PayloadBatcher& batcher)
{
  std::vector<WireMessage> calls;
  calls.reserve(opts.input_paths.size());
  for (const auto& path : opts.input_paths) {
    log_trace(opts.verbosity, "Reading call from " + path);
    calls.push_back(load_wire_message(path));
  }

  const MergeResult merged = merge_wire_messages(
      calls, opts.batch_dim, opts.wire, batcher, opts.verbosity);
  save_wire_message(opts.output_path, merged.message);
  log_info(
      opts.verbosity, "Wrote batched call of " +
                          std::to_string(calls.size()) + " inputs to " +
                          opts.output_path);

  if (!opts.indices_output_path.empty()) {
    std::ofstream output(opts.indices_output_path, std::ios::trunc);
    if (!output.is_open()) {
      throw std::runtime_error(
          "Cannot open " + opts.indices_output_path + " for writing");
    }
    output << to_compact_json(indices_to_json(merged.indices)) << '\n';
    if (!output) {
      throw std::runtime_error(
          "Failed to write indices to " + opts.indices_output_path);
    }
  }
  log_stats(
      opts.verbosity, "Batch indices: " + index_list_to_string(merged.indices));
}

}  // namespace batchwire
