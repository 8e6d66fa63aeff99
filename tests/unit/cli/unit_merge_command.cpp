#include <gtest/gtest.h>

#include <json/json.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/merge_command.hpp"
#include "codec/payload_codec.hpp"
#include "codec/wire_message.hpp"
#include "containers/container_registry.hpp"
#include "containers/json_list_container.hpp"
#include "core/params.hpp"
#include "core/payload.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"
#include "utils/runtime_config.hpp"

using namespace batchwire;

namespace {

auto
encode_call(
    std::initializer_list<int> positional, std::initializer_list<int> named,
    const WireFormat& format = WireFormat{}) -> WireMessage
{
  Params<Payload> params(
      {make_json_list_payload(positional)},
      {{"x", make_json_list_payload(named)}});
  return encode_payload_params(params, format);
}

}  // namespace

TEST(MergeCommand_Unit, MergesCallsAndReportsIndices)
{
  const auto registry = make_default_registry();
  const std::vector<WireMessage> calls{
      encode_call({1}, {10}), encode_call({2, 3}, {20, 30})};

  const MergeResult result =
      merge_wire_messages(calls, 0, WireFormat{}, *registry);

  EXPECT_EQ(result.indices, (IndexList{1, 2}));
  const Params<Payload> merged = decode_payload_params(result.message);
  ASSERT_EQ(merged.positional().size(), 1U);
  EXPECT_EQ(
      JsonListContainer::from_payload(merged.positional()[0]),
      make_json_rows({1, 2, 3}));
  EXPECT_EQ(
      JsonListContainer::from_payload(merged.named().at("x")),
      make_json_rows({10, 20, 30}));
}

TEST(MergeCommand_Unit, KeepsCustomWireFormat)
{
  WireFormat format;
  format.meta_header = "X-Meta";
  format.vendor_namespace = "acme";
  const auto registry = make_default_registry();
  const std::vector<WireMessage> calls{
      encode_call({1}, {2}, format), encode_call({3}, {4}, format)};

  const MergeResult result = merge_wire_messages(calls, 0, format, *registry);

  EXPECT_NE(
      result.message.body.find("application/vnd.acme.JsonList"),
      std::string::npos);
  EXPECT_NE(result.message.body.find("X-Meta: {}"), std::string::npos);
  EXPECT_EQ(decode_payload_params(result.message, format).size(), 2U);
}

TEST(MergeCommand_Unit, DisagreeingCallsRaiseArgumentMismatch)
{
  const auto registry = make_default_registry();
  Params<Payload> only_positional({make_json_list_payload({1})});
  const std::vector<WireMessage> calls{
      encode_call({1}, {2}), encode_payload_params(only_positional)};

  EXPECT_THROW(
      (void)merge_wire_messages(calls, 0, WireFormat{}, *registry),
      BatchProtocolException);
}

TEST(MergeCommand_Unit, IndicesToJsonBuildsIntegerArray)
{
  const Json::Value array = indices_to_json({1, 2, 0});
  ASSERT_TRUE(array.isArray());
  ASSERT_EQ(array.size(), 3U);
  EXPECT_EQ(array[1].asInt64(), 2);
  EXPECT_EQ(indices_to_json({}), Json::Value(Json::arrayValue));
}

TEST(MergeCommand_Unit, RunMergeWritesOutputAndIndices)
{
  const ScopedTempDir dir("batchwire_merge");
  save_wire_message(dir.path / "a.msg", encode_call({1}, {5}));
  save_wire_message(dir.path / "b.msg", encode_call({2, 3}, {6, 7}));

  RuntimeConfig opts;
  opts.input_paths = {
      (dir.path / "a.msg").string(), (dir.path / "b.msg").string()};
  opts.output_path = (dir.path / "out.msg").string();
  opts.indices_output_path = (dir.path / "indices.json").string();
  opts.verbosity = VerbosityLevel::Silent;

  const auto registry = make_default_registry();
  run_merge(opts, *registry);

  EXPECT_EQ(read_file(dir.path / "indices.json"), "[1,2]\n");
  const Params<Payload> merged =
      decode_payload_params(load_wire_message(dir.path / "out.msg"));
  EXPECT_EQ(
      JsonListContainer::from_payload(merged.named().at("x")),
      make_json_rows({5, 6, 7}));
}

TEST(MergeCommand_Unit, RunMergeLogsSummary)
{
  const ScopedTempDir dir("batchwire_merge");
  save_wire_message(dir.path / "a.msg", encode_call({1}, {5}));

  RuntimeConfig opts;
  opts.input_paths = {(dir.path / "a.msg").string()};
  opts.output_path = (dir.path / "out.msg").string();
  opts.verbosity = VerbosityLevel::Stats;

  const auto registry = make_default_registry();
  CaptureStream capture{std::cout};
  run_merge(opts, *registry);

  EXPECT_EQ(
      capture.str(),
      expected_log_line(
          VerbosityLevel::Info,
          "Wrote batched call of 1 inputs to " + opts.output_path) +
          expected_log_line(VerbosityLevel::Stats, "Batch indices: [1]"));
  EXPECT_FALSE(std::filesystem::exists(dir.path / "indices.json"));
}

TEST(MergeCommand_Unit, MissingInputFileIsAnIoError)
{
  const ScopedTempDir dir("batchwire_merge");
  RuntimeConfig opts;
  opts.input_paths = {(dir.path / "absent.msg").string()};
  opts.output_path = (dir.path / "out.msg").string();
  opts.verbosity = VerbosityLevel::Silent;

  const auto registry = make_default_registry();
  EXPECT_THROW(run_merge(opts, *registry), std::runtime_error);
}

TEST(MergeCommand_Unit, MalformedInputIsAProtocolError)
{
  const ScopedTempDir dir("batchwire_merge");
  write_temp_file(dir.path / "bad.msg", "no header separator");
  RuntimeConfig opts;
  opts.input_paths = {(dir.path / "bad.msg").string()};
  opts.output_path = (dir.path / "out.msg").string();
  opts.verbosity = VerbosityLevel::Silent;

  const auto registry = make_default_registry();
  EXPECT_THROW(run_merge(opts, *registry), MalformedMultipartException);
  EXPECT_FALSE(std::filesystem::exists(dir.path / "out.msg"));
}
