#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "codec/payload_codec.hpp"
#include "codec/wire_message.hpp"
#include "core/params.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace batchwire;

TEST(WireMessage_Unit, WriteEmitsContentTypeLineThenBody)
{
  std::ostringstream output;
  write_wire_message(
      output, WireMessage{"multipart/form-data; boundary=B", "abc"});
  EXPECT_EQ(
      output.str(), "Content-Type: multipart/form-data; boundary=B\r\n\r\nabc");
}

TEST(WireMessage_Unit, ReadRestoresMessageWithBinaryBody)
{
  const std::string body("\r\n\r\n\0tail", 9);
  std::stringstream stream;
  write_wire_message(
      stream, WireMessage{"multipart/form-data; boundary=Q", body});

  const WireMessage message = read_wire_message(stream);
  EXPECT_EQ(message.content_type, "multipart/form-data; boundary=Q");
  EXPECT_EQ(message.body, body);
}

TEST(WireMessage_Unit, ReadIgnoresOtherEnvelopeHeaders)
{
  std::istringstream input(
      "X-Origin: test\r\ncontent-type:   multipart/form-data; boundary=Z\r\n"
      "\r\nbody");
  const WireMessage message = read_wire_message(input);
  EXPECT_EQ(message.content_type, "multipart/form-data; boundary=Z");
  EXPECT_EQ(message.body, "body");
}

TEST(WireMessage_Unit, ReadRejectsMissingHeaderBlock)
{
  std::istringstream input("no separator");
  EXPECT_THROW((void)read_wire_message(input), MalformedMultipartException);
}

TEST(WireMessage_Unit, ReadRejectsMissingContentType)
{
  std::istringstream input("X-Other: 1\r\n\r\nbody");
  EXPECT_THROW((void)read_wire_message(input), MalformedMultipartException);
}

TEST(WireMessage_Unit, SaveAndLoadThroughFile)
{
  const ScopedTempDir dir("batchwire_wire_message");
  const auto path = dir.path / "call.wire";
  const WireMessage original = encode_payload_params(
      Params<Payload>({make_json_list_payload({1, 2})}));

  save_wire_message(path, original);
  const WireMessage loaded = load_wire_message(path);

  EXPECT_EQ(loaded.content_type, original.content_type);
  EXPECT_EQ(loaded.body, original.body);
  EXPECT_EQ(decode_payload_params(loaded), decode_payload_params(original));
}

TEST(WireMessage_Unit, LoadOfMissingFileFails)
{
  const ScopedTempDir dir("batchwire_wire_message_missing");
  EXPECT_THROW(
      (void)load_wire_message(dir.path / "absent.wire"), std::runtime_error);
}
