#include <gtest/gtest.h>

#include "codec/wire_format.hpp"
#include "utils/runtime_config.hpp"

using namespace batchwire;

TEST(RuntimeConfig, DefaultsDescribeAnEmptyValidRun)
{
  const RuntimeConfig cfg;
  EXPECT_TRUE(cfg.valid);
  EXPECT_FALSE(cfg.show_help);
  EXPECT_EQ(cfg.batch_dim, 0);
  EXPECT_EQ(cfg.verbosity, VerbosityLevel::Info);
  EXPECT_TRUE(cfg.input_paths.empty());
  EXPECT_TRUE(cfg.output_path.empty());
  EXPECT_TRUE(cfg.indices_output_path.empty());
}

TEST(RuntimeConfig, WireFormatDefaults)
{
  const WireFormat format;
  EXPECT_EQ(format.meta_header, "Payload-Meta");
  EXPECT_EQ(format.vendor_namespace, "batchwire");
  EXPECT_EQ(format.max_parts, 256U);
  EXPECT_EQ(format.max_message_bytes, 32U * 1024U * 1024U);
}

TEST(RuntimeConfig, ContentTypePrefixFollowsNamespace)
{
  WireFormat format;
  EXPECT_EQ(format.content_type_prefix(), "application/vnd.batchwire.");
  format.vendor_namespace = "acme.rpc";
  EXPECT_EQ(format.content_type_prefix(), "application/vnd.acme.rpc.");
}

TEST(RuntimeConfig, HeaderTokenAlphabet)
{
  EXPECT_TRUE(is_header_token("Payload-Meta"));
  EXPECT_TRUE(is_header_token("acme.rpc_v2"));
  EXPECT_FALSE(is_header_token(""));
  EXPECT_FALSE(is_header_token("A:B"));
  EXPECT_FALSE(is_header_token("a b"));
  EXPECT_FALSE(is_header_token("x\r\n"));
}
