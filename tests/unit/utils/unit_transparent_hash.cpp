#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "utils/transparent_hash.hpp"

using namespace batchwire;

TEST(TransparentHash_Unit, TransparentLookup)
{
  std::unordered_map<std::string, int, TransparentHash, std::equal_to<>> map;
  map.try_emplace("JsonList", 1);
  map.try_emplace(std::string{"TorchTensor"}, 2);

  const std::string str_key = "JsonList";
  const std::string_view sv_key = "TorchTensor";
  const char* c_key = "JsonList";

  auto iter1 = map.find(str_key);
  ASSERT_NE(iter1, map.end());
  EXPECT_EQ(iter1->second, 1);

  auto iter2 = map.find(sv_key);
  ASSERT_NE(iter2, map.end());
  EXPECT_EQ(iter2->second, 2);

  auto iter3 = map.find(c_key);
  ASSERT_NE(iter3, map.end());
  EXPECT_EQ(iter3->second, 1);
}

TEST(TransparentHash_Unit, LookupMissingKeysReturnsEnd)
{
  std::unordered_map<std::string, int, TransparentHash, std::equal_to<>> map;
  map.emplace("JsonList", 1);

  EXPECT_EQ(map.find(std::string{"jsonlist"}), map.end());
  EXPECT_EQ(map.find(std::string_view{"Json"}), map.end());
  EXPECT_EQ(map.find(""), map.end());
}

TEST(TransparentHash_Unit, AllOverloadsAgree)
{
  const TransparentHash hash;
  const std::string key = "--batch-dim";
  EXPECT_EQ(hash(key), hash(std::string_view{key}));
  EXPECT_EQ(hash(key), hash(key.c_str()));
}

TEST(TransparentHash_Unit, SetContainsWithStringView)
{
  const std::unordered_set<std::string, TransparentHash, std::equal_to<>> keys{
      "inputs", "output"};
  EXPECT_TRUE(keys.contains(std::string_view{"inputs"}));
  EXPECT_FALSE(keys.contains(std::string_view{"input"}));
}
