#include <gtest/gtest.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/params.hpp"
#include "utils/exceptions.hpp"

using namespace batchwire;

TEST(Params_Robustness, SampleOfEmptyContainerThrows)
{
  const Params<int> params;
  EXPECT_THROW((void)params.sample(), EmptyParamsException);
}

TEST(Params_Robustness, AllEqualOfEmptyContainerThrows)
{
  const Params<int> params;
  EXPECT_THROW((void)params.all_equal(), EmptyParamsException);
}

TEST(Params_Robustness, IterOfEmptyContainerIsEmpty)
{
  const Params<std::vector<int>> params;
  EXPECT_TRUE(params.iter().empty());
}

TEST(Params_Robustness, IterWithAnEmptySlotYieldsNoRow)
{
  const Params<std::vector<int>> params({{1, 2}, {}});
  EXPECT_TRUE(params.iter().empty());
}

TEST(Params_Robustness, FromMappingCompactsSparseIndices)
{
  std::map<SlotAddress, int> data;
  data.emplace(std::size_t{5}, 50);
  data.emplace(std::size_t{2}, 20);
  const auto params = Params<int>::from_mapping(std::move(data));
  EXPECT_EQ(params.positional(), (std::vector<int>{20, 50}));
}

TEST(Params_Robustness, IndexZeroAndKeyZeroAreDistinctSlots)
{
  std::map<SlotAddress, int> data;
  data.emplace(std::size_t{0}, 1);
  data.emplace(std::string{"0"}, 2);
  const auto params = Params<int>::from_mapping(std::move(data));
  EXPECT_EQ(params.at(std::size_t{0}), 1);
  EXPECT_EQ(params.at(std::string{"0"}), 2);
  EXPECT_EQ(params.size(), 2U);
}

TEST(Params_Robustness, MapIdentityPreservesItems)
{
  const Params<int> params({4, 5}, {{"m", 6}});
  const auto mapped = params.map([](int value) { return value; });
  const auto before = params.items();
  const auto after = mapped.items();
  ASSERT_EQ(before.size(), after.size());
  for (std::size_t idx = 0; idx < before.size(); ++idx) {
    EXPECT_EQ(before[idx].address, after[idx].address);
    EXPECT_EQ(before[idx].value, after[idx].value);
  }
}

TEST(Params_Robustness, SameAddressingIgnoresValues)
{
  const Params<int> lhs({1}, {{"a", 1}});
  const Params<int> rhs({9}, {{"a", 9}});
  EXPECT_TRUE(lhs.same_addressing(rhs));
  EXPECT_FALSE(lhs.same_addressing(Params<int>({1}, {{"b", 1}})));
  EXPECT_FALSE(lhs.same_addressing(Params<int>({1, 2}, {{"a", 1}})));
}

TEST(Params_Robustness, AggMismatchReportsOffendingCall)
{
  const std::vector<Params<int>> calls{
      Params<int>({1}), Params<int>({2}), Params<int>({3, 4})};
  try {
    (void)Params<int>::agg(calls);
    FAIL() << "Expected SlotAddressingMismatchException";
  }
  catch (const SlotAddressingMismatchException& e) {
    EXPECT_NE(std::string(e.what()).find("Call 2"), std::string::npos);
  }
}

TEST(Params_Robustness, AggMismatchIsAnArgumentMismatch)
{
  const std::vector<Params<int>> calls{Params<int>({1}), Params<int>{}};
  EXPECT_THROW((void)Params<int>::agg(calls), ArgumentMismatchException);
}
