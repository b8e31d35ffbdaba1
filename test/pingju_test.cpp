#include "engine/pingju.hpp"

#include <gtest/gtest.h>
#include <array>
#include <cstdint>


namespace Quezhuo{

namespace{

using Payments = std::array<std::int_fast32_t, 4u>;

} // namespace `anonymous`

TEST(PingjuTest, TwoTingpai)
{
  EXPECT_EQ(calculateNotenPayments({ true, false, true, false }), (Payments{ 1500, -1500, 1500, -1500 }));
}

TEST(PingjuTest, OneTingpai)
{
  EXPECT_EQ(calculateNotenPayments({ false, false, true, false }), (Payments{ -1000, -1000, 3000, -1000 }));
}

TEST(PingjuTest, ThreeTingpai)
{
  EXPECT_EQ(calculateNotenPayments({ true, true, false, true }), (Payments{ 1000, 1000, -3000, 1000 }));
}

TEST(PingjuTest, NobodyOrEverybodyTingpai)
{
  EXPECT_EQ(calculateNotenPayments({ false, false, false, false }), (Payments{}));
  EXPECT_EQ(calculateNotenPayments({ true, true, true, true }), (Payments{}));
}

TEST(PingjuTest, PaymentsSumToZero)
{
  for (unsigned mask = 0u; mask < 16u; ++mask) {
    std::array<bool, 4u> tingpai{};
    for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
      tingpai[i] = (mask >> i & 1u) != 0u;
    }
    Payments const payments = calculateNotenPayments(tingpai);
    EXPECT_EQ(payments[0u] + payments[1u] + payments[2u] + payments[3u], 0) << mask;
  }
}

} // namespace Quezhuo
