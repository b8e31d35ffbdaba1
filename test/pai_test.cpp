#include "engine/pai.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>


namespace Quezhuo{

TEST(PaiTest, FromString)
{
  EXPECT_EQ(Pai::fromString("1m").getValue(), 0u);
  EXPECT_EQ(Pai::fromString("9p").getValue(), 17u);
  EXPECT_EQ(Pai::fromString("5s").getValue(), 22u);
  EXPECT_EQ(Pai::fromString("1z").getValue(), 27u);
  EXPECT_EQ(Pai::fromString("7z").getValue(), 33u);

  Pai const red = Pai::fromString("0p");
  EXPECT_EQ(red.getValue(), 13u);
  EXPECT_TRUE(red.isRed());
  EXPECT_EQ(red.toString(), "0p");
  EXPECT_NE(red, Pai::fromString("5p"));
}

TEST(PaiTest, InvalidNotation)
{
  EXPECT_THROW(Pai::fromString("8z"), std::invalid_argument);
  EXPECT_THROW(Pai::fromString("0z"), std::invalid_argument);
  EXPECT_THROW(Pai::fromString("1x"), std::invalid_argument);
  EXPECT_THROW(Pai::fromString("12m"), std::invalid_argument);
  EXPECT_THROW(Pai(34u), std::invalid_argument);
  EXPECT_THROW(Pai(3u, true), std::invalid_argument);
  EXPECT_THROW(parsePaiList("123"), std::invalid_argument);
  EXPECT_THROW(parsePaiList("m"), std::invalid_argument);
}

TEST(PaiTest, ParsePaiList)
{
  std::vector<Pai> const pais = parsePaiList("123m0p11z");
  ASSERT_EQ(pais.size(), 6u);
  EXPECT_EQ(pais[0u], Pai(0u));
  EXPECT_EQ(pais[2u], Pai(2u));
  EXPECT_EQ(pais[3u], Pai(13u, true));
  EXPECT_EQ(pais[5u], Pai(27u));
  EXPECT_EQ(toString(pais), "1m2m3m0p1z1z");
}

TEST(PaiTest, Classification)
{
  EXPECT_TRUE(isLaotou(Pai::fromString("9s").getValue()));
  EXPECT_FALSE(isLaotou(Pai::fromString("1z").getValue()));
  EXPECT_TRUE(isYaojiu(Pai::fromString("1z").getValue()));
  EXPECT_FALSE(isYaojiu(Pai::fromString("2m").getValue()));
  EXPECT_TRUE(isFeng(Pai::fromString("4z").getValue()));
  EXPECT_TRUE(isSanyuan(Pai::fromString("5z").getValue()));
  EXPECT_EQ(getNumber(Pai::fromString("7p").getValue()), 7u);
  EXPECT_EQ(getSuit(Pai::fromString("7p").getValue()), 1u);
}

TEST(PaiTest, DoraCycle)
{
  auto dora = [](char const *indicator) {
    return Pai(getDoraValue(Pai::fromString(indicator).getValue())).toString();
  };
  EXPECT_EQ(dora("1m"), "2m");
  EXPECT_EQ(dora("9m"), "1m");
  EXPECT_EQ(dora("9p"), "1p");
  EXPECT_EQ(dora("9s"), "1s");
  EXPECT_EQ(dora("4z"), "1z");
  EXPECT_EQ(dora("2z"), "3z");
  EXPECT_EQ(dora("7z"), "5z");
  EXPECT_EQ(dora("5z"), "6z");
}

} // namespace Quezhuo
