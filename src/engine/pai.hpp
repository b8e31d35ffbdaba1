#if !defined(QUEZHUO_ENGINE_PAI_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_PAI_HPP_INCLUDE_GUARD

#include <iosfwd>
#include <functional>
#include <compare>
#include <string_view>
#include <string>
#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>


namespace Quezhuo{

// 牌の種類: 0-8 萬子, 9-17 筒子, 18-26 索子, 27-30 東南西北, 31-33 白發中
inline constexpr std::uint_fast8_t num_pai_values = 34u;

using PaiCounts = std::array<std::uint_fast8_t, num_pai_values>;

class Pai
{
public:
  constexpr Pai() noexcept = default;

  Pai(std::uint_fast8_t value, bool red = false);

  // `1m` ... `9m`, `0m` (red 5m), likewise `p` and `s`, `1z` ... `7z`.
  static Pai fromString(std::string_view s);

  std::uint_fast8_t getValue() const noexcept
  {
    return value_;
  }

  bool isRed() const noexcept
  {
    return red_;
  }

  std::string toString() const;

  auto operator<=>(Pai const &) const noexcept = default;

private:
  std::uint_fast8_t value_ = 0u;
  bool red_ = false;
}; // class Pai

std::ostream &operator<<(std::ostream &os, Pai const &pai);

// Parses the compact notation, e.g. `123m0p11z`.
std::vector<Pai> parsePaiList(std::string_view s);

std::string toString(std::vector<Pai> const &pais);

// 0: 萬子, 1: 筒子, 2: 索子, 3: 字牌
constexpr std::uint_fast8_t getSuit(std::uint_fast8_t const value) noexcept
{
  return value / 9u;
}

// 1-9 for number tiles, 1-7 for honor tiles.
constexpr std::uint_fast8_t getNumber(std::uint_fast8_t const value) noexcept
{
  return value % 9u + 1u;
}

constexpr bool isZipai(std::uint_fast8_t const value) noexcept
{
  return value >= 27u;
}

constexpr bool isLaotou(std::uint_fast8_t const value) noexcept
{
  return !isZipai(value) && (value % 9u == 0u || value % 9u == 8u);
}

constexpr bool isYaojiu(std::uint_fast8_t const value) noexcept
{
  return isZipai(value) || isLaotou(value);
}

constexpr bool isSanyuan(std::uint_fast8_t const value) noexcept
{
  return value >= 31u;
}

constexpr bool isFeng(std::uint_fast8_t const value) noexcept
{
  return 27u <= value && value < 31u;
}

// The tile indicated as dora by `indicator`.
constexpr std::uint_fast8_t getDoraValue(std::uint_fast8_t const indicator) noexcept
{
  if (indicator < 27u) {
    return indicator / 9u * 9u + (indicator % 9u + 1u) % 9u;
  }
  if (indicator < 31u) {
    return 27u + (indicator - 27u + 1u) % 4u;
  }
  return 31u + (indicator - 31u + 1u) % 3u;
}

PaiCounts countPais(std::vector<Pai> const &pais) noexcept;

} // namespace Quezhuo

template<>
struct std::hash<Quezhuo::Pai>
{
  std::size_t operator()(Quezhuo::Pai const &pai) const noexcept
  {
    return pai.getValue() * 2u + (pai.isRed() ? 1u : 0u);
  }
}; // struct std::hash<Quezhuo::Pai>

#endif // !defined(QUEZHUO_ENGINE_PAI_HPP_INCLUDE_GUARD)
