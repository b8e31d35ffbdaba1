#include "engine/pai.hpp"

#include "common/throw.hpp"
#include <ostream>
#include <string_view>
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <limits>
#include <cstdint>


namespace{

using std::placeholders::_1;

std::uint_fast8_t getSuitBase(char const c)
{
  switch (c) {
  case 'm':
    return 0u;
  case 'p':
    return 9u;
  case 's':
    return 18u;
  case 'z':
    return 27u;
  default:
    return std::numeric_limits<std::uint_fast8_t>::max();
  }
}

constexpr char suit_chars[] = { 'm', 'p', 's', 'z' };

} // namespace `anonymous`

namespace Quezhuo{

Pai::Pai(std::uint_fast8_t const value, bool const red)
  : value_(value),
    red_(red)
{
  if (value_ >= num_pai_values) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(value_)
                                             << ": An invalid tile value.";
  }
  if (red_ && (isZipai(value_) || getNumber(value_) != 5u)) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(value_)
                                             << ": Only a five can be red.";
  }
}

Pai Pai::fromString(std::string_view const s)
{
  if (s.size() != 2u) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << "pai = " << s;
  }

  std::uint_fast8_t const base = getSuitBase(s[1u]);
  if (base == std::numeric_limits<std::uint_fast8_t>::max()) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << "pai = " << s;
  }
  if (s[0u] < '0' || '9' < s[0u]) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << "pai = " << s;
  }

  std::uint_fast8_t const num = s[0u] - '0';
  if (base == 27u) {
    if (num == 0u || num >= 8u) {
      QUEZHUO_THROW<std::invalid_argument>(_1) << "pai = " << s;
    }
    return Pai(base + num - 1u);
  }
  if (num == 0u) {
    // 赤牌
    return Pai(base + 4u, true);
  }
  return Pai(base + num - 1u);
}

std::string Pai::toString() const
{
  std::string result;
  result.push_back(red_ ? '0' : static_cast<char>('0' + getNumber(value_)));
  result.push_back(suit_chars[getSuit(value_)]);
  return result;
}

std::ostream &operator<<(std::ostream &os, Pai const &pai)
{
  return os << pai.toString();
}

std::vector<Pai> parsePaiList(std::string_view const s)
{
  std::vector<Pai> result;
  std::string_view::size_type first = 0u;
  for (std::string_view::size_type i = 0u; i < s.size(); ++i) {
    char const c = s[i];
    if ('0' <= c && c <= '9') {
      continue;
    }
    if (getSuitBase(c) == std::numeric_limits<std::uint_fast8_t>::max() || first == i) {
      QUEZHUO_THROW<std::invalid_argument>(_1) << s << ": A malformed tile list.";
    }
    for (std::string_view::size_type j = first; j < i; ++j) {
      char const pai[] = { s[j], c };
      result.push_back(Pai::fromString(std::string_view(pai, 2u)));
    }
    first = i + 1u;
  }
  if (first != s.size()) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << s << ": A trailing suit is missing.";
  }
  return result;
}

std::string toString(std::vector<Pai> const &pais)
{
  std::string result;
  for (Pai const &pai : pais) {
    result += pai.toString();
  }
  return result;
}

PaiCounts countPais(std::vector<Pai> const &pais) noexcept
{
  PaiCounts counts{};
  for (Pai const &pai : pais) {
    ++counts[pai.getValue()];
  }
  return counts;
}

} // namespace Quezhuo
