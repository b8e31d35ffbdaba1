#include "engine/rule_config.hpp"

#include "common/throw.hpp"
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Quezhuo{

void RuleConfig::validate() const
{
  if (initial_score < 1000) {
    QUEZHUO_THROW<std::invalid_argument>(_1) << initial_score << ": An invalid initial score.";
  }
  for (std::uint_fast8_t const n : num_red_fives) {
    if (n > 1u) {
      QUEZHUO_THROW<std::invalid_argument>(_1)
        << static_cast<unsigned>(n) << ": At most one red five per suit is supported.";
    }
  }
  if (min_game_end_score > initial_score) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << min_game_end_score << ": The game would end before it starts.";
  }
  if (target_score && *target_score <= initial_score) {
    QUEZHUO_THROW<std::invalid_argument>(_1)
      << *target_score << ": The target score must exceed the initial score.";
  }
}

std::uint_fast8_t RuleConfig::getLastChang() const noexcept
{
  switch (game_length) {
  case GameLength::dongfeng_zhan:
    return 0u;
  case GameLength::banzhuang:
    return 1u;
  case GameLength::yizhuang:
    return 3u;
  }
  return 1u;
}

} // namespace Quezhuo
