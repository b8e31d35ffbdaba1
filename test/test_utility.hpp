#if !defined(QUEZHUO_TEST_TEST_UTILITY_HPP_INCLUDE_GUARD)
#define QUEZHUO_TEST_TEST_UTILITY_HPP_INCLUDE_GUARD

#include "engine/table.hpp"
#include "engine/paishan.hpp"
#include "engine/fulu.hpp"
#include "engine/pai.hpp"
#include <optional>
#include <string_view>
#include <vector>
#include <array>
#include <cstdint>


namespace Quezhuo::Testing{

// A wall dealing `shoupais[seat]` (13 tiles each, compact notation) with
// `zhuangjia` dealing first, then yielding `zimo_pais` in order. The dead wall
// starts with `wangpai` (replacement tiles, then dora and ura dora indicator
// pairs). Unless `full` is false the remaining tiles of a 136-tile set fill the
// live wall after `zimo_pais`. Any part of the dead wall left unspecified is
// taken from the remaining tiles.
Quezhuo::Paishan createPaishan(
  std::array<std::string_view, 4u> const &shoupais, std::string_view zimo_pais,
  std::string_view wangpai, std::uint_fast8_t zhuangjia = 0u, bool full = true);

// The number of copies of every tile value in the hands, the unclaimed
// discards, the melds and the undrawn wall.
Quezhuo::PaiCounts countTableTiles(Quezhuo::Table const &table);

// The drawn tile of the acting seat.
Quezhuo::Pai getZimoPai(Quezhuo::Table const &table);

// Discards every drawn tile and passes on every response until a hand ends.
std::optional<Quezhuo::RoundResult> playMoqiUntilRoundEnd(Quezhuo::Table &table);

Quezhuo::Fulu makeFulu(
  Quezhuo::FuluType type, std::string_view pais, std::string_view called_pai,
  std::uint_fast8_t from_seat);

} // namespace Quezhuo::Testing

#endif // !defined(QUEZHUO_TEST_TEST_UTILITY_HPP_INCLUDE_GUARD)
