#if !defined(QUEZHUO_ENGINE_CANDIDATES_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_CANDIDATES_HPP_INCLUDE_GUARD

#include "engine/round_state.hpp"
#include "engine/game_state.hpp"
#include "engine/yaku.hpp"
#include "engine/action.hpp"
#include <optional>
#include <vector>
#include <utility>
#include <map>
#include <cstdint>


namespace Quezhuo{

// The situation `seat` would win in, by a zimo on its drawn tile or by a rong
// on the tile of the response window.
HuleContext createHuleContext(
  GameState const &game_state, RoundState const &round_state, std::uint_fast8_t seat, bool zimo);

// Legal actions of the acting seat holding 14 tiles' worth. Discards come
// first, one per distinct tile.
std::vector<Action> getCandidatesOnZimo(
  GameState const &game_state, RoundState const &round_state, std::uint_fast8_t seat);

// Legal responses of `seat` to the tile of the response window. `Skip` is
// always the last element.
std::vector<Action> getCandidatesOnDapai(
  GameState const &game_state, RoundState const &round_state, std::uint_fast8_t seat);

// Picks the declaration that takes effect: rong over peng and daminggang over
// chi, ties broken by the first seat found going from the discarder to its
// left (discarder - 1, - 2, - 3). Empty when every declaration is `Skip`.
std::optional<std::pair<std::uint_fast8_t, Action>> resolveDeclarations(
  std::map<std::uint_fast8_t, Action> const &declarations, std::uint_fast8_t dapai_seat);

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_CANDIDATES_HPP_INCLUDE_GUARD)
