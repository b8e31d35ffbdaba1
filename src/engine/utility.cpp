#include "engine/utility.hpp"

#include <random>
#include <vector>
#include <cstdint>
#include <cstddef>


namespace Quezhuo{

std::vector<std::uint_least32_t> getRandomSeed()
{
  constexpr std::size_t state_size = std::mt19937::state_size;

  std::random_device rand;
  std::vector<std::uint_least32_t> seed;
  seed.reserve(state_size);
  for (std::size_t i = 0; i < state_size; ++i) {
    std::uint_least32_t const seed_ = rand();
    seed.push_back(seed_);
  }
  return seed;
}

} // namespace Quezhuo
