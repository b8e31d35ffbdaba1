#if !defined(QUEZHUO_ENGINE_UTILITY_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_UTILITY_HPP_INCLUDE_GUARD

#include <vector>
#include <cstdint>


namespace Quezhuo{

// A full-state seed for `std::mt19937` from `std::random_device`.
std::vector<std::uint_least32_t> getRandomSeed();

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_UTILITY_HPP_INCLUDE_GUARD)
