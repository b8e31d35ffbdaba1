#if !defined(QUEZHUO_ENGINE_ERROR_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_ERROR_HPP_INCLUDE_GUARD

#include <stdexcept>


namespace Quezhuo{

// A broken engine invariant, e.g. removing a tile that is not in a hand.
// Never a consequence of caller input; the hand in progress cannot go on.
class InvariantViolation
  : public std::logic_error
{
public:
  using std::logic_error::logic_error;
}; // class InvariantViolation

} // namespace Quezhuo

#endif // !defined(QUEZHUO_ENGINE_ERROR_HPP_INCLUDE_GUARD)
