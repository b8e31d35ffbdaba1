#if !defined(QUEZHUO_ENGINE_MODULE_HPP_INCLUDE_GUARD)
#define QUEZHUO_ENGINE_MODULE_HPP_INCLUDE_GUARD

#include "engine/table.hpp"
#include <boost/python/module.hpp>
#include <boost/python/class.hpp>
#include <boost/python/init.hpp>
#include <boost/python/dict.hpp>
#include <boost/python/list.hpp>
#include <boost/python/object.hpp>
#include <boost/noncopyable.hpp>
#include <memory>


namespace Quezhuo{

// `Table` as seen from Python. Actions are chosen by their index in
// `legal_actions`.
class PythonTable
{
public:
  explicit PythonTable(boost::python::dict config);

  PythonTable(PythonTable const &) = delete;

  PythonTable &operator=(PythonTable const &) = delete;

public:
  // `seed` is `None` or a list of integers.
  void reset(boost::python::object seed);

  void resetRound();

  boost::python::list getLegalActions(long seat) const;

  boost::python::dict apply(long seat, long index);

  boost::python::dict getSnapshot() const;

  bool isGameOver() const;

private:
  std::unique_ptr<Quezhuo::Table> p_table_;
}; // class PythonTable

} // namespace Quezhuo

BOOST_PYTHON_MODULE(_quezhuo)
{
  boost::python::class_<Quezhuo::PythonTable, boost::noncopyable>(
    "Table", boost::python::init<boost::python::dict>())
    .def("reset", &Quezhuo::PythonTable::reset)
    .def("reset_round", &Quezhuo::PythonTable::resetRound)
    .def("legal_actions", &Quezhuo::PythonTable::getLegalActions)
    .def("apply", &Quezhuo::PythonTable::apply)
    .def("snapshot", &Quezhuo::PythonTable::getSnapshot)
    .def("is_game_over", &Quezhuo::PythonTable::isGameOver);
} // BOOST_PYTHON_MODULE(_quezhuo)


#endif // !defined(QUEZHUO_ENGINE_MODULE_HPP_INCLUDE_GUARD)
