#ifndef DEF_TYPER_HPP
#define DEF_TYPER_HPP

#include "datalog.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <vector>

namespace featherlog {
// Infers the column types of every predicate of a text program by unifying
// the arguments through shared variables. Constants and rule heads only give
// lower bounds: integers fit real columns, and a head column may be real while
// the body variable feeding it is an integer.
class Program {
public:
  // Extend the program
  // Returns false if adding the declaration/clause/fact causes a conflict
  bool declare(const Declaration &);
  bool add_clause(const Clause &);
  bool add_fact(const GroundedProp &);

  bool has_conflict() const;
  // Same, printing the conflict on the stream
  bool has_conflict(std::ostream &) const;
  // Check if it is fully typed without conflict
  bool fully_typed() const;
  // Check if fully typed and if not print error on stream
  bool fully_typed(std::ostream &) const;
  // Get the typed predicates, with unnamed columns
  // Must NOT be called if fully_typed returned false
  std::vector<Declaration> predicates() const;

private:
  void init();
  size_t fresh_cell();
  // nullptr if the predicate is known with another arity
  std::vector<size_t> *get_pred(const std::string &, size_t);
  size_t find(size_t);
  size_t find(size_t) const;
  // Return false if both classes carry incompatible types
  bool unite(size_t, size_t);
  // The exact type of the class if any, else its lower bound
  std::optional<Type> known(size_t) const;
  size_t type_cell(Type) const;
  bool add_prop(const Prop &, std::map<std::string, size_t> &);
  bool add_head(const Prop &, std::map<std::string, size_t> &);
  bool add_value(const std::string &, size_t, size_t, const Value &);
  // Unite, recording a conflict on the given predicate argument on failure
  bool unite_arg(const std::string &, size_t, size_t, size_t);

  struct Cell {
    size_t parent;
    uint64_t rank;
    // Set by declarations
    std::optional<Type> type;
    // Smallest type holding every constant seen
    std::optional<Type> floor;
  };
  std::map<std::string, std::vector<size_t>> _predicates;
  std::vector<Cell> _uf;

  // The head argument must hold every value of the body variable
  struct Widening {
    size_t from;
    size_t to;
    std::string pred;
    size_t arg;
  };
  std::vector<Widening> _widenings;

  struct Conflict {
    std::string pred;
    size_t arg;
    Type type1;
    Type type2;
  };
  std::optional<Conflict> _conflict;

  // Type every class by pushing lower bounds along the widenings. When
  // infer_sources is set, an untyped body variable takes the type of the head
  // argument it feeds.
  std::optional<Conflict> resolve(std::map<size_t, Type> &,
                                  bool infer_sources) const;
  // Record the conflict raised by the widenings, if any
  bool check_widenings();

  struct ArityConflict {
    std::string pred;
    size_t arity1;
    size_t arity2;
  };
  std::optional<ArityConflict> _arity_conflict;
};
} // namespace featherlog

#endif
