#ifndef DEF_ALGEBRA_HPP
#define DEF_ALGEBRA_HPP

#include "datalog.hpp"
#include "schema.hpp"
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace featherlog {
struct Atom {
  Relation relation;
  std::vector<Term> terms;
};
std::ostream &operator<<(std::ostream &, const Atom &);

// Throws ArityError if the number of terms differs from the number of
// columns, and TypeError if a constant does not fit its column.
Atom apply(const Relation &, std::vector<Term>);

template <typename... Args>
Atom Relation::operator()(const Args &...args) const {
  return apply(*this, std::vector<Term>{to_term(args)...});
}

struct Conjunction {
  Conjunction() = default;
  Conjunction(Atom);

  std::vector<Atom> atoms;
};
std::ostream &operator<<(std::ostream &, const Conjunction &);

// Disjunctive normal form: any conjunct suffices.
struct Disjunction {
  Disjunction() = default;
  Disjunction(Atom);
  Disjunction(Conjunction);

  std::vector<Conjunction> conjuncts;
};
std::ostream &operator<<(std::ostream &, const Disjunction &);

// Both flatten their operands. Conjoining disjunctions distributes the
// conjunction over the disjuncts.
Conjunction conjoin(const Conjunction &, const Conjunction &);
Disjunction conjoin(const Disjunction &, const Disjunction &);
Disjunction disjoin(const Disjunction &, const Disjunction &);

Conjunction operator&(const Atom &, const Atom &);
Conjunction operator&(const Atom &, const Conjunction &);
Conjunction operator&(const Conjunction &, const Atom &);
Conjunction operator&(const Conjunction &, const Conjunction &);
Disjunction operator&(const Disjunction &, const Disjunction &);
Disjunction operator|(const Disjunction &, const Disjunction &);

// Variable name to the type of the columns it is bound to
using SymbolTable = std::map<std::string, Type>;

// Throws TypeError if a variable is bound to columns of different types.
SymbolTable bind_symbols(const Disjunction &);
// Throws CompileError on an empty disjunction or an empty conjunct.
void check_well_formed(const Disjunction &);
// Throws RangeRestrictionError if a variable of terms is missing from one of
// the disjuncts.
void check_range_restriction(const std::vector<Term> &, const Disjunction &);

class Rule {
public:
  // Validates everything that can be checked without the backing store:
  // well formed body, derived head, range restriction and variable types.
  Rule(Atom head, Disjunction body);

  const Atom &head() const { return _head; }
  const Disjunction &body() const { return _body; }
  const SymbolTable &symbols() const { return _symbols; }

private:
  Atom _head;
  Disjunction _body;
  SymbolTable _symbols;
};
std::ostream &operator<<(std::ostream &, const Rule &);

Rule make_rule(Atom head, Disjunction body);
// path(x, z) <= (edge(x, z) | (edge(x, y) & path(y, z)))
// Parentheses are needed around a body using | or &, since <= binds tighter.
Rule operator<=(const Atom &, const Disjunction &);
} // namespace featherlog

#endif
