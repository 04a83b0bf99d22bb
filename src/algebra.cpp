#include "algebra.hpp"
#include "errors.hpp"
#include <boost/format.hpp>
#include <set>
#include <sstream>
#include <type_traits>

namespace featherlog {
namespace {
template <typename T> std::string to_string(const T &t) {
  std::ostringstream oss;
  oss << t;
  return oss.str();
}
} // namespace

std::ostream &operator<<(std::ostream &os, const Atom &atom) {
  os << atom.relation.name << '(';
  for (size_t arg = 0; arg < atom.terms.size(); ++arg) {
    if (arg != 0) {
      os << ", ";
    }
    os << atom.terms[arg];
  }
  os << ')';
  return os;
}

std::ostream &operator<<(std::ostream &os, const Conjunction &conj) {
  for (size_t atom = 0; atom < conj.atoms.size(); ++atom) {
    if (atom != 0) {
      os << ", ";
    }
    os << conj.atoms[atom];
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const Disjunction &disj) {
  for (size_t conj = 0; conj < disj.conjuncts.size(); ++conj) {
    if (conj != 0) {
      os << " ; ";
    }
    os << disj.conjuncts[conj];
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const Rule &rule) {
  return os << rule.head() << " :- " << rule.body() << '.';
}

Atom apply(const Relation &rel, std::vector<Term> terms) {
  if (terms.size() != rel.arity()) {
    throw ArityError(boost::str(
        boost::format("relation %1% has %2% columns but is applied to %3% "
                      "terms") %
        rel.name % rel.arity() % terms.size()));
  }
  for (size_t arg = 0; arg < terms.size(); ++arg) {
    const Value *value = std::get_if<Value>(&terms[arg]);
    if (value && !value_fits(rel.columns[arg].type, *value)) {
      throw TypeError(boost::str(
          boost::format("constant %1% does not fit column %2% of %3%, which "
                        "has type %4%") %
          to_string(*value) % rel.columns[arg].name % rel.name %
          rel.columns[arg].type));
    }
  }
  return Atom{.relation = rel, .terms = std::move(terms)};
}

Conjunction::Conjunction(Atom atom) { atoms.push_back(std::move(atom)); }

Disjunction::Disjunction(Atom atom) {
  conjuncts.push_back(Conjunction(std::move(atom)));
}

Disjunction::Disjunction(Conjunction conj) {
  conjuncts.push_back(std::move(conj));
}

Conjunction conjoin(const Conjunction &left, const Conjunction &right) {
  Conjunction r = left;
  r.atoms.insert(r.atoms.end(), right.atoms.begin(), right.atoms.end());
  return r;
}

Disjunction conjoin(const Disjunction &left, const Disjunction &right) {
  Disjunction r;
  for (const Conjunction &l : left.conjuncts) {
    for (const Conjunction &rc : right.conjuncts) {
      r.conjuncts.push_back(conjoin(l, rc));
    }
  }
  return r;
}

Disjunction disjoin(const Disjunction &left, const Disjunction &right) {
  Disjunction r = left;
  r.conjuncts.insert(r.conjuncts.end(), right.conjuncts.begin(),
                     right.conjuncts.end());
  return r;
}

Conjunction operator&(const Atom &l, const Atom &r) {
  return conjoin(Conjunction(l), Conjunction(r));
}
Conjunction operator&(const Atom &l, const Conjunction &r) {
  return conjoin(Conjunction(l), r);
}
Conjunction operator&(const Conjunction &l, const Atom &r) {
  return conjoin(l, Conjunction(r));
}
Conjunction operator&(const Conjunction &l, const Conjunction &r) {
  return conjoin(l, r);
}
Disjunction operator&(const Disjunction &l, const Disjunction &r) {
  return conjoin(l, r);
}
Disjunction operator|(const Disjunction &l, const Disjunction &r) {
  return disjoin(l, r);
}

SymbolTable bind_symbols(const Disjunction &body) {
  SymbolTable symbols;
  for (const Conjunction &conj : body.conjuncts) {
    for (const Atom &atom : conj.atoms) {
      for (size_t arg = 0; arg < atom.terms.size(); ++arg) {
        const Variable *var = std::get_if<Variable>(&atom.terms[arg]);
        if (!var) {
          continue;
        }
        Type tp = atom.relation.columns[arg].type;
        auto [it, inserted] = symbols.emplace(var->name, tp);
        if (!inserted && it->second != tp) {
          throw TypeError(boost::str(
              boost::format("variable %1% is bound to both %2% and %3% "
                            "columns (in %4%)") %
              var->name % it->second % tp % atom));
        }
      }
    }
  }
  return symbols;
}

void check_well_formed(const Disjunction &body) {
  if (body.conjuncts.empty()) {
    throw CompileError("empty disjunction");
  }
  for (const Conjunction &conj : body.conjuncts) {
    if (conj.atoms.empty()) {
      throw CompileError("empty conjunction in " + to_string(body));
    }
  }
}

void check_range_restriction(const std::vector<Term> &terms,
                             const Disjunction &body) {
  for (const Conjunction &conj : body.conjuncts) {
    std::set<std::string> bound;
    for (const Atom &atom : conj.atoms) {
      for (const Term &t : atom.terms) {
        if (const Variable *var = std::get_if<Variable>(&t)) {
          bound.insert(var->name);
        }
      }
    }
    for (const Term &t : terms) {
      const Variable *var = std::get_if<Variable>(&t);
      if (var && bound.find(var->name) == bound.end()) {
        throw RangeRestrictionError(
            boost::str(boost::format("variable %1% is not bound by %2%") %
                       var->name % conj));
      }
    }
  }
}

Rule::Rule(Atom head, Disjunction body)
    : _head(std::move(head)), _body(std::move(body)) {
  if (!_head.relation.derived()) {
    throw SchemaError(boost::str(
        boost::format("%1% is a base relation and cannot be a rule head") %
        _head.relation.name));
  }
  check_well_formed(_body);
  check_range_restriction(_head.terms, _body);
  _symbols = bind_symbols(_body);

  for (size_t arg = 0; arg < _head.terms.size(); ++arg) {
    const Variable *var = std::get_if<Variable>(&_head.terms[arg]);
    if (!var) {
      continue;
    }
    Type column = _head.relation.columns[arg].type;
    Type tp = _symbols.at(var->name);
    if (tp != column && !(tp == Type::Integer && column == Type::Real)) {
      throw TypeError(boost::str(
          boost::format("variable %1% has type %2% but column %3% of %4% has "
                        "type %5%") %
          var->name % tp % _head.relation.columns[arg].name %
          _head.relation.name % column));
    }
  }
}

Rule make_rule(Atom head, Disjunction body) {
  return Rule(std::move(head), std::move(body));
}

Rule operator<=(const Atom &head, const Disjunction &body) {
  return Rule(head, body);
}
} // namespace featherlog
