#include "loader.hpp"
#include "errors.hpp"
#include "typer.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <set>
#include <sstream>

namespace featherlog {
namespace {
Atom to_atom(const std::map<std::string, Relation> &relations,
             const Prop &prop) {
  return apply(relations.at(prop.pred), prop.args);
}

Row to_row(const Prop &prop) {
  Row row;
  for (const Term &term : prop.args) {
    if (const Value *value = std::get_if<Value>(&term)) {
      row.push_back(*value);
    } else {
      std::ostringstream oss;
      oss << prop;
      throw RangeRestrictionError(boost::str(
          boost::format("fact %1% is not ground, variable %2% is unbound") %
          oss.str() % std::get<Variable>(term).name));
    }
  }
  return row;
}
} // namespace

LoadedProgram load_program(Context &ctx,
                           const std::vector<Declaration> &declarations,
                           const std::vector<Clause> &clauses,
                           const std::vector<GroundedProp> &facts) {
  Program program;
  for (const Declaration &decl : declarations) {
    program.declare(decl);
  }
  for (const Clause &clause : clauses) {
    program.add_clause(clause);
  }
  for (const GroundedProp &fact : facts) {
    program.add_fact(fact);
  }
  std::ostringstream diagnostic;
  if (!program.fully_typed(diagnostic)) {
    throw TypeError(boost::algorithm::trim_copy(diagnostic.str()));
  }

  std::set<std::string> derived;
  for (const Clause &clause : clauses) {
    if (!clause.body.empty()) {
      derived.insert(clause.head.pred);
    }
  }

  // Column names given by the types file, if any
  std::map<std::string, std::vector<std::optional<std::string>>> names;
  for (const Declaration &decl : declarations) {
    std::vector<std::optional<std::string>> &known = names[decl.name];
    known.resize(decl.columns.size());
    for (size_t col = 0; col < decl.columns.size(); ++col) {
      if (!known[col].has_value()) {
        known[col] = decl.columns[col].name;
      }
    }
  }

  LoadedProgram loaded;
  for (const Declaration &pred : program.predicates()) {
    std::vector<Column> columns;
    for (size_t col = 0; col < pred.columns.size(); ++col) {
      std::optional<std::string> name;
      auto it = names.find(pred.name);
      if (it != names.end()) {
        name = it->second[col];
      }
      columns.push_back(Column{
          .name = name.value_or(boost::str(boost::format("_x%1%") % col)),
          .type = pred.columns[col].type});
    }
    Relation rel = derived.count(pred.name)
                       ? ctx.relation_set(pred.name, columns)
                       : ctx.relation(pred.name, columns);
    loaded.relations.emplace(pred.name, std::move(rel));
  }

  // Facts grouped by relation, in order of appearance
  std::vector<std::string> order;
  std::map<std::string, std::vector<Row>> rows;
  auto add_row = [&](const std::string &pred, Row row) {
    if (derived.count(pred)) {
      throw SchemaError(boost::str(
          boost::format("%1% is derived by rules and can't be given facts") %
          pred));
    }
    if (!rows.count(pred)) {
      order.push_back(pred);
    }
    rows[pred].push_back(std::move(row));
  };
  for (const GroundedProp &fact : facts) {
    add_row(fact.pred, fact.args);
  }

  for (const Clause &clause : clauses) {
    if (clause.body.empty()) {
      add_row(clause.head.pred, to_row(clause.head));
      continue;
    }
    Disjunction body;
    for (const std::vector<Prop> &conj : clause.body) {
      Conjunction conjunction;
      for (const Prop &prop : conj) {
        conjunction.atoms.push_back(to_atom(loaded.relations, prop));
      }
      body.conjuncts.push_back(std::move(conjunction));
    }
    loaded.rules.push_back(
        make_rule(to_atom(loaded.relations, clause.head), std::move(body)));
  }

  for (const std::string &pred : order) {
    ctx.insert(loaded.relations.at(pred), rows[pred]);
  }
  return loaded;
}
} // namespace featherlog
