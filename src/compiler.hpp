#ifndef DEF_COMPILER_HPP
#define DEF_COMPILER_HPP

#include "algebra.hpp"
#include "schema.hpp"
#include "sql.hpp"
#include <string>
#include <vector>

// Lowering of the rule algebra to SQL. Nothing here touches the database:
// the same input always gives the same statement.
namespace featherlog {
// Table definition, with a primary key over every column so inserts
// deduplicate.
Sql compile_create(const Relation &);
// One row insert ignoring duplicates. Arguments are bound per row.
Sql compile_insert(const Relation &);
// Column list recorded in the catalog, eg `x INTEGER, y TEXT`
std::string column_signature(const Relation &);

// SELECT DISTINCT of the projection for one conjunct. Each atom gets its own
// alias (_a0, _a1, ...) and shared variables become equalities.
Sql compile_conjunction(const Conjunction &, const std::vector<Term> &);
// UNION of the compiled conjuncts
Sql compile_body(const Disjunction &, const std::vector<Term> &);
// Read-back query, optionally ordered by every projected column.
Sql compile_select(const std::vector<Term> &, const Disjunction &,
                   bool ordered = false);
// INSERT of the body projected on the head, ignoring rows already present.
Sql compile_rule(const Rule &);
} // namespace featherlog

#endif
