#ifndef DEF_SCHEMA_HPP
#define DEF_SCHEMA_HPP

#include "datalog.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace featherlog {
struct Atom;

enum class RelationKind { Base, Derived };
std::ostream &operator<<(std::ostream &, const RelationKind &);

struct Column {
  std::string name;
  Type type;
};

// Columns named _x0, _x1, ... for relations declared by their types only.
std::vector<Column> positional(const std::vector<Type> &);

// Columns given as (name, SQL type name) pairs. Throws SchemaError on a type
// parse_type does not support. The first argument is the relation name, for
// messages.
std::vector<Column>
parse_columns(const std::string &,
              const std::vector<std::pair<std::string, std::string>> &);

// A base relation is populated by inserts, a derived relation (a relation
// set) only by rules. Both are plain descriptions; the rows live in the
// backing store.
struct Relation {
  std::string name;
  std::vector<Column> columns;
  RelationKind kind = RelationKind::Base;

  size_t arity() const { return columns.size(); }
  bool derived() const { return kind == RelationKind::Derived; }
  // Name of the backing table
  std::string table() const;

  // Application to terms, defined in algebra.hpp:
  //   edge(x, y), edge(x, 3), name(x, "alice")
  template <typename... Args> Atom operator()(const Args &...) const;
};

class Schema {
public:
  // Register a relation. Throws SchemaError when the name or one of the
  // columns is not usable, or when the name collides with a relation already
  // registered.
  const Relation &declare(const std::string &, const std::vector<Column> &,
                          RelationKind);
  // Same with SQL type names, eg {{"x", "INT"}, {"y", "TEXT"}}
  const Relation &
  declare(const std::string &,
          const std::vector<std::pair<std::string, std::string>> &,
          RelationKind);

  // Drop a relation whose declaration could not be completed
  void forget(const std::string &);

  // nullptr if no relation has this name
  const Relation *find(const std::string &) const;
  std::vector<Relation> relations() const;

private:
  // Keyed by table name
  std::map<std::string, Relation> _relations;
};
} // namespace featherlog

#endif
