#include "context.hpp"
#include "compiler.hpp"
#include "errors.hpp"
#include <boost/format.hpp>
#include <exception>
#include <iostream>
#include <set>

namespace featherlog {
Connection::Connection(const std::string &path) : _db(path) {}

Context Connection::cursor() { return Context(*this); }

Rows::Rows(std::unique_ptr<Statement> stmt, std::vector<Type> types)
    : _stmt(std::move(stmt)), _types(std::move(types)) {}

bool Rows::fetch() {
  if (!_stmt->step()) {
    return false;
  }
  _current.clear();
  for (size_t col = 0; col < _types.size(); ++col) {
    _current.push_back(_stmt->column(int(col), _types[col]));
  }
  return true;
}

Rows::iterator Rows::begin() {
  _stmt->reset();
  return fetch() ? iterator(this) : iterator();
}

Rows::iterator &Rows::iterator::operator++() {
  if (!_rows->fetch()) {
    _rows = nullptr;
  }
  return *this;
}

std::vector<Row> Rows::all() {
  std::vector<Row> rows;
  for (const Row &row : *this) {
    rows.push_back(row);
  }
  return rows;
}

Context::Context(Connection &conn)
    : _conn(conn), _exceptions(std::uncaught_exceptions()), _open(false) {
  _conn.database().exec("BEGIN");
  _open = true;
}

Context::~Context() {
  if (!_open) {
    return;
  }
  _open = false;
  bool unwinding = std::uncaught_exceptions() > _exceptions;
  try {
    _conn.database().exec(unwinding ? "ROLLBACK" : "COMMIT");
  } catch (const StoreError &e) {
    std::cerr << "Couldn't end transaction: " << e.what() << std::endl;
    if (!unwinding) {
      try {
        _conn.database().exec("ROLLBACK");
      } catch (const StoreError &e) {
        std::cerr << "Couldn't roll back: " << e.what() << std::endl;
      }
    }
  }
}

void Context::commit() {
  if (!_open) {
    throw Error("transaction already ended");
  }
  _open = false;
  try {
    _conn.database().exec("COMMIT");
  } catch (const StoreError &) {
    try {
      _conn.database().exec("ROLLBACK");
    } catch (const StoreError &e) {
      std::cerr << "Couldn't roll back: " << e.what() << std::endl;
    }
    throw;
  }
}

void Context::rollback() {
  if (!_open) {
    throw Error("transaction already ended");
  }
  _open = false;
  _conn.database().exec("ROLLBACK");
}

Relation Context::declare(const std::string &name,
                          const std::vector<Column> &columns,
                          RelationKind kind) {
  Relation rel = _conn.schema().declare(name, columns, kind);
  if (kind == RelationKind::Base) {
    try {
      ensure_table(rel);
    } catch (const Error &) {
      _conn.schema().forget(name);
      throw;
    }
  }
  return rel;
}

Relation Context::relation(const std::string &name,
                           const std::vector<Column> &columns) {
  return declare(name, columns, RelationKind::Base);
}

Relation Context::relation(
    const std::string &name,
    const std::vector<std::pair<std::string, std::string>> &columns) {
  return declare(name, parse_columns(name, columns), RelationKind::Base);
}

Relation Context::relation_set(const std::string &name,
                               const std::vector<Column> &columns) {
  return declare(name, columns, RelationKind::Derived);
}

Relation Context::relation_set(
    const std::string &name,
    const std::vector<std::pair<std::string, std::string>> &columns) {
  return declare(name, parse_columns(name, columns), RelationKind::Derived);
}

void Context::ensure_table(const Relation &rel) {
  Database &db = _conn.database();
  db.exec(std::string("CREATE TABLE IF NOT EXISTS ") + quote(catalog_table) +
          " (name TEXT PRIMARY KEY, kind TEXT NOT NULL, signature TEXT NOT "
          "NULL)");

  std::string kind = rel.derived() ? "derived" : "base";
  std::string signature = column_signature(rel);
  Statement lookup(
      db, Sql{.code = std::string("SELECT kind, signature FROM ") +
                      quote(catalog_table) + " WHERE name = ?",
              .args = {rel.table()}});
  if (lookup.step()) {
    std::string known_kind =
        std::get<std::string>(lookup.column(0, Type::Text));
    std::string known_signature =
        std::get<std::string>(lookup.column(1, Type::Text));
    if (known_kind != kind || known_signature != signature) {
      throw SchemaError(boost::str(
          boost::format("table %1% already exists as %2% (%3%), cannot "
                        "declare it as %4% (%5%)") %
          rel.table() % known_kind % known_signature % kind % signature));
    }
    return;
  }

  db.exec(compile_create(rel).code);
  Statement record(db, Sql{.code = std::string("INSERT INTO ") +
                                   quote(catalog_table) +
                                   " (name, kind, signature) VALUES (?, ?, ?)",
                           .args = {rel.table(), kind, signature}});
  record.execute();
}

void Context::ensure_tables(const Disjunction &body) {
  std::set<std::string> seen;
  for (const Conjunction &conj : body.conjuncts) {
    for (const Atom &atom : conj.atoms) {
      if (seen.insert(atom.relation.table()).second) {
        ensure_table(atom.relation);
      }
    }
  }
}

size_t Context::insert(const Relation &rel, const std::vector<Row> &rows) {
  if (rel.derived()) {
    throw SchemaError(boost::str(
        boost::format("%1% is a relation set, only rules insert into it") %
        rel.name));
  }
  for (size_t row = 0; row < rows.size(); ++row) {
    if (rows[row].size() != rel.arity()) {
      throw TypeError(boost::str(
          boost::format("row %1% has %2% values but %3% has %4% columns") %
          row % rows[row].size() % rel.name % rel.arity()));
    }
    for (size_t col = 0; col < rel.arity(); ++col) {
      if (!value_fits(rel.columns[col].type, rows[row][col])) {
        throw TypeError(boost::str(
            boost::format("row %1%: value of type %2% does not fit column %3% "
                          "of %4%, which has type %5%") %
            row % get_value_type(rows[row][col]) % rel.columns[col].name %
            rel.name % rel.columns[col].type));
      }
    }
  }

  ensure_table(rel);
  Statement stmt(_conn.database(), compile_insert(rel));
  size_t inserted = 0;
  for (const Row &row : rows) {
    stmt.bind(row);
    inserted += stmt.execute();
  }
  return inserted;
}

RunStats Context::run(const Rule &rule, const FixpointOptions &opts) {
  return run(std::vector<Rule>{rule}, opts);
}

RunStats Context::run(const std::vector<Rule> &rules,
                      const FixpointOptions &opts) {
  std::vector<Sql> statements;
  for (const Rule &rule : rules) {
    statements.push_back(compile_rule(rule));
  }
  for (const Rule &rule : rules) {
    ensure_table(rule.head().relation);
    ensure_tables(rule.body());
  }
  return run_fixpoint(_conn.database(), statements, opts);
}

Rows Context::select(const std::vector<Term> &projection,
                     const Disjunction &body, const SelectOptions &opts) {
  check_well_formed(body);
  check_range_restriction(projection, body);
  SymbolTable symbols = bind_symbols(body);
  std::vector<Type> types;
  for (const Term &t : projection) {
    if (const Variable *var = std::get_if<Variable>(&t)) {
      types.push_back(symbols.at(var->name));
    } else {
      types.push_back(get_value_type(std::get<Value>(t)));
    }
  }

  Sql sql = compile_select(projection, body, opts.ordered);
  ensure_tables(body);
  return Rows(std::make_unique<Statement>(_conn.database(), sql),
              std::move(types));
}
} // namespace featherlog
