#ifndef DEF_STORE_HPP
#define DEF_STORE_HPP

#include "datalog.hpp"
#include "sql.hpp"
#include <sqlite3.h>
#include <string>

namespace featherlog {
// Owns one SQLite connection.
class Database {
public:
  explicit Database(const std::string &path);
  ~Database();
  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  // Run statements without parameters nor results
  void exec(const std::string &);
  // Rows changed by the last INSERT, UPDATE or DELETE
  size_t changes() const;
  sqlite3 *handle() const { return _db; }

private:
  sqlite3 *_db;
};

// A prepared statement. Its arguments are bound on construction when the
// Sql carries some, otherwise by bind.
class Statement {
public:
  Statement(Database &, const Sql &);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  // Returns true while there are rows
  bool step();
  // Rewind, keeping the bindings
  void reset();
  // Replace the bindings, rewinding first
  void bind(const std::vector<Value> &);
  // Rewind, run to completion and return the number of changed rows
  size_t execute();

  // Read a column of the current row as the given type
  Value column(int, Type) const;
  const std::string &sql() const { return _sql; }

private:
  void check(int rc) const;

  Database &_db;
  sqlite3_stmt *_stmt;
  std::string _sql;
};
} // namespace featherlog

#endif
