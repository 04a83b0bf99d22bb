#ifndef DEF_CONTEXT_HPP
#define DEF_CONTEXT_HPP

#include "algebra.hpp"
#include "fixpoint.hpp"
#include "schema.hpp"
#include "store.hpp"
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace featherlog {
class Context;

// A database and the relations declared on it.
class Connection {
public:
  explicit Connection(const std::string &path = ":memory:");

  // Opens a transaction, see Context
  Context cursor();

  Database &database() { return _db; }
  Schema &schema() { return _schema; }
  const Schema &schema() const { return _schema; }

private:
  Database _db;
  Schema _schema;
};

// Result of a selection. Rows are read lazily from the database; every call
// to begin() restarts the query. Only one iteration may be in progress at a
// time, and the rows must not outlive the context that produced them.
class Rows {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Row;
    using difference_type = std::ptrdiff_t;
    using pointer = const Row *;
    using reference = const Row &;

    iterator() : _rows(nullptr) {}
    explicit iterator(Rows *rows) : _rows(rows) {}

    reference operator*() const { return _rows->_current; }
    pointer operator->() const { return &_rows->_current; }
    iterator &operator++();
    void operator++(int) { ++*this; }
    bool operator==(const iterator &other) const {
      return _rows == other._rows;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    Rows *_rows;
  };

  Rows(std::unique_ptr<Statement>, std::vector<Type>);

  iterator begin();
  iterator end() { return iterator(); }
  // Run the query and collect every row
  std::vector<Row> all();

private:
  bool fetch();

  std::unique_ptr<Statement> _stmt;
  std::vector<Type> _types;
  Row _current;
};

struct SelectOptions {
  // Sort the rows by every column, in order
  bool ordered = false;
};

// A scoped transaction on a connection. Commits when it goes out of scope,
// or rolls back if it is destroyed because an exception is propagating.
// Only one context may be open on a connection at a time.
class Context {
public:
  explicit Context(Connection &);
  ~Context();
  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  // Declare a base relation and create its table
  Relation relation(const std::string &, const std::vector<Column> &);
  Relation relation(const std::string &,
                    const std::vector<std::pair<std::string, std::string>> &);
  // Declare a relation set. Its table is created on first use.
  Relation relation_set(const std::string &, const std::vector<Column> &);
  Relation
  relation_set(const std::string &,
               const std::vector<std::pair<std::string, std::string>> &);

  // Insert literal rows in a base relation. Every row is checked before any
  // is inserted. Returns the number of rows that were not already present.
  size_t insert(const Relation &, const std::vector<Row> &);

  // Evaluate rules to their least fixpoint (or to the pass bound).
  RunStats run(const Rule &, const FixpointOptions & = {});
  RunStats run(const std::vector<Rule> &, const FixpointOptions & = {});

  Rows select(const std::vector<Term> &, const Disjunction &,
              const SelectOptions & = {});

  // End the transaction now, reporting failures as exceptions
  void commit();
  void rollback();

private:
  Relation declare(const std::string &, const std::vector<Column> &,
                   RelationKind);
  // Create the table and its catalog entry if missing, and check an
  // existing one matches the declaration.
  void ensure_table(const Relation &);
  void ensure_tables(const Disjunction &);

  Connection &_conn;
  int _exceptions;
  bool _open;
};
} // namespace featherlog

#endif
