#include "store.hpp"
#include "errors.hpp"
#include <boost/format.hpp>
#include <type_traits>

namespace featherlog {
StoreError::StoreError(int code, std::string statement,
                       const std::string &message)
    : Error(boost::str(boost::format("%1% (code %2%) while executing: %3%") %
                       message % code % statement)),
      _code(code), _statement(std::move(statement)) {}

Database::Database(const std::string &path) : _db(nullptr) {
  int rc = sqlite3_open(path.c_str(), &_db);
  if (rc != SQLITE_OK) {
    std::string msg = _db ? sqlite3_errmsg(_db) : sqlite3_errstr(rc);
    sqlite3_close(_db);
    throw StoreError(rc, "open " + path, msg);
  }
}

Database::~Database() {
  // Statements still alive keep the connection open until finalized
  sqlite3_close_v2(_db);
}

void Database::exec(const std::string &sql) {
  char *err = nullptr;
  int rc = sqlite3_exec(_db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw StoreError(rc, sql, msg);
  }
}

size_t Database::changes() const { return sqlite3_changes(_db); }

Statement::Statement(Database &db, const Sql &sql)
    : _db(db), _stmt(nullptr), _sql(sql.code) {
  int rc = sqlite3_prepare_v2(_db.handle(), _sql.c_str(), -1, &_stmt, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(_db.handle());
    sqlite3_finalize(_stmt);
    throw StoreError(rc, _sql, msg);
  }
  // Statements without arguments may still be bound row by row later
  if (sql.args.empty()) {
    return;
  }
  try {
    bind(sql.args);
  } catch (const StoreError &) {
    sqlite3_finalize(_stmt);
    throw;
  }
}

Statement::~Statement() { sqlite3_finalize(_stmt); }

void Statement::check(int rc) const {
  if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw StoreError(rc, _sql, sqlite3_errmsg(_db.handle()));
  }
}

bool Statement::step() {
  int rc = sqlite3_step(_stmt);
  check(rc);
  return rc == SQLITE_ROW;
}

// sqlite3_reset repeats the error of a failed step, which step already threw
void Statement::reset() { sqlite3_reset(_stmt); }

void Statement::bind(const std::vector<Value> &args) {
  reset();
  if (args.size() != size_t(sqlite3_bind_parameter_count(_stmt))) {
    throw StoreError(SQLITE_RANGE, _sql,
                     boost::str(boost::format("%1% arguments for %2% "
                                              "parameters") %
                                args.size() %
                                sqlite3_bind_parameter_count(_stmt)));
  }
  for (size_t arg = 0; arg < args.size(); ++arg) {
    int index = int(arg) + 1;
    int rc = std::visit(
        [this, index](auto &&value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(_stmt, index, value);
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(_stmt, index, value);
          } else {
            return sqlite3_bind_text(_stmt, index, value.c_str(),
                                     int(value.size()), SQLITE_TRANSIENT);
          }
        },
        args[arg]);
    check(rc);
  }
}

size_t Statement::execute() {
  reset();
  while (step()) {
  }
  return _db.changes();
}

Value Statement::column(int col, Type tp) const {
  switch (tp) {
  case Type::Integer:
    return std::int64_t(sqlite3_column_int64(_stmt, col));
  case Type::Real:
    return sqlite3_column_double(_stmt, col);
  case Type::Text:
    break;
  }
  const unsigned char *text = sqlite3_column_text(_stmt, col);
  if (!text) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(text),
                     sqlite3_column_bytes(_stmt, col));
}
} // namespace featherlog
