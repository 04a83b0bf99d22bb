#ifndef DEF_ERRORS_HPP
#define DEF_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace featherlog {
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Name collisions, unsupported column types, rules or inserts targeting the
// wrong kind of relation.
class SchemaError : public Error {
public:
  using Error::Error;
};

class ArityError : public Error {
public:
  using Error::Error;
};

class TypeError : public Error {
public:
  using Error::Error;
};

// A head (or projected) variable that the body never binds.
class RangeRestrictionError : public Error {
public:
  using Error::Error;
};

class CompileError : public Error {
public:
  using Error::Error;
};

// Raised by the backing store. Keeps the SQLite result code and the SQL text
// of the statement that failed.
class StoreError : public Error {
public:
  StoreError(int code, std::string statement, const std::string &message);

  int code() const { return _code; }
  const std::string &statement() const { return _statement; }

private:
  int _code;
  std::string _statement;
};
} // namespace featherlog

#endif
