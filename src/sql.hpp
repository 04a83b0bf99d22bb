#ifndef DEF_SQL_HPP
#define DEF_SQL_HPP

#include "datalog.hpp"
#include <string>
#include <vector>

namespace featherlog {
// Table recording the kind and columns of every table featherlog created
inline constexpr const char *catalog_table = "featherlog_catalog";

// A statement and the values bound to its `?` placeholders, in order.
struct Sql {
  std::string code;
  std::vector<Value> args;
};

// Replace every character SQL identifiers should not carry by '_'.
std::string sql_identifier(const std::string &);
// Double-quoted identifier
std::string quote(const std::string &);
} // namespace featherlog

#endif
