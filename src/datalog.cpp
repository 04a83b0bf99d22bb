#include "datalog.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace featherlog {
std::ostream &operator<<(std::ostream &os, const Type &t) {
  switch (t) {
  case Type::Integer:
    os << "integer";
    break;
  case Type::Real:
    os << "real";
    break;
  case Type::Text:
    os << "text";
    break;
  }
  return os;
}

const char *sql_type_name(Type t) {
  switch (t) {
  case Type::Integer:
    return "INTEGER";
  case Type::Real:
    return "REAL";
  case Type::Text:
    return "TEXT";
  }
  return "TEXT"; // Will never happen
}

std::optional<Type> parse_type(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "INT" || upper == "INTEGER" || upper == "BIGINT") {
    return Type::Integer;
  }
  if (upper == "REAL" || upper == "FLOAT" || upper == "DOUBLE") {
    return Type::Real;
  }
  if (upper == "TEXT" || upper == "STRING" || upper == "VARCHAR") {
    return Type::Text;
  }
  return {};
}

Type get_value_type(const Value &v) {
  return std::visit(
      [](auto &&arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
          return Type::Integer;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return Type::Text;
        } else {
          return Type::Real;
        }
      },
      v);
}

bool value_fits(Type column, const Value &v) {
  Type tp = get_value_type(v);
  return tp == column || (tp == Type::Integer && column == Type::Real);
}

std::ostream &operator<<(std::ostream &os, const Value &v) {
  std::visit(
      [&os](auto &&arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
          os << '"' << arg << '"';
        } else {
          os << arg;
        }
      },
      v);
  return os;
}

std::ostream &operator<<(std::ostream &os, const Term &t) {
  std::visit(
      [&os](auto &&arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Variable>) {
          os << arg.name;
        } else {
          os << arg;
        }
      },
      t);
  return os;
}

std::ostream &operator<<(std::ostream &os, const Prop &prop) {
  os << prop.pred << '(';
  for (size_t arg = 0; arg < prop.args.size(); ++arg) {
    if (arg != 0) {
      os << ", ";
    }
    os << prop.args[arg];
  }
  os << ')';
  return os;
}

} // namespace featherlog
