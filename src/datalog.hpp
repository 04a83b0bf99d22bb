#ifndef DEF_DATALOG_HPP
#define DEF_DATALOG_HPP

#include <array>
#include <boost/fusion/include/adapt_struct.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace featherlog {
enum class Type { Integer, Real, Text };
std::ostream &operator<<(std::ostream &, const Type &);
// SQL spelling of the type, as used in table definitions
const char *sql_type_name(Type);
// Accepts the usual SQL spellings, case insensitive
std::optional<Type> parse_type(const std::string &);

using Value = std::variant<std::int64_t, double, std::string>;
std::ostream &operator<<(std::ostream &, const Value &);
Type get_value_type(const Value &);
// Whether a constant of the given value may be stored in a column of the
// given type. Integers widen to reals.
bool value_fits(Type, const Value &);

using Row = std::vector<Value>;

struct Variable {
  std::string name;

  bool operator==(const Variable &) const = default;
};
using Term = std::variant<Variable, Value>;
std::ostream &operator<<(std::ostream &, const Term &);

inline Term to_term(const Term &t) { return t; }
inline Term to_term(const Variable &v) { return v; }
inline Term to_term(const Value &v) { return v; }
inline Term to_term(int v) { return Value(std::int64_t(v)); }
inline Term to_term(long v) { return Value(std::int64_t(v)); }
inline Term to_term(long long v) { return Value(std::int64_t(v)); }
inline Term to_term(double v) { return Value(v); }
inline Term to_term(const char *v) { return Value(std::string(v)); }
inline Term to_term(const std::string &v) { return Value(v); }

// One fresh variable per name:
//   auto [x, y, z] = featherlog::vars("x", "y", "z");
template <typename... Names>
std::array<Variable, sizeof...(Names)> vars(const Names &...names) {
  return {Variable{std::string(names)}...};
}

// Parsed text programs

struct ColumnDecl {
  std::optional<std::string> name;
  Type type;
};

struct Declaration {
  std::string name;
  std::vector<ColumnDecl> columns;
};

struct Prop {
  std::string pred;
  std::vector<Term> args;
};
std::ostream &operator<<(std::ostream &, const Prop &);

struct GroundedProp {
  std::string pred;
  std::vector<Value> args;
};

// A clause without body is a fact. Each element of body is one disjunct.
struct Clause {
  Prop head;
  std::vector<std::vector<Prop>> body;
};
} // namespace featherlog

BOOST_FUSION_ADAPT_STRUCT(featherlog::Declaration,
                          (std::string,
                           name)(std::vector<featherlog::ColumnDecl>, columns))
BOOST_FUSION_ADAPT_STRUCT(featherlog::Prop,
                          (std::string, pred)(std::vector<featherlog::Term>,
                                              args))
BOOST_FUSION_ADAPT_STRUCT(featherlog::GroundedProp,
                          (std::string, pred)(std::vector<featherlog::Value>,
                                              args))
BOOST_FUSION_ADAPT_STRUCT(
    featherlog::Clause,
    (featherlog::Prop, head)(std::vector<std::vector<featherlog::Prop>>, body))

#endif
