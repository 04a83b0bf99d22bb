#include "datalog.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace featherlog;

TEST(ParseType, AcceptsSqlSpellings) {
  EXPECT_EQ(parse_type("INT"), Type::Integer);
  EXPECT_EQ(parse_type("integer"), Type::Integer);
  EXPECT_EQ(parse_type("BigInt"), Type::Integer);
  EXPECT_EQ(parse_type("real"), Type::Real);
  EXPECT_EQ(parse_type("FLOAT"), Type::Real);
  EXPECT_EQ(parse_type("double"), Type::Real);
  EXPECT_EQ(parse_type("TEXT"), Type::Text);
  EXPECT_EQ(parse_type("varchar"), Type::Text);
  EXPECT_EQ(parse_type("string"), Type::Text);
}

TEST(ParseType, RejectsUnknownTypes) {
  EXPECT_FALSE(parse_type("BLOB").has_value());
  EXPECT_FALSE(parse_type("").has_value());
  EXPECT_FALSE(parse_type("INTEGERS").has_value());
}

TEST(Value, TypeOfConstants) {
  EXPECT_EQ(get_value_type(Value(std::int64_t(3))), Type::Integer);
  EXPECT_EQ(get_value_type(Value(2.5)), Type::Real);
  EXPECT_EQ(get_value_type(Value(std::string("a"))), Type::Text);
}

TEST(Value, IntegersWidenToReals) {
  EXPECT_TRUE(value_fits(Type::Real, Value(std::int64_t(3))));
  EXPECT_TRUE(value_fits(Type::Real, Value(3.5)));
  EXPECT_FALSE(value_fits(Type::Integer, Value(3.5)));
  EXPECT_FALSE(value_fits(Type::Text, Value(std::int64_t(3))));
  EXPECT_FALSE(value_fits(Type::Integer, Value(std::string("3"))));
}

TEST(Term, ConversionsFromLiterals) {
  EXPECT_EQ(to_term(3), Term(Value(std::int64_t(3))));
  EXPECT_EQ(to_term(3L), Term(Value(std::int64_t(3))));
  EXPECT_EQ(to_term(1.5), Term(Value(1.5)));
  EXPECT_EQ(to_term("bob"), Term(Value(std::string("bob"))));
  EXPECT_EQ(to_term(Variable{"x"}), Term(Variable{"x"}));
}

TEST(Vars, OneVariablePerName) {
  auto [x, y, z] = vars("x", "y", "z");
  EXPECT_EQ(x.name, "x");
  EXPECT_EQ(y.name, "y");
  EXPECT_EQ(z.name, "z");
  EXPECT_FALSE(x == y);
  EXPECT_TRUE(x == vars("x")[0]);
}

TEST(Prop, Printing) {
  Prop prop{.pred = "edge",
            .args = {Variable{"X"}, Value(std::int64_t(2)),
                     Value(std::string("a"))}};
  std::ostringstream oss;
  oss << prop;
  EXPECT_EQ(oss.str(), "edge(X, 2, \"a\")");

  std::ostringstream types;
  types << Type::Integer << ' ' << Type::Real << ' ' << Type::Text;
  EXPECT_EQ(types.str(), "integer real text");
  EXPECT_STREQ(sql_type_name(Type::Real), "REAL");
}
