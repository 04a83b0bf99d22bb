#include "json.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace featherlog;

namespace {
std::string json(const Row &row) {
  std::ostringstream oss;
  write_json(oss, row);
  return oss.str();
}
} // namespace

TEST(Json, Rows) {
  EXPECT_EQ(json({std::int64_t(1), std::int64_t(-2)}), "[1, -2]");
  EXPECT_EQ(json({std::string("bob"), 2.5}), "[\"bob\", 2.5]");
  EXPECT_EQ(json({}), "[]");
}

TEST(Json, EscapesStrings) {
  EXPECT_EQ(json({std::string("say \"hi\"\n\\")}),
            "[\"say \\\"hi\\\"\\n\\\\\"]");
  EXPECT_EQ(json({std::string("\x01")}), "[\"\\u0001\"]");
}

TEST(Json, NonFiniteRealsAreNull) {
  EXPECT_EQ(json({std::numeric_limits<double>::infinity(),
                  std::numeric_limits<double>::quiet_NaN()}),
            "[null, null]");
}

TEST(Json, RealsKeepTheirPrecision) {
  std::ostringstream oss;
  oss.precision(3);
  write_json(oss, Row{1.0 / 3});
  EXPECT_EQ(oss.str(), "[0.33333333333333331]");
  // The stream settings are left alone
  EXPECT_EQ(oss.precision(), 3);
}

TEST(Json, KeepsUtf8) {
  EXPECT_EQ(json({std::string("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80")}),
            "[\"caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\"]");
}

TEST(Json, ReplacesInvalidUtf8) {
  // Stray continuation, truncated sequence, overlong encoding, surrogate
  EXPECT_EQ(json({std::string("a\x80z")}), "[\"a\\ufffdz\"]");
  EXPECT_EQ(json({std::string("\xe2\x82")}), "[\"\\ufffd\\ufffd\"]");
  EXPECT_EQ(json({std::string("\xc0\xaf")}), "[\"\\ufffd\\ufffd\"]");
  EXPECT_EQ(json({std::string("\xed\xa0\x80!")}),
            "[\"\\ufffd\\ufffd\\ufffd!\"]");
}
