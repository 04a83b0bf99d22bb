#include "context.hpp"
#include "errors.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

using namespace featherlog;
namespace fs = std::filesystem;

namespace {
using SqlColumns = std::vector<std::pair<std::string, std::string>>;

const SqlColumns two_ints = {{"x", "INTEGER"}, {"y", "INTEGER"}};

std::set<Row> as_set(Rows rows) {
  std::set<Row> r;
  for (const Row &row : rows) {
    r.insert(row);
  }
  return r;
}

Row ints(std::int64_t a, std::int64_t b) { return {a, b}; }
} // namespace

TEST(Context, InsertDeduplicates) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  EXPECT_EQ(ctx.insert(edge, {ints(1, 2), ints(1, 2), ints(2, 3)}), 2u);
  EXPECT_EQ(ctx.insert(edge, {ints(1, 2)}), 0u);

  auto [x, y] = vars("x", "y");
  EXPECT_EQ(ctx.select({x, y}, edge(x, y)).all().size(), 2u);
}

TEST(Context, InsertNoRows) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  EXPECT_EQ(ctx.insert(edge, {}), 0u);
  auto [x, y] = vars("x", "y");
  EXPECT_TRUE(ctx.select({x, y}, edge(x, y)).all().empty());
}

TEST(Context, DisjunctsDoNotDuplicateRows) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  Relation both = ctx.relation_set("both", two_ints);
  ctx.insert(edge, {ints(1, 2), ints(2, 1), ints(3, 4)});

  auto [x, y] = vars("x", "y");
  RunStats stats =
      ctx.run(both(x, y) <= (Disjunction(edge(x, y)) | Disjunction(edge(x, y))));
  EXPECT_TRUE(stats.converged);
  EXPECT_EQ(stats.rows_inserted, 3u);
  std::set<Row> expected = {ints(1, 2), ints(2, 1), ints(3, 4)};
  std::vector<Row> rows = ctx.select({x, y}, both(x, y)).all();
  EXPECT_EQ(rows.size(), 3u);
  EXPECT_EQ(std::set<Row>(rows.begin(), rows.end()), expected);
}

TEST(Context, TransitiveClosure) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  Relation path = ctx.relation_set("path", two_ints);
  ctx.insert(edge, {ints(1, 2), ints(2, 3), ints(3, 4), ints(4, 5), ints(5, 5)});

  auto [x, y, z] = vars("x", "y", "z");
  RunStats stats = ctx.run(
      path(x, z) <= (Disjunction(edge(x, z)) | (edge(x, y) & path(y, z))));
  EXPECT_TRUE(stats.converged);

  std::set<Row> result = as_set(ctx.select({x, y}, path(x, y)));
  EXPECT_TRUE(result.count(ints(3, 5)));
  EXPECT_EQ(result.size(), 11u);
  EXPECT_FALSE(result.count(ints(5, 1)));

  // Constants in the query
  std::set<Row> from_two = as_set(ctx.select({y}, path(2, y)));
  std::set<Row> expected = {{std::int64_t(3)}, {std::int64_t(4)},
                            {std::int64_t(5)}};
  EXPECT_EQ(from_two, expected);
}

TEST(Context, MutuallyRecursiveRules) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  Relation odd = ctx.relation_set("odd", two_ints);
  Relation even = ctx.relation_set("even", two_ints);
  ctx.insert(edge, {ints(1, 2), ints(2, 3), ints(3, 4)});

  auto [x, y, z] = vars("x", "y", "z");
  std::vector<Rule> rules = {
      odd(x, y) <= (Disjunction(edge(x, y)) | (edge(x, z) & even(z, y))),
      even(x, y) <= (edge(x, z) & odd(z, y)),
  };
  EXPECT_TRUE(ctx.run(rules).converged);

  std::set<Row> odds = {ints(1, 2), ints(2, 3), ints(3, 4), ints(1, 4)};
  std::set<Row> evens = {ints(1, 3), ints(2, 4)};
  EXPECT_EQ(as_set(ctx.select({x, y}, odd(x, y))), odds);
  EXPECT_EQ(as_set(ctx.select({x, y}, even(x, y))), evens);
}

TEST(Context, InsertChecksEveryRowFirst) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  EXPECT_THROW(ctx.insert(edge, {ints(1, 2), {std::int64_t(3)}}), TypeError);
  EXPECT_THROW(ctx.insert(edge, {ints(1, 2), {std::int64_t(3), "four"}}),
               TypeError);
  EXPECT_THROW(ctx.insert(edge, {ints(1, 2), {std::int64_t(3), 4.5}}),
               TypeError);

  auto [x, y] = vars("x", "y");
  EXPECT_TRUE(ctx.select({x, y}, edge(x, y)).all().empty());
}

TEST(Context, InsertIntoRelationSetFails) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation path = ctx.relation_set("path", two_ints);
  EXPECT_THROW(ctx.insert(path, {ints(1, 2)}), SchemaError);
}

TEST(Context, ValuesKeepTheirColumnType) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation item = ctx.relation(
      "item", {{"name", "TEXT"}, {"price", "REAL"}, {"count", "INT"}});
  ctx.insert(item, {{std::string("it's \"quoted\""), std::int64_t(3),
                     std::int64_t(7)},
                    {std::string("pen"), 1.25, std::int64_t(2)}});

  auto [n, p, c] = vars("n", "p", "c");
  std::vector<Row> rows = ctx.select({n, p, c}, item(n, p, c),
                                     {.ordered = true})
                              .all();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0][0], Value(std::string("it's \"quoted\"")));
  EXPECT_EQ(rows[0][1], Value(3.0));
  EXPECT_EQ(rows[0][2], Value(std::int64_t(7)));
  EXPECT_EQ(rows[1][0], Value(std::string("pen")));
  EXPECT_EQ(rows[1][1], Value(1.25));
}

TEST(Context, RowsAreRestartable) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  ctx.insert(edge, {ints(3, 1), ints(1, 2), ints(2, 3)});

  auto [x, y] = vars("x", "y");
  Rows rows = ctx.select({x, y}, edge(x, y), {.ordered = true});
  std::vector<Row> first = rows.all();
  std::vector<Row> second;
  for (const Row &row : rows) {
    second.push_back(row);
  }
  std::vector<Row> expected = {ints(1, 2), ints(2, 3), ints(3, 1)};
  EXPECT_EQ(first, expected);
  EXPECT_EQ(second, expected);

  // Reading again sees rows inserted in between
  ctx.insert(edge, {ints(0, 0)});
  EXPECT_EQ(rows.all().size(), 4u);
}

TEST(Context, BooleanAndConstantProjections) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  ctx.insert(edge, {ints(1, 2)});

  std::vector<Row> yes = ctx.select({}, edge(1, 2)).all();
  ASSERT_EQ(yes.size(), 1u);
  EXPECT_TRUE(yes[0].empty());
  EXPECT_TRUE(ctx.select({}, edge(2, 1)).all().empty());

  auto [x] = vars("x");
  std::vector<Row> tagged = ctx.select({to_term("from"), x}, edge(x, 2)).all();
  ASSERT_EQ(tagged.size(), 1u);
  EXPECT_EQ(tagged[0], (Row{std::string("from"), std::int64_t(1)}));
}

TEST(Context, SelectChecksItsBody) {
  Connection conn;
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  auto [x, y, z] = vars("x", "y", "z");
  EXPECT_THROW(ctx.select({z}, edge(x, y)), RangeRestrictionError);
  EXPECT_THROW(ctx.select({x}, Disjunction()), CompileError);
}

TEST(Context, RollsBackWhenUnwinding) {
  Connection conn;
  auto [x, y] = vars("x", "y");
  try {
    Context ctx = conn.cursor();
    Relation edge = ctx.relation("edge", two_ints);
    ctx.insert(edge, {ints(1, 2)});
    throw std::runtime_error("abort");
  } catch (const std::runtime_error &) {
  }

  Context ctx = conn.cursor();
  // The declaration outlives the transaction, its table is created again
  const Relation *edge = conn.schema().find("edge");
  ASSERT_NE(edge, nullptr);
  EXPECT_TRUE(ctx.select({x, y}, (*edge)(x, y)).all().empty());
}

TEST(Context, CommitsAtScopeExit) {
  Connection conn;
  auto [x, y] = vars("x", "y");
  {
    Context ctx = conn.cursor();
    Relation edge = ctx.relation("edge", two_ints);
    ctx.insert(edge, {ints(1, 2)});
  }
  Context ctx = conn.cursor();
  const Relation *edge = conn.schema().find("edge");
  ASSERT_NE(edge, nullptr);
  EXPECT_EQ(ctx.select({x, y}, (*edge)(x, y)).all().size(), 1u);
}

TEST(Context, ExplicitCommitAndRollback) {
  Connection conn;
  auto [x, y] = vars("x", "y");
  {
    Context ctx = conn.cursor();
    Relation edge = ctx.relation("edge", two_ints);
    ctx.insert(edge, {ints(1, 2)});
    ctx.commit();
    EXPECT_THROW(ctx.commit(), Error);
    EXPECT_THROW(ctx.rollback(), Error);
  }
  {
    Context ctx = conn.cursor();
    ctx.insert(*conn.schema().find("edge"), {ints(2, 3)});
    ctx.rollback();
  }
  Context ctx = conn.cursor();
  std::vector<Row> rows =
      ctx.select({x, y}, (*conn.schema().find("edge"))(x, y)).all();
  std::vector<Row> expected = {ints(1, 2)};
  EXPECT_EQ(rows, expected);
}

TEST(Context, OneContextAtATime) {
  Connection conn;
  Context ctx = conn.cursor();
  EXPECT_THROW(conn.cursor(), StoreError);
}

TEST(Context, DeclarationCollision) {
  Connection conn;
  Context ctx = conn.cursor();
  ctx.relation("edge", two_ints);
  EXPECT_THROW(ctx.relation_set("edge", two_ints), SchemaError);
  EXPECT_THROW(ctx.relation("bad", SqlColumns{{"x", "BLOB"}}), SchemaError);
}

class SharedDatabaseTest : public ::testing::Test {
protected:
  SharedDatabaseTest()
      : path(fs::temp_directory_path() /
             ("featherlog_test_" +
              std::string(::testing::UnitTest::GetInstance()
                              ->current_test_info()
                              ->name()) +
              ".db")) {
    fs::remove(path);
  }
  ~SharedDatabaseTest() override { fs::remove(path); }

  fs::path path;
};

TEST_F(SharedDatabaseTest, TablesPersistAcrossConnections) {
  auto [x, y] = vars("x", "y");
  {
    Connection conn(path.string());
    Context ctx = conn.cursor();
    Relation edge = ctx.relation("edge", two_ints);
    ctx.insert(edge, {ints(1, 2), ints(2, 3)});
  }
  Connection conn(path.string());
  Context ctx = conn.cursor();
  Relation edge = ctx.relation("edge", two_ints);
  EXPECT_EQ(ctx.select({x, y}, edge(x, y)).all().size(), 2u);
}

TEST_F(SharedDatabaseTest, CatalogDetectsCollisions) {
  auto [x, y] = vars("x", "y");
  {
    Connection conn(path.string());
    Context ctx = conn.cursor();
    Relation edge = ctx.relation("edge", two_ints);
    Relation path_rel = ctx.relation_set("path", two_ints);
    ctx.insert(edge, {ints(1, 2)});
    ctx.run(path_rel(x, y) <= Disjunction(edge(x, y)));
  }

  Connection conn(path.string());
  Context ctx = conn.cursor();
  // Different columns
  EXPECT_THROW(ctx.relation("edge", {{"x", "TEXT"}, {"y", "INTEGER"}}),
               SchemaError);
  // Base table reused as a relation set, checked on first use
  Relation edge = ctx.relation_set("edge", two_ints);
  EXPECT_THROW(ctx.select({x, y}, edge(x, y)), SchemaError);
  // A relation set declared as a base relation
  EXPECT_THROW(ctx.relation("path", two_ints), SchemaError);
}
