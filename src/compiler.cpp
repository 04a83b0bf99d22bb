#include "compiler.hpp"
#include "errors.hpp"
#include <boost/format.hpp>
#include <map>
#include <type_traits>

namespace featherlog {
std::string sql_identifier(const std::string &name) {
  std::string r = name;
  for (char &c : r) {
    if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') ||
        ('0' <= c && c <= '9') || c == '_') {
      continue;
    }
    c = '_';
  }
  return r;
}

std::string quote(const std::string &ident) {
  std::string r = "\"";
  for (char c : ident) {
    if (c == '"') {
      r += '"';
    }
    r += c;
  }
  r += '"';
  return r;
}

namespace {
std::string join(const std::vector<std::string> &parts,
                 const std::string &sep) {
  std::string r;
  for (size_t part = 0; part < parts.size(); ++part) {
    if (part != 0) {
      r += sep;
    }
    r += parts[part];
  }
  return r;
}

std::vector<std::string> column_names(const Relation &rel) {
  std::vector<std::string> names;
  for (const Column &col : rel.columns) {
    names.push_back(quote(sql_identifier(col.name)));
  }
  return names;
}
} // namespace

Sql compile_create(const Relation &rel) {
  std::vector<std::string> defs;
  for (const Column &col : rel.columns) {
    defs.push_back(quote(sql_identifier(col.name)) + " " +
                   sql_type_name(col.type) + " NOT NULL");
  }
  defs.push_back("PRIMARY KEY (" + join(column_names(rel), ", ") + ")");
  return Sql{.code = "CREATE TABLE IF NOT EXISTS " + quote(rel.table()) +
                     " (" + join(defs, ", ") + ")",
             .args = {}};
}

Sql compile_insert(const Relation &rel) {
  std::vector<std::string> placeholders(rel.arity(), "?");
  return Sql{.code = "INSERT INTO " + quote(rel.table()) + " (" +
                     join(column_names(rel), ", ") + ") VALUES (" +
                     join(placeholders, ", ") + ") ON CONFLICT DO NOTHING",
             .args = {}};
}

std::string column_signature(const Relation &rel) {
  std::vector<std::string> cols;
  for (const Column &col : rel.columns) {
    cols.push_back(sql_identifier(col.name) + " " + sql_type_name(col.type));
  }
  return join(cols, ", ");
}

Sql compile_conjunction(const Conjunction &conj,
                        const std::vector<Term> &projection) {
  if (conj.atoms.empty()) {
    throw CompileError("empty conjunction");
  }

  // Column first binding each variable
  std::map<std::string, std::string> bound;
  std::vector<std::string> from;
  std::vector<std::string> where;
  std::vector<Value> where_args;
  for (size_t atom = 0; atom < conj.atoms.size(); ++atom) {
    const Atom &a = conj.atoms[atom];
    std::string alias = "_a" + std::to_string(atom);
    from.push_back(quote(a.relation.table()) + " AS " + alias);
    for (size_t arg = 0; arg < a.terms.size(); ++arg) {
      std::string column =
          alias + "." + quote(sql_identifier(a.relation.columns[arg].name));
      std::visit(
          [&](auto &&term) {
            using T = std::decay_t<decltype(term)>;
            if constexpr (std::is_same_v<T, Variable>) {
              auto it = bound.find(term.name);
              if (it == bound.end()) {
                bound.emplace(term.name, column);
              } else {
                where.push_back(it->second + " = " + column);
              }
            } else {
              where.push_back(column + " = ?");
              where_args.push_back(term);
            }
          },
          a.terms[arg]);
    }
  }

  std::vector<std::string> selects;
  std::vector<Value> select_args;
  for (size_t col = 0; col < projection.size(); ++col) {
    std::string name = " AS c" + std::to_string(col);
    if (const Variable *var = std::get_if<Variable>(&projection[col])) {
      auto it = bound.find(var->name);
      if (it == bound.end()) {
        throw RangeRestrictionError(
            boost::str(boost::format("variable %1% is not bound by %2%") %
                       var->name % conj));
      }
      selects.push_back(it->second + name);
    } else {
      selects.push_back("?" + name);
      select_args.push_back(std::get<Value>(projection[col]));
    }
  }
  if (selects.empty()) {
    selects.push_back("1");
  }

  Sql sql;
  sql.code = "SELECT DISTINCT " + join(selects, ", ") + "\nFROM " +
             join(from, ", ");
  if (!where.empty()) {
    sql.code += "\nWHERE " + join(where, " AND ");
  }
  sql.args = std::move(select_args);
  sql.args.insert(sql.args.end(), where_args.begin(), where_args.end());
  return sql;
}

Sql compile_body(const Disjunction &body, const std::vector<Term> &projection) {
  if (body.conjuncts.empty()) {
    throw CompileError("empty disjunction");
  }
  Sql sql;
  for (size_t conj = 0; conj < body.conjuncts.size(); ++conj) {
    Sql part = compile_conjunction(body.conjuncts[conj], projection);
    if (conj != 0) {
      sql.code += "\nUNION\n";
    }
    sql.code += part.code;
    sql.args.insert(sql.args.end(), part.args.begin(), part.args.end());
  }
  return sql;
}

Sql compile_select(const std::vector<Term> &projection,
                   const Disjunction &body, bool ordered) {
  Sql sql = compile_body(body, projection);
  if (ordered && !projection.empty()) {
    std::vector<std::string> cols;
    for (size_t col = 0; col < projection.size(); ++col) {
      cols.push_back(std::to_string(col + 1));
    }
    sql.code += "\nORDER BY " + join(cols, ", ");
  }
  return sql;
}

Sql compile_rule(const Rule &rule) {
  const Relation &head = rule.head().relation;
  Sql body = compile_body(rule.body(), rule.head().terms);
  // The WHERE keeps SQLite from reading ON CONFLICT as a join constraint
  return Sql{.code = "INSERT INTO " + quote(head.table()) + " (" +
                     join(column_names(head), ", ") +
                     ")\nSELECT * FROM (\n" + body.code +
                     "\n) WHERE true\nON CONFLICT DO NOTHING",
             .args = std::move(body.args)};
}
} // namespace featherlog
