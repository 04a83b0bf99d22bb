#include "schema.hpp"
#include "errors.hpp"
#include "sql.hpp"
#include <boost/format.hpp>
#include <set>

namespace featherlog {
std::ostream &operator<<(std::ostream &os, const RelationKind &k) {
  switch (k) {
  case RelationKind::Base:
    os << "base relation";
    break;
  case RelationKind::Derived:
    os << "relation set";
    break;
  }
  return os;
}

std::vector<Column> positional(const std::vector<Type> &types) {
  std::vector<Column> cols;
  for (size_t arg = 0; arg < types.size(); ++arg) {
    cols.push_back(Column{.name = "_x" + std::to_string(arg),
                          .type = types[arg]});
  }
  return cols;
}

std::string Relation::table() const { return sql_identifier(name); }

const Relation &Schema::declare(const std::string &name,
                                const std::vector<Column> &columns,
                                RelationKind kind) {
  if (name.empty()) {
    throw SchemaError("relation name cannot be empty");
  }
  std::string table = sql_identifier(name);
  if (table.rfind("sqlite_", 0) == 0 || table == catalog_table) {
    throw SchemaError(
        boost::str(boost::format("relation name %1% is reserved") % name));
  }
  auto it = _relations.find(table);
  if (it != _relations.end()) {
    throw SchemaError(boost::str(
        boost::format("relation %1% collides with already declared %2% %3%") %
        name % it->second.kind % it->second.name));
  }
  if (columns.empty()) {
    throw SchemaError(
        boost::str(boost::format("relation %1% has no column") % name));
  }

  std::set<std::string> seen;
  for (const Column &col : columns) {
    if (col.name.empty()) {
      throw SchemaError(
          boost::str(boost::format("relation %1% has an unnamed column") %
                     name));
    }
    if (!seen.insert(sql_identifier(col.name)).second) {
      throw SchemaError(
          boost::str(boost::format("relation %1% has column %2% twice") %
                     name % col.name));
    }
  }

  Relation rel;
  rel.name = name;
  rel.columns = columns;
  rel.kind = kind;
  return _relations.emplace(table, std::move(rel)).first->second;
}

std::vector<Column> parse_columns(
    const std::string &name,
    const std::vector<std::pair<std::string, std::string>> &columns) {
  std::vector<Column> cols;
  for (const auto &[col, type_name] : columns) {
    std::optional<Type> tp = parse_type(type_name);
    if (!tp.has_value()) {
      throw SchemaError(boost::str(
          boost::format("column %1% of %2% has unsupported type %3%") % col %
          name % type_name));
    }
    cols.push_back(Column{.name = col, .type = *tp});
  }
  return cols;
}

const Relation &Schema::declare(
    const std::string &name,
    const std::vector<std::pair<std::string, std::string>> &columns,
    RelationKind kind) {
  return declare(name, parse_columns(name, columns), kind);
}

void Schema::forget(const std::string &name) {
  auto it = _relations.find(sql_identifier(name));
  if (it != _relations.end() && it->second.name == name) {
    _relations.erase(it);
  }
}

const Relation *Schema::find(const std::string &name) const {
  auto it = _relations.find(sql_identifier(name));
  if (it == _relations.end() || it->second.name != name) {
    return nullptr;
  }
  return &it->second;
}

std::vector<Relation> Schema::relations() const {
  std::vector<Relation> rels;
  for (const auto &[_, rel] : _relations) {
    rels.push_back(rel);
  }
  return rels;
}
} // namespace featherlog
