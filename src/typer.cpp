#include "typer.hpp"
#include <algorithm>
#include <iterator>
#include <type_traits>

namespace featherlog {
namespace {
bool widens(Type from, Type to) {
  return from == to || (from == Type::Integer && to == Type::Real);
}

// Least type holding both, false if there is none
bool join(std::optional<Type> &into, std::optional<Type> other) {
  if (!other.has_value() || into == other) {
    return true;
  }
  if (!into.has_value()) {
    into = other;
    return true;
  }
  if (*into != Type::Text && *other != Type::Text) {
    into = Type::Real;
    return true;
  }
  return false;
}
} // namespace

bool Program::declare(const Declaration &decl) {
  if (has_conflict()) {
    return false;
  }
  init();

  std::vector<size_t> *args = get_pred(decl.name, decl.columns.size());
  if (!args) {
    return false;
  }
  for (size_t arg = 0; arg < args->size(); ++arg) {
    if (!unite_arg(decl.name, arg, (*args)[arg],
                   type_cell(decl.columns[arg].type))) {
      return false;
    }
  }
  return check_widenings();
}

bool Program::add_clause(const Clause &clause) {
  if (has_conflict()) {
    return false;
  }
  init();

  // Variables are shared by the head and every disjunct
  std::map<std::string, size_t> variables;
  for (const std::vector<Prop> &conj : clause.body) {
    for (const Prop &prop : conj) {
      if (!add_prop(prop, variables)) {
        return false;
      }
    }
  }
  return add_head(clause.head, variables) && check_widenings();
}

bool Program::add_fact(const GroundedProp &fact) {
  if (has_conflict()) {
    return false;
  }
  init();

  std::vector<size_t> *args = get_pred(fact.pred, fact.args.size());
  if (!args) {
    return false;
  }
  for (size_t arg = 0; arg < fact.args.size(); ++arg) {
    if (!add_value(fact.pred, arg, (*args)[arg], fact.args[arg])) {
      return false;
    }
  }
  return check_widenings();
}

bool Program::has_conflict() const {
  return _conflict.has_value() || _arity_conflict.has_value();
}

bool Program::has_conflict(std::ostream &os) const {
  if (_conflict.has_value()) {
    os << "Predicate's " << _conflict->pred << " " << _conflict->arg
       << "th argument has both " << _conflict->type1 << " and "
       << _conflict->type2 << " types\n";
  } else if (_arity_conflict.has_value()) {
    os << "Predicate " << _arity_conflict->pred << " is used with both "
       << _arity_conflict->arity1 << " and " << _arity_conflict->arity2
       << " arguments\n";
  }
  return has_conflict();
}

bool Program::fully_typed() const {
  if (has_conflict()) {
    return false;
  }
  std::map<size_t, Type> types;
  if (resolve(types, true).has_value()) {
    return false;
  }
  return std::all_of(_predicates.begin(), _predicates.end(),
                     [&](const auto &pred) {
                       return std::all_of(
                           pred.second.begin(), pred.second.end(),
                           [&](size_t id) { return types.count(find(id)); });
                     });
}

bool Program::fully_typed(std::ostream &os) const {
  if (has_conflict(os)) {
    return false;
  }
  std::map<size_t, Type> types;
  if (std::optional<Conflict> conflict = resolve(types, true)) {
    os << "Predicate's " << conflict->pred << " " << conflict->arg
       << "th argument has both " << conflict->type1 << " and "
       << conflict->type2 << " types\n";
    return false;
  }
  for (const auto &[pred, args] : _predicates) {
    for (size_t arg = 0; arg < args.size(); ++arg) {
      if (!types.count(find(args[arg]))) {
        os << "Predicate's " << pred << " " << arg
           << "th argument is not constrained\n";
        return false;
      }
    }
  }
  return true;
}

std::vector<Declaration> Program::predicates() const {
  std::map<size_t, Type> types;
  resolve(types, true);
  std::vector<Declaration> preds;
  for (const auto &[name, args] : _predicates) {
    Declaration pred;
    pred.name = name;
    std::transform(args.begin(), args.end(), std::back_inserter(pred.columns),
                   [&](size_t id) {
                     return ColumnDecl{.name = {}, .type = types.at(find(id))};
                   });
    preds.push_back(std::move(pred));
  }
  return preds;
}

// The first three cells stand for the types themselves
void Program::init() {
  if (!_uf.empty())
    return;
  for (Type tp : {Type::Integer, Type::Real, Type::Text}) {
    _uf.push_back(
        Cell{.parent = _uf.size(), .rank = 0, .type = tp, .floor = {}});
  }
}

size_t Program::type_cell(Type tp) const {
  switch (tp) {
  case Type::Integer:
    return 0;
  case Type::Real:
    return 1;
  case Type::Text:
    return 2;
  }
  return 2; // Will never happen
}

size_t Program::fresh_cell() {
  _uf.push_back(Cell{.parent = _uf.size(), .rank = 0, .type = {}, .floor = {}});
  return _uf.size() - 1;
}

size_t Program::find(size_t id) {
  size_t parent = _uf[id].parent;
  if (parent == id) {
    return id;
  }
  size_t root = find(parent);
  _uf[id].parent = root;
  return root;
}

size_t Program::find(size_t id) const {
  while (_uf[id].parent != id) {
    id = _uf[id].parent;
  }
  return id;
}

std::optional<Type> Program::known(size_t id) const {
  const Cell &root = _uf[find(id)];
  return root.type.has_value() ? root.type : root.floor;
}

bool Program::unite(size_t c1, size_t c2) {
  size_t r1 = find(c1);
  size_t r2 = find(c2);
  if (r1 == r2) {
    return true;
  }
  std::optional<Type> t1 = _uf[r1].type;
  std::optional<Type> t2 = _uf[r2].type;
  if (t1.has_value() && t2.has_value() && *t1 != *t2) {
    return false;
  }
  std::optional<Type> type = t1.has_value() ? t1 : t2;
  std::optional<Type> floor = _uf[r1].floor;
  if (!join(floor, _uf[r2].floor) ||
      (type.has_value() && floor.has_value() && !widens(*floor, *type))) {
    return false;
  }

  // Union by rank
  if (_uf[r1].rank < _uf[r2].rank) {
    std::swap(r1, r2);
  }
  _uf[r1].type = type;
  _uf[r1].floor = floor;
  _uf[r2].parent = r1;
  if (_uf[r1].rank == _uf[r2].rank) {
    ++_uf[r1].rank;
  }
  return true;
}

bool Program::unite_arg(const std::string &pred, size_t argn, size_t arg,
                        size_t other) {
  std::optional<Type> before = known(arg);
  std::optional<Type> with = known(other);
  if (unite(arg, other)) {
    return true;
  }
  _conflict = Conflict{
      .pred = pred, .arg = argn, .type1 = *before, .type2 = *with};
  return false;
}

std::vector<size_t> *Program::get_pred(const std::string &pred,
                                       size_t arity) {
  auto it = _predicates.find(pred);
  if (it == _predicates.end()) {
    std::vector<size_t> args(arity);
    std::generate(args.begin(), args.end(), [this] { return fresh_cell(); });
    it = _predicates.emplace(pred, std::move(args)).first;
  } else if (it->second.size() != arity) {
    _arity_conflict = ArityConflict{
        .pred = pred, .arity1 = it->second.size(), .arity2 = arity};
    return nullptr;
  }
  return &it->second;
}

bool Program::add_value(const std::string &pred, size_t argn, size_t cell,
                        const Value &value) {
  Type tp = get_value_type(value);
  Cell &root = _uf[find(cell)];
  std::optional<Type> floor = root.floor;
  if (join(floor, tp) &&
      (!root.type.has_value() || widens(*floor, *root.type))) {
    root.floor = floor;
    return true;
  }
  _conflict =
      Conflict{.pred = pred, .arg = argn, .type1 = *known(cell), .type2 = tp};
  return false;
}

bool Program::add_head(const Prop &head,
                       std::map<std::string, size_t> &vars) {
  std::vector<size_t> *args = get_pred(head.pred, head.args.size());
  if (!args) {
    return false;
  }
  for (size_t argn = 0; argn < head.args.size(); ++argn) {
    size_t cell = (*args)[argn];
    if (const Value *value = std::get_if<Value>(&head.args[argn])) {
      if (!add_value(head.pred, argn, cell, *value)) {
        return false;
      }
      continue;
    }
    const std::string &name = std::get<Variable>(head.args[argn]).name;
    auto it = vars.find(name);
    if (it != vars.end()) {
      _widenings.push_back(Widening{
          .from = it->second, .to = cell, .pred = head.pred, .arg = argn});
    } else {
      // Unbound in the body, the loader rejects such clauses
      vars.emplace(name, cell);
    }
  }
  return true;
}

std::optional<Program::Conflict>
Program::resolve(std::map<size_t, Type> &types, bool infer_sources) const {
  std::map<size_t, std::optional<Type>> floors;
  auto floor_of = [&](size_t root) -> std::optional<Type> & {
    return floors.try_emplace(root, _uf[root].floor).first->second;
  };
  auto type_of = [&](size_t root) -> std::optional<Type> {
    return _uf[root].type.has_value() ? _uf[root].type : floor_of(root);
  };

  bool changed = true;
  while (changed) {
    changed = false;
    for (const Widening &w : _widenings) {
      size_t from = find(w.from);
      size_t to = find(w.to);
      std::optional<Type> tp = type_of(from);
      std::optional<Type> floor = floor_of(to);
      if (!tp.has_value()) {
        continue;
      }
      if (!join(floor, tp) ||
          (_uf[to].type.has_value() && !widens(*floor, *_uf[to].type))) {
        return Conflict{
            .pred = w.pred, .arg = w.arg, .type1 = *type_of(to), .type2 = *tp};
      }
      if (floor != floor_of(to)) {
        floor_of(to) = floor;
        changed = true;
      }
    }
    if (changed || !infer_sources) {
      continue;
    }
    for (const Widening &w : _widenings) {
      size_t from = find(w.from);
      std::optional<Type> tp = type_of(find(w.to));
      if (!type_of(from).has_value() && tp.has_value()) {
        floor_of(from) = tp;
        changed = true;
      }
    }
  }

  for (size_t id = 0; id < _uf.size(); ++id) {
    if (_uf[id].parent != id) {
      continue;
    }
    if (std::optional<Type> tp = type_of(id)) {
      types.emplace(id, *tp);
    }
  }
  return {};
}

bool Program::check_widenings() {
  std::map<size_t, Type> types;
  _conflict = resolve(types, false);
  return !_conflict.has_value();
}

template <class> inline constexpr bool always_false_v = false;

bool Program::add_prop(const Prop &prop, std::map<std::string, size_t> &vars) {
  std::vector<size_t> *args = get_pred(prop.pred, prop.args.size());
  if (!args) {
    return false;
  }
  for (size_t argn = 0; argn < prop.args.size(); ++argn) {
    size_t cell = (*args)[argn];
    bool r = std::visit(
        [&](auto &&arg) {
          using T = std::decay_t<decltype(arg)>;
          if constexpr (std::is_same_v<T, Variable>) {
            auto [it, inserted] = vars.emplace(arg.name, cell);
            return inserted || unite_arg(prop.pred, argn, it->second, cell);
          } else if constexpr (std::is_same_v<T, Value>) {
            return add_value(prop.pred, argn, cell, arg);
          } else {
            static_assert(always_false_v<T>, "non-exhaustive visitor");
          }
        },
        prop.args[argn]);
    if (!r) {
      return false;
    }
  }
  return true;
}
} // namespace featherlog
