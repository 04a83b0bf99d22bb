#ifndef DEF_LOADER_HPP
#define DEF_LOADER_HPP

#include "algebra.hpp"
#include "context.hpp"
#include "datalog.hpp"
#include <map>
#include <string>
#include <vector>

namespace featherlog {
struct LoadedProgram {
  std::map<std::string, Relation> relations;
  std::vector<Rule> rules;
};

// Type a parsed program, declare its relations on the context and insert its
// facts. Predicates heading a clause with a body become relation sets, the
// others base relations. Throws TypeError if the program can't be typed.
LoadedProgram load_program(Context &, const std::vector<Declaration> &,
                           const std::vector<Clause> &,
                           const std::vector<GroundedProp> & = {});
} // namespace featherlog

#endif
