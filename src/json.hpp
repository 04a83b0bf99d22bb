#ifndef DEF_JSON_HPP
#define DEF_JSON_HPP

#include "datalog.hpp"
#include <iostream>
#include <string>

namespace featherlog {
// Print a string as a JSON string literal
std::ostream &write_json(std::ostream &, const std::string &);
// Print a row as a JSON array. Non finite reals are printed as null.
std::ostream &write_json(std::ostream &, const Row &);
} // namespace featherlog

#endif
