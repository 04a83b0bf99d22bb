#ifndef DEF_PARSER_HPP
#define DEF_PARSER_HPP

#include "parser_impl.hpp"
#include <boost/spirit/include/qi.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace featherlog {
template <typename It> It advance_with_last(It it, size_t n, It last) {
  for (size_t i = 0; i < n && it != last; ++i) {
    ++it;
  }
  return it;
}

// Parse the whole input, reporting failures on std::cerr.
template <typename V, typename Parser, typename It, typename Skipper>
std::optional<V> generic_parser(It first, It last, Skipper skipper) {
  V result;
  Parser parser;
  try {
    bool r = qi::phrase_parse(first, last, parser, skipper, result);
    if (r && first == last) {
      return result;
    }
    std::cerr << "Failed at "
              << std::string(first, advance_with_last(first, 50, last))
              << std::endl;
  } catch (const qi::expectation_failure<It> &e) {
    std::cerr << "Expected " << e.what_ << " at "
              << std::string(e.first, advance_with_last(e.first, 50, e.last))
              << std::endl;
  }
  return {};
}

template <typename It>
std::optional<std::vector<Clause>> parse_rules(It first, It last) {
  return generic_parser<std::vector<Clause>, program_grammar<It>>(
      first, last, ascii::space);
}

template <typename It>
std::optional<std::vector<Declaration>> parse_types(It first, It last) {
  return generic_parser<std::vector<Declaration>, types_grammar<It>>(
      first, last, ascii::blank);
}

template <typename It>
std::optional<std::vector<GroundedProp>> parse_facts(It first, It last) {
  return generic_parser<std::vector<GroundedProp>, facts_grammar<It>>(
      first, last, ascii::blank);
}
} // namespace featherlog

#endif
