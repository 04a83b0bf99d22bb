#ifndef DEF_PARSER_IMPL_HPP
#define DEF_PARSER_IMPL_HPP

#include "datalog.hpp"
#include <boost/phoenix/bind/bind_member_variable.hpp>
#include <boost/phoenix/operator.hpp>
#include <boost/phoenix/statement/sequence.hpp>
#include <boost/spirit/include/qi.hpp>
#include <cstdint>

namespace featherlog {
namespace qi = boost::spirit::qi;
namespace ascii = boost::spirit::ascii;
namespace phoenix = boost::phoenix;

template <typename Iterator>
struct clause_grammar
    : qi::grammar<Iterator, Clause(), ascii::space_type> {
  clause_grammar() : clause_grammar::base_type(clause) {
    using qi::_1;
    using qi::_val;
    using qi::lit;

    escapes.add("n", '\n')("t", '\t')("\\", '\\')("\"", '"');
    escaped %= lit('\\') > escapes;
    string %= '"' > *(escaped | (qi::char_ - qi::char_("\"\\"))) > '"';
    value = qi::real_parser<double, qi::strict_real_policies<double>>()
                [_val = _1] |
            qi::int_parser<std::int64_t>()[_val = _1] | string[_val = _1];
    var_name %= qi::upper > *(qi::alnum | qi::char_('_'));
    var = var_name[phoenix::bind(&Variable::name, _val) = _1];
    term = var[_val = _1] | value[_val = _1];
    pred_name %= qi::lower > *(qi::alnum | qi::char_("-_"));
    prop %= pred_name > '(' > (term % ',') > ')';
    conj %= prop % ',';
    clause %= prop > -(lit(":-") > (conj % ';')) > '.';
  }

  qi::symbols<char, char> escapes;
  qi::rule<Iterator, char()> escaped;
  qi::rule<Iterator, std::string()> string;
  qi::rule<Iterator, Value()> value;
  qi::rule<Iterator, std::string()> var_name;
  qi::rule<Iterator, Variable()> var;
  qi::rule<Iterator, Term()> term;
  qi::rule<Iterator, std::string()> pred_name;
  qi::rule<Iterator, Prop(), ascii::space_type> prop;
  qi::rule<Iterator, std::vector<Prop>(), ascii::space_type> conj;
  qi::rule<Iterator, Clause(), ascii::space_type> clause;
};

template <typename Iterator>
struct program_grammar
    : qi::grammar<Iterator, std::vector<Clause>(), ascii::space_type> {
  program_grammar() : program_grammar::base_type(prog) { prog %= *clause; }

  clause_grammar<Iterator> clause;
  qi::rule<Iterator, std::vector<Clause>(), ascii::space_type> prog;
};

// One relation per line: `name, type, ...` or `name, column: type, ...`
template <typename Iterator>
struct types_grammar
    : qi::grammar<Iterator, std::vector<Declaration>(), ascii::blank_type> {
  types_grammar() : types_grammar::base_type(csv) {
    using qi::_1;
    using qi::_2;
    using qi::_val;

    type.add("integer", Type::Integer)("real", Type::Real)("text", Type::Text);
    ident %= (qi::alpha | qi::char_('_')) > *(qi::alnum | qi::char_('_'));
    named = (ident >> ':' >> type)[phoenix::bind(&ColumnDecl::name, _val) = _1,
                                   phoenix::bind(&ColumnDecl::type, _val) = _2];
    positional = type[phoenix::bind(&ColumnDecl::type, _val) = _1];
    column %= named | positional;
    entry %= qi::lexeme[rule.pred_name] > ',' > (column % ',');
    csv %= *qi::eol > -(entry % +qi::eol) > *qi::eol;
  }

  clause_grammar<Iterator> rule;
  qi::symbols<char, Type> type;
  qi::rule<Iterator, std::string()> ident;
  qi::rule<Iterator, ColumnDecl(), ascii::blank_type> named;
  qi::rule<Iterator, ColumnDecl(), ascii::blank_type> positional;
  qi::rule<Iterator, ColumnDecl(), ascii::blank_type> column;
  qi::rule<Iterator, Declaration(), ascii::blank_type> entry;
  qi::rule<Iterator, std::vector<Declaration>(), ascii::blank_type> csv;
};

// One fact per line: `name, value, ...`
template <typename Iterator>
struct facts_grammar
    : qi::grammar<Iterator, std::vector<GroundedProp>(), ascii::blank_type> {
  facts_grammar() : facts_grammar::base_type(csv) {
    entry %= qi::lexeme[rule.pred_name] > ',' > (rule.value % ',');
    csv %= *qi::eol > -(entry % +qi::eol) > *qi::eol;
  }

  clause_grammar<Iterator> rule;
  qi::rule<Iterator, GroundedProp(), ascii::blank_type> entry;
  qi::rule<Iterator, std::vector<GroundedProp>(), ascii::blank_type> csv;
};
} // namespace featherlog

#endif
