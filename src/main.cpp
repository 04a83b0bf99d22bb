#include "context.hpp"
#include "datalog.hpp"
#include "errors.hpp"
#include "json.hpp"
#include "loader.hpp"
#include "parser.hpp"
#include <boost/program_options.hpp>
#include <boost/spirit/include/support_multi_pass.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;
namespace fs = std::filesystem;

using file_iterator =
    boost::spirit::multi_pass<std::istreambuf_iterator<char>>;

// Parse a whole file with one of the parse_* functions. Failures are reported
// on std::cerr.
template <typename V>
std::optional<V> parse_file(const fs::path &path,
                            std::optional<V> (*parse)(file_iterator,
                                                      file_iterator)) {
  std::ifstream ifs(path);
  if (!ifs) {
    std::cerr << "Could not open " << path << std::endl;
    return {};
  }
  std::optional<V> parsed =
      parse(boost::spirit::make_default_multi_pass(
                std::istreambuf_iterator<char>{ifs}),
            boost::spirit::make_default_multi_pass(
                std::istreambuf_iterator<char>()));
  if (!parsed.has_value()) {
    std::cerr << "Failed to parse " << path << std::endl;
  }
  return parsed;
}

int main(int argc, char *argv[]) {
  // Handle CLI arguments
  po::options_description desc("Allowed options");
  desc.add_options()("help", "produce help message")(
      "types", po::value<fs::path>(), "types file to load")(
      "rules", po::value<fs::path>(), "datalog rules to run (mandatory)")(
      "facts", po::value<fs::path>(), "facts file to load")(
      "query", po::value<std::string>()->default_value("query"),
      "relation to print once the rules are run")(
      "database", po::value<std::string>()->default_value(":memory:"),
      "sqlite database to work in")(
      "max-passes",
      po::value<size_t>()->default_value(featherlog::default_max_passes),
      "stop after this many passes if no fixpoint is reached")(
      "passes", po::value<size_t>(),
      "run exactly this many passes instead of stopping at the fixpoint")(
      "ordered", po::value<bool>()->default_value(false)->implicit_value(true),
      "sort the printed rows")(
      "verbose", po::value<bool>()->default_value(false)->implicit_value(true),
      "trace every pass on stderr")(
      "config", po::value<fs::path>(),
      "ini file giving default values for the options above");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("config")) {
      fs::path config_path = vm["config"].as<fs::path>();
      std::ifstream ifs(config_path);
      if (!ifs) {
        std::cerr << "Could not open " << config_path << std::endl;
        return 1;
      }
      // Values already stored from the command line are kept
      po::store(po::parse_config_file(ifs, desc), vm);
    }
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << e.what() << "\n\n" << desc << std::endl;
    return 1;
  }

  if (vm.count("help")) {
    std::cout << desc << std::endl;
    return 0;
  }

  if (!vm.count("rules")) {
    std::cerr << "Rules path was not set\n\n" << desc << std::endl;
    return 1;
  }

  std::vector<featherlog::Declaration> declarations;
  if (vm.count("types")) {
    std::optional<std::vector<featherlog::Declaration>> parsed =
        parse_file(vm["types"].as<fs::path>(),
                   &featherlog::parse_types<file_iterator>);
    if (!parsed.has_value()) {
      return 1;
    }
    declarations = std::move(*parsed);
  }

  std::optional<std::vector<featherlog::Clause>> clauses = parse_file(
      vm["rules"].as<fs::path>(), &featherlog::parse_rules<file_iterator>);
  if (!clauses.has_value()) {
    return 1;
  }

  std::vector<featherlog::GroundedProp> facts;
  if (vm.count("facts")) {
    std::optional<std::vector<featherlog::GroundedProp>> parsed =
        parse_file(vm["facts"].as<fs::path>(),
                   &featherlog::parse_facts<file_iterator>);
    if (!parsed.has_value()) {
      return 1;
    }
    facts = std::move(*parsed);
  }

  featherlog::FixpointOptions opts;
  opts.max_passes = vm["max-passes"].as<size_t>();
  if (vm.count("passes")) {
    opts = featherlog::FixpointOptions::fixed(vm["passes"].as<size_t>());
  }
  if (vm["verbose"].as<bool>()) {
    opts.trace = &std::cerr;
  }

  try {
    featherlog::Connection conn(vm["database"].as<std::string>());
    featherlog::Context ctx = conn.cursor();
    featherlog::LoadedProgram program =
        featherlog::load_program(ctx, declarations, *clauses, facts);
    featherlog::RunStats stats = ctx.run(program.rules, opts);
    if (vm["verbose"].as<bool>()) {
      std::cerr << stats.rows_inserted << " rows derived in " << stats.passes
                << " passes" << std::endl;
    }

    std::string query = vm["query"].as<std::string>();
    auto it = program.relations.find(query);
    if (it == program.relations.end()) {
      std::cerr << "No relation named " << query << std::endl;
      return 1;
    }
    std::vector<featherlog::Term> projection;
    for (const featherlog::Column &col : it->second.columns) {
      projection.push_back(featherlog::Variable{col.name});
    }
    {
      featherlog::Rows rows =
          ctx.select(projection, featherlog::apply(it->second, projection),
                     {.ordered = vm["ordered"].as<bool>()});
      for (const featherlog::Row &row : rows) {
        featherlog::write_json(std::cout, row) << '\n';
      }
    }
    ctx.commit();
  } catch (const featherlog::Error &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
