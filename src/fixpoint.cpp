#include "fixpoint.hpp"
#include <iostream>
#include <memory>

namespace featherlog {
FixpointOptions FixpointOptions::fixed(size_t passes) {
  FixpointOptions opts;
  opts.max_passes = passes;
  opts.fixed_passes = true;
  return opts;
}

RunStats run_fixpoint(Database &db, const std::vector<Sql> &statements,
                      const FixpointOptions &opts) {
  std::vector<std::unique_ptr<Statement>> prepared;
  for (const Sql &sql : statements) {
    prepared.push_back(std::make_unique<Statement>(db, sql));
  }

  RunStats stats;
  while (stats.passes < opts.max_passes) {
    size_t inserted = 0;
    for (auto &stmt : prepared) {
      inserted += stmt->execute();
    }
    stats.passes += 1;
    stats.rows_inserted += inserted;
    if (opts.trace) {
      *opts.trace << "pass " << stats.passes << ": " << inserted
                  << " new rows" << std::endl;
    }
    if (inserted == 0) {
      stats.converged = true;
      if (!opts.fixed_passes) {
        break;
      }
    }
  }

  if (!stats.converged && !opts.fixed_passes) {
    std::cerr << "No fixpoint after " << stats.passes
              << " passes, stopping" << std::endl;
  }
  return stats;
}
} // namespace featherlog
