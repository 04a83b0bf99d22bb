#ifndef DEF_FIXPOINT_HPP
#define DEF_FIXPOINT_HPP

#include "sql.hpp"
#include "store.hpp"
#include <cstddef>
#include <ostream>
#include <vector>

namespace featherlog {
constexpr size_t default_max_passes = 1000;

struct FixpointOptions {
  // Upper bound on the number of passes
  size_t max_passes = default_max_passes;
  // Run exactly max_passes passes instead of stopping at convergence
  bool fixed_passes = false;
  // When set, receives one line per pass
  std::ostream *trace = nullptr;

  // Opt-in fixed count evaluation, for tests and bounded environments
  static FixpointOptions fixed(size_t passes);
};

struct RunStats {
  size_t passes = 0;
  size_t rows_inserted = 0;
  // True once a pass inserted nothing
  bool converged = false;
};

// Execute every statement once per pass until a pass inserts no row or the
// pass bound is reached. The statements must be duplicate-ignoring inserts
// into tables with a full row uniqueness constraint: a pass inserting zero
// rows is the only termination signal.
RunStats run_fixpoint(Database &, const std::vector<Sql> &,
                      const FixpointOptions & = {});
} // namespace featherlog

#endif
