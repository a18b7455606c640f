#ifndef MERGER_HPP
#define MERGER_HPP

#include "accumulator.hpp"
#include "accumulator_set.hpp"

#include <vector>

namespace accumulation {

enum class MergeStrategy {
  SEQUENTIAL, // left fold
  TREE        // pairwise rounds
};

// Reduces accumulators that all share one key. Throws std::invalid_argument
// for an empty list and core::IncompatibleAccumulatorError on any mismatch.
Accumulator merge_accumulators(const std::vector<Accumulator> &inputs);
Accumulator tree_merge(const std::vector<Accumulator> &inputs);

// Groups accumulators by key and reduces every group.
AccumulatorSet merge_by_key(const std::vector<Accumulator> &inputs,
                            MergeStrategy strategy = MergeStrategy::SEQUENTIAL);

// Final reduction of per-worker sets. The inputs are left untouched.
AccumulatorSet merge_sets(const std::vector<AccumulatorSet> &sets,
                          MergeStrategy strategy = MergeStrategy::SEQUENTIAL);

} // namespace accumulation

#endif // MERGER_HPP
