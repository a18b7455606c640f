#include "merger.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <map>
#include <stdexcept>
#include <utility>

namespace accumulation {

namespace {

// Pairwise rounds: [a b c d e] -> [ab cd e] -> [abcd e] -> [abcde]
template <typename T, typename MergeFn>
T reduce_tree(std::vector<T> level, MergeFn merge_into) {
  while (level.size() > 1) {
    std::vector<T> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
      merge_into(level[i], level[i + 1]);
      next.push_back(std::move(level[i]));
    }
    if (level.size() % 2 == 1)
      next.push_back(std::move(level.back()));
    level = std::move(next);
  }
  return std::move(level.front());
}

} // namespace

Accumulator merge_accumulators(const std::vector<Accumulator> &inputs) {
  if (inputs.empty())
    throw std::invalid_argument("merge_accumulators: empty input list");

  Accumulator result = inputs.front();
  for (size_t i = 1; i < inputs.size(); ++i)
    result.merge(inputs[i]);
  return result;
}

Accumulator tree_merge(const std::vector<Accumulator> &inputs) {
  if (inputs.empty())
    throw std::invalid_argument("tree_merge: empty input list");

  return reduce_tree(inputs, [](Accumulator &lhs, const Accumulator &rhs) {
    lhs.merge(rhs);
  });
}

AccumulatorSet merge_by_key(const std::vector<Accumulator> &inputs,
                            MergeStrategy strategy) {
  std::map<AccumulatorKey, std::vector<Accumulator>> groups;
  for (const auto &accumulator : inputs)
    groups[accumulator.key()].push_back(accumulator);

  AccumulatorSet result;
  for (const auto &group : groups) {
    result.insert(strategy == MergeStrategy::TREE
                      ? tree_merge(group.second)
                      : merge_accumulators(group.second));
  }

  LOG(LogLevel::DEBUG, LogComponent::MERGE,
      "Merged " << inputs.size() << " accumulators into " << result.size()
                << " keys");
  return result;
}

AccumulatorSet merge_sets(const std::vector<AccumulatorSet> &sets,
                          MergeStrategy strategy) {
  if (sets.empty())
    throw std::invalid_argument("merge_sets: empty input list");

  AccumulatorSet result;
  try {
    if (strategy == MergeStrategy::TREE) {
      result = reduce_tree(sets, [](AccumulatorSet &lhs,
                                    const AccumulatorSet &rhs) {
        lhs.merge_from(rhs);
      });
    } else {
      for (const auto &set : sets)
        result.merge_from(set);
    }
  } catch (const core::IncompatibleAccumulatorError &e) {
    LOG(LogLevel::ERROR, LogComponent::MERGE,
        "Aborting merge of " << sets.size() << " sets: " << e.what());
    throw;
  }

  LOG(LogLevel::INFO, LogComponent::MERGE,
      "Merged " << sets.size() << " accumulator sets into " << result.size()
                << " keys");
  return result;
}

} // namespace accumulation
