#ifndef CHUNK_PROCESSOR_HPP
#define CHUNK_PROCESSOR_HPP

#include "accumulation/accumulator_config.hpp"
#include "accumulation/accumulator_set.hpp"
#include "routing/chunk_router.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace workflow {

using VariableConfigs =
    std::map<std::string, accumulation::AccumulatorConfigPtr>;

// Gridded forecast/analysis pair over one window and `n_times` valid times.
// Values are laid out [t][j][i]; NaN or the configured sentinel marks
// missing cells. `probability` is empty or has the same layout.
struct GridChunk {
  std::string chunk_id;
  std::string variable;
  routing::GridRange range;
  size_t n_times = 1;
  std::vector<double> forecast;
  std::vector<double> observation;
  std::vector<double> probability;

  size_t expected_size() const { return n_times * range.cell_count(); }
};

struct StationObservation {
  std::string station_id;
  std::string station_name;
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> elevation_m;
  std::string network;
  std::vector<double> values; // one per valid time
};

// Point observations verified against the forecast at each station's
// nearest gridpoint. `forecast` and `probability` follow GridChunk layout.
struct StationChunk {
  std::string chunk_id;
  std::string variable;
  routing::GridRange range;
  size_t n_times = 1;
  std::vector<double> forecast;
  std::vector<double> probability;
  std::vector<StationObservation> stations;
};

struct ChunkStats {
  size_t accepted = 0;
  size_t rejected = 0;
  size_t accumulators_updated = 0;
  size_t unroutable_stations = 0;
};

/**
 * Folds chunks into the accumulator set it owns.
 *
 * A chunk is validated and staged in full before anything is committed, so
 * a chunk that fails (core::ShapeMismatchError, core::ConfigurationError)
 * leaves neither accumulators nor the completed set changed. Chunks whose
 * id is already completed are skipped.
 */
class ChunkProcessor {
public:
  ChunkProcessor(std::shared_ptr<const routing::ChunkRouter> router,
                 VariableConfigs configs);

  // Resume: start from a restored set and its completed chunk ids
  void restore(accumulation::AccumulatorSet accumulators,
               std::set<std::string> completed_chunks);

  // Returns false when the chunk was already completed and nothing happened
  bool process(const GridChunk &chunk, ChunkStats *stats = nullptr);
  bool process(const StationChunk &chunk, ChunkStats *stats = nullptr);

  bool is_completed(const std::string &chunk_id) const {
    return completed_chunks_.count(chunk_id) > 0;
  }

  const accumulation::AccumulatorSet &accumulators() const {
    return accumulators_;
  }
  const std::set<std::string> &completed_chunks() const {
    return completed_chunks_;
  }

private:
  const accumulation::AccumulatorConfigPtr &
  config_for(const std::string &variable) const;

  void commit(const std::string &chunk_id,
              const accumulation::AccumulatorSet &staged);

  std::shared_ptr<const routing::ChunkRouter> router_;
  VariableConfigs configs_;
  accumulation::AccumulatorSet accumulators_;
  std::set<std::string> completed_chunks_;
};

} // namespace workflow

#endif // CHUNK_PROCESSOR_HPP
