#include "chunk_processor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <utility>

namespace workflow {

namespace {

void check_length(const std::string &chunk_id, const char *what,
                  size_t actual, size_t expected) {
  if (actual != expected) {
    throw core::ShapeMismatchError("chunk '" + chunk_id + "': " + what +
                                   " has " + std::to_string(actual) +
                                   " values, expected " +
                                   std::to_string(expected));
  }
}

void check_probabilities(const std::string &chunk_id,
                         const std::vector<double> &probability,
                         size_t expected,
                         const accumulation::AccumulatorConfig &config) {
  if (probability.empty())
    return;
  if (!config.has_probability_bins())
    throw core::ConfigurationError("chunk '" + chunk_id +
                                   "' carries probabilities but its variable "
                                   "has no probability bins");
  check_length(chunk_id, "probability", probability.size(), expected);
}

// Copies the time series of one window cell out of a [t][j][i] array
void gather_series(const std::vector<double> &values, size_t cell_count,
                   size_t n_times, size_t offset, std::vector<double> &out) {
  for (size_t t = 0; t < n_times; ++t)
    out.push_back(values[t * cell_count + offset]);
}

void add_update(ChunkStats &stats, const accumulation::UpdateResult &result) {
  stats.accepted += result.accepted;
  stats.rejected += result.rejected;
  ++stats.accumulators_updated;
}

} // namespace

ChunkProcessor::ChunkProcessor(
    std::shared_ptr<const routing::ChunkRouter> router, VariableConfigs configs)
    : router_(std::move(router)), configs_(std::move(configs)) {
  if (!router_)
    throw core::ConfigurationError("chunk processor needs a router");
}

void ChunkProcessor::restore(accumulation::AccumulatorSet accumulators,
                             std::set<std::string> completed_chunks) {
  accumulators_ = std::move(accumulators);
  completed_chunks_ = std::move(completed_chunks);
  LOG(LogLevel::INFO, LogComponent::WORKFLOW,
      "Restored " << accumulators_.size() << " accumulators and "
                  << completed_chunks_.size() << " completed chunks");
}

const accumulation::AccumulatorConfigPtr &
ChunkProcessor::config_for(const std::string &variable) const {
  auto it = configs_.find(variable);
  if (it == configs_.end() || !it->second)
    throw core::ConfigurationError("no accumulator configuration for "
                                   "variable '" +
                                   variable + "'");
  return it->second;
}

bool ChunkProcessor::process(const GridChunk &chunk, ChunkStats *stats) {
  if (is_completed(chunk.chunk_id)) {
    LOG(LogLevel::DEBUG, LogComponent::WORKFLOW,
        "Skipping completed chunk " << chunk.chunk_id);
    return false;
  }

  const auto &config = config_for(chunk.variable);
  const size_t expected = chunk.expected_size();
  check_length(chunk.chunk_id, "forecast", chunk.forecast.size(), expected);
  check_length(chunk.chunk_id, "observation", chunk.observation.size(),
               expected);
  check_probabilities(chunk.chunk_id, chunk.probability, expected, *config);

  const auto plan = router_->route(chunk.range);
  const size_t cells = chunk.range.cell_count();
  const bool has_prob = !chunk.probability.empty();

  accumulation::AccumulatorSet staged;
  ChunkStats local;
  std::vector<double> f, o, p;

  for (const auto &target : plan->gridpoints) {
    f.clear();
    o.clear();
    p.clear();
    gather_series(chunk.forecast, cells, chunk.n_times, target.offset, f);
    gather_series(chunk.observation, cells, chunk.n_times, target.offset, o);
    if (has_prob)
      gather_series(chunk.probability, cells, chunk.n_times, target.offset, p);

    auto &acc = staged.get_or_create(target.entity, chunk.variable, config);
    add_update(local, acc.update(f, o, has_prob ? &p : nullptr));
  }

  // Regions see the same pairs as their member gridpoints, so their counts
  // stay out of accepted/rejected.
  for (const auto &[region, members] : plan->region_members) {
    f.clear();
    o.clear();
    p.clear();
    for (size_t member : members) {
      const size_t offset = plan->gridpoints[member].offset;
      gather_series(chunk.forecast, cells, chunk.n_times, offset, f);
      gather_series(chunk.observation, cells, chunk.n_times, offset, o);
      if (has_prob)
        gather_series(chunk.probability, cells, chunk.n_times, offset, p);
    }
    auto &acc = staged.get_or_create(accumulation::EntityKey::region(region),
                                     chunk.variable, config);
    acc.update(f, o, has_prob ? &p : nullptr);
    ++local.accumulators_updated;
  }

  commit(chunk.chunk_id, staged);

  LOG(LogLevel::DEBUG, LogComponent::WORKFLOW,
      "Chunk " << chunk.chunk_id << " [" << chunk.variable
               << "]: accepted=" << local.accepted
               << " rejected=" << local.rejected
               << " accumulators=" << local.accumulators_updated);
  if (stats)
    *stats = local;
  return true;
}

bool ChunkProcessor::process(const StationChunk &chunk, ChunkStats *stats) {
  if (is_completed(chunk.chunk_id)) {
    LOG(LogLevel::DEBUG, LogComponent::WORKFLOW,
        "Skipping completed chunk " << chunk.chunk_id);
    return false;
  }

  const auto &config = config_for(chunk.variable);
  const size_t cells = chunk.range.cell_count();
  const size_t expected = chunk.n_times * cells;
  check_length(chunk.chunk_id, "forecast", chunk.forecast.size(), expected);
  check_probabilities(chunk.chunk_id, chunk.probability, expected, *config);
  for (const auto &station : chunk.stations)
    check_length(chunk.chunk_id, ("station " + station.station_id).c_str(),
                 station.values.size(), chunk.n_times);

  const bool has_prob = !chunk.probability.empty();
  accumulation::AccumulatorSet staged;
  ChunkStats local;
  std::vector<double> f, p;

  for (const auto &station : chunk.stations) {
    auto gridpoint = router_->route_station(station.station_id);
    if (!gridpoint || !chunk.range.contains(*gridpoint)) {
      ++local.unroutable_stations;
      LOG(LogLevel::DEBUG, LogComponent::ROUTING,
          "Station " << station.station_id
                     << " has no gridpoint inside chunk " << chunk.chunk_id);
      continue;
    }

    const size_t offset = chunk.range.offset_of(*gridpoint);
    f.clear();
    p.clear();
    gather_series(chunk.forecast, cells, chunk.n_times, offset, f);
    if (has_prob)
      gather_series(chunk.probability, cells, chunk.n_times, offset, p);

    auto entity = accumulation::EntityKey::station(
        station.station_id, station.station_name, station.lat, station.lon,
        station.elevation_m, station.network);
    auto &acc = staged.get_or_create(entity, chunk.variable, config);
    add_update(local, acc.update(f, station.values, has_prob ? &p : nullptr));
  }

  commit(chunk.chunk_id, staged);

  if (local.unroutable_stations > 0) {
    LOG(LogLevel::WARN, LogComponent::WORKFLOW,
        "Chunk " << chunk.chunk_id << ": " << local.unroutable_stations
                 << " stations could not be matched to a gridpoint");
  }
  if (stats)
    *stats = local;
  return true;
}

void ChunkProcessor::commit(const std::string &chunk_id,
                            const accumulation::AccumulatorSet &staged) {
  for (const auto &entry : staged) {
    const auto *existing = accumulators_.find(entry.first);
    if (existing && !existing->is_compatible_with(entry.second)) {
      throw core::ConfigurationError("chunk '" + chunk_id + "': " +
                                     entry.first.to_string() +
                                     " conflicts with the accumulated state");
    }
  }

  accumulators_.merge_from(staged);
  completed_chunks_.insert(chunk_id);
}

} // namespace workflow
