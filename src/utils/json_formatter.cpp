#include "json_formatter.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>

nlohmann::json
JsonFormatter::metric_value_to_json(const metrics::MetricValue &value) {
  if (!value)
    return nullptr;
  return *value;
}

nlohmann::json
JsonFormatter::entity_to_json_object(const accumulation::EntityKey &entity) {
  nlohmann::json j;
  j["kind"] = accumulation::entity_kind_to_string(entity.kind);

  switch (entity.kind) {
  case accumulation::EntityKind::GRIDPOINT:
    j["grid_i"] = entity.grid_i;
    j["grid_j"] = entity.grid_j;
    j["lat"] = entity.lat;
    j["lon"] = entity.lon;
    break;
  case accumulation::EntityKind::REGION:
    j["region_type"] = entity.type;
    j["region_id"] = entity.id;
    j["region_name"] = entity.name;
    break;
  case accumulation::EntityKind::STATION:
    j["station_id"] = entity.id;
    j["station_name"] = entity.name;
    j["network"] = entity.type;
    j["lat"] = entity.lat;
    j["lon"] = entity.lon;
    j["elevation_m"] = metric_value_to_json(entity.elevation_m);
    break;
  }
  return j;
}

nlohmann::json JsonFormatter::state_to_json_object(
    const accumulation::AccumulatorState &state) {
  nlohmann::json j;
  j["sample_count"] = state.sample_count;
  j["missing_count"] = state.missing_count;
  j["sum_fcst"] = state.sum_fcst;
  j["sum_obs"] = state.sum_obs;
  j["sum_abs_error"] = state.sum_abs_error;
  j["sum_error"] = state.sum_error;
  j["sum_squared_error"] = state.sum_squared_error;
  j["moment_count"] = state.moment_count;
  j["sum_fcst_squared"] = state.sum_fcst_squared;
  j["sum_obs_squared"] = state.sum_obs_squared;
  j["sum_fcst_obs"] = state.sum_fcst_obs;

  nlohmann::json tables = nlohmann::json::array();
  for (const auto &table : state.contingency) {
    tables.push_back({{"hits", table.hits},
                      {"misses", table.misses},
                      {"false_alarms", table.false_alarms},
                      {"correct_negatives", table.correct_negatives}});
  }
  j["contingency"] = tables;

  nlohmann::json bins = nlohmann::json::array();
  for (const auto &bin : state.probability_bins) {
    bins.push_back({{"forecast_prob_sum", bin.forecast_prob_sum},
                    {"observed_event_count", bin.observed_event_count},
                    {"bin_sample_count", bin.bin_sample_count}});
  }
  j["probability_bins"] = bins;
  j["sum_squared_prob_error"] = state.sum_squared_prob_error;
  return j;
}

nlohmann::json
JsonFormatter::report_to_json_object(const metrics::MetricsReport &report) {
  nlohmann::json j;
  j["entity"] = entity_to_json_object(report.entity);
  j["variable"] = report.variable;
  j["sample_count"] = report.sample_count;
  j["missing_count"] = report.missing_count;

  // === Continuous ===
  const auto &c = report.continuous;
  j["continuous"] = {{"mae", metric_value_to_json(c.mae)},
                     {"bias", metric_value_to_json(c.bias)},
                     {"rmse", metric_value_to_json(c.rmse)},
                     {"bias_ratio", metric_value_to_json(c.bias_ratio)},
                     {"mean_fcst", metric_value_to_json(c.mean_fcst)},
                     {"mean_obs", metric_value_to_json(c.mean_obs)},
                     {"fcst_stddev", metric_value_to_json(c.fcst_stddev)},
                     {"obs_stddev", metric_value_to_json(c.obs_stddev)},
                     {"correlation", metric_value_to_json(c.correlation)}};

  // === Categorical, one entry per threshold ===
  nlohmann::json categorical = nlohmann::json::array();
  for (const auto &m : report.categorical) {
    categorical.push_back(
        {{"threshold", m.threshold},
         {"hits", m.counts.hits},
         {"misses", m.counts.misses},
         {"false_alarms", m.counts.false_alarms},
         {"correct_negatives", m.counts.correct_negatives},
         {"hit_rate", metric_value_to_json(m.hit_rate)},
         {"false_alarm_ratio", metric_value_to_json(m.false_alarm_ratio)},
         {"critical_success_index",
          metric_value_to_json(m.critical_success_index)},
         {"frequency_bias", metric_value_to_json(m.frequency_bias)},
         {"false_alarm_rate", metric_value_to_json(m.false_alarm_rate)}});
  }
  j["categorical"] = categorical;

  // === Probabilistic ===
  if (report.probabilistic) {
    const auto &p = *report.probabilistic;
    nlohmann::json j_prob;
    j_prob["event_threshold"] = p.event_threshold;
    j_prob["sample_count"] = p.sample_count;
    j_prob["base_rate"] = metric_value_to_json(p.base_rate);
    j_prob["brier_score"] = metric_value_to_json(p.brier_score);
    j_prob["brier_skill_score"] = metric_value_to_json(p.brier_skill_score);
    j_prob["crps"] = metric_value_to_json(p.crps);

    nlohmann::json reliability = nlohmann::json::array();
    for (const auto &point : p.reliability) {
      reliability.push_back(
          {{"bin_lower", point.bin_lower},
           {"bin_upper", point.bin_upper},
           {"sample_count", point.sample_count},
           {"mean_forecast_prob",
            metric_value_to_json(point.mean_forecast_prob)},
           {"observed_frequency",
            metric_value_to_json(point.observed_frequency)}});
    }
    j_prob["reliability"] = reliability;

    nlohmann::json roc = nlohmann::json::array();
    for (const auto &point : p.roc) {
      roc.push_back(
          {{"probability_threshold", point.probability_threshold},
           {"hit_rate", metric_value_to_json(point.hit_rate)},
           {"false_alarm_rate", metric_value_to_json(point.false_alarm_rate)}});
    }
    j_prob["roc"] = roc;
    j["probabilistic"] = j_prob;
  } else {
    j["probabilistic"] = nullptr;
  }

  if (report.completeness) {
    j["min_samples"] = report.completeness->min_samples;
    j["sufficient"] = report.completeness->sufficient;
  } else {
    j["min_samples"] = nullptr;
    j["sufficient"] = nullptr;
  }

  // Raw sufficient statistics for auditing
  j["raw"] = state_to_json_object(report.raw);
  return j;
}

nlohmann::json JsonFormatter::reports_to_json_array(
    const std::vector<metrics::MetricsReport> &reports) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &report : reports)
    j.push_back(report_to_json_object(report));
  return j;
}

std::string
JsonFormatter::format_report_to_json(const metrics::MetricsReport &report) {
  return report_to_json_object(report).dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool JsonFormatter::write_reports_file(
    const std::vector<metrics::MetricsReport> &reports, const std::string &path,
    int indent) {
  Utils::create_directory_for_file(path);
  std::ofstream out(path);
  if (!out) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Could not open report file for writing: " << path);
    return false;
  }
  // Names come from external metadata; invalid UTF-8 becomes U+FFFD
  out << reports_to_json_array(reports).dump(
             indent, ' ', false, nlohmann::json::error_handler_t::replace)
      << '\n';
  if (!out) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Failed writing report file: " << path);
    return false;
  }
  LOG(LogLevel::INFO, LogComponent::METRICS,
      "Wrote " << reports.size() << " metric reports to " << path);
  return true;
}
