#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "metrics/verification_metrics.hpp"
#include "nlohmann/json.hpp"

#include <string>
#include <vector>

namespace JsonFormatter {

// Undefined metrics become JSON null, never 0
nlohmann::json metric_value_to_json(const metrics::MetricValue &value);

nlohmann::json entity_to_json_object(const accumulation::EntityKey &entity);
nlohmann::json
state_to_json_object(const accumulation::AccumulatorState &state);
nlohmann::json report_to_json_object(const metrics::MetricsReport &report);
nlohmann::json
reports_to_json_array(const std::vector<metrics::MetricsReport> &reports);

std::string format_report_to_json(const metrics::MetricsReport &report);

// Writes the reports as one JSON array. Returns false if the file cannot be
// written.
bool write_reports_file(const std::vector<metrics::MetricsReport> &reports,
                        const std::string &path, int indent = 2);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
