#ifndef ENTITY_KEY_HPP
#define ENTITY_KEY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace accumulation {

// Closed set of verification granularities. Values are persisted in
// checkpoints, do not renumber.
enum class EntityKind : uint8_t { GRIDPOINT = 0, REGION = 1, STATION = 2 };

const char *entity_kind_to_string(EntityKind kind);
std::optional<EntityKind> entity_kind_from_string(std::string_view name);

struct GridpointKey {
  int32_t i = 0;
  int32_t j = 0;

  bool operator==(const GridpointKey &other) const {
    return i == other.i && j == other.j;
  }
  bool operator!=(const GridpointKey &other) const { return !(*this == other); }
  bool operator<(const GridpointKey &other) const {
    return std::tie(j, i) < std::tie(other.j, other.i);
  }
};

struct RegionKey {
  std::string region_type; // e.g. CWA, RFC, Zone
  std::string region_id;
  std::string region_name;

  bool operator==(const RegionKey &other) const {
    return region_type == other.region_type && region_id == other.region_id;
  }
  bool operator<(const RegionKey &other) const {
    return std::tie(region_type, region_id) <
           std::tie(other.region_type, other.region_id);
  }
};

/**
 * Identity of the thing an accumulator describes.
 *
 * A single record type covers the three kinds; only the fields relevant to
 * `kind` are populated:
 *  - GRIDPOINT: grid_i, grid_j, lat, lon
 *  - REGION:    type (region type), id, name
 *  - STATION:   id, name, type (observing network), lat, lon, elevation_m
 *
 * Ordering (used for map keys and routing) only looks at the routing fields
 * (kind, grid indices, type, id). `same_identity` compares every field and
 * is what merge compatibility is checked against.
 */
struct EntityKey {
  EntityKind kind = EntityKind::GRIDPOINT;
  int32_t grid_i = 0;
  int32_t grid_j = 0;
  double lat = 0.0;
  double lon = 0.0;
  std::string id;
  std::string type;
  std::string name;
  std::optional<double> elevation_m;

  static EntityKey gridpoint(int32_t i, int32_t j, double lat, double lon);
  static EntityKey region(const RegionKey &region);
  static EntityKey station(const std::string &station_id,
                           const std::string &station_name, double lat,
                           double lon,
                           std::optional<double> elevation_m = std::nullopt,
                           const std::string &network = "");

  GridpointKey gridpoint_key() const { return {grid_i, grid_j}; }

  bool same_identity(const EntityKey &other) const;

  // Short human readable form, e.g. "gridpoint(12,40)" or "region(CWA/BOU)"
  std::string to_string() const;
};

bool operator<(const EntityKey &lhs, const EntityKey &rhs);
bool operator==(const EntityKey &lhs, const EntityKey &rhs);
inline bool operator!=(const EntityKey &lhs, const EntityKey &rhs) {
  return !(lhs == rhs);
}

// Key of one accumulator in a run: one per (entity, variable).
struct AccumulatorKey {
  EntityKey entity;
  std::string variable;

  bool operator<(const AccumulatorKey &other) const {
    if (entity < other.entity)
      return true;
    if (other.entity < entity)
      return false;
    return variable < other.variable;
  }
  bool operator==(const AccumulatorKey &other) const {
    return entity == other.entity && variable == other.variable;
  }

  std::string to_string() const;
};

} // namespace accumulation

#endif // ENTITY_KEY_HPP
