#include "entity_key.hpp"

#include <sstream>

namespace accumulation {

const char *entity_kind_to_string(EntityKind kind) {
  switch (kind) {
  case EntityKind::GRIDPOINT:
    return "gridpoint";
  case EntityKind::REGION:
    return "region";
  case EntityKind::STATION:
    return "station";
  }
  return "unknown";
}

std::optional<EntityKind> entity_kind_from_string(std::string_view name) {
  if (name == "gridpoint")
    return EntityKind::GRIDPOINT;
  if (name == "region")
    return EntityKind::REGION;
  if (name == "station")
    return EntityKind::STATION;
  return std::nullopt;
}

EntityKey EntityKey::gridpoint(int32_t i, int32_t j, double lat, double lon) {
  EntityKey key;
  key.kind = EntityKind::GRIDPOINT;
  key.grid_i = i;
  key.grid_j = j;
  key.lat = lat;
  key.lon = lon;
  return key;
}

EntityKey EntityKey::region(const RegionKey &region) {
  EntityKey key;
  key.kind = EntityKind::REGION;
  key.type = region.region_type;
  key.id = region.region_id;
  key.name = region.region_name;
  return key;
}

EntityKey EntityKey::station(const std::string &station_id,
                             const std::string &station_name, double lat,
                             double lon, std::optional<double> elevation_m,
                             const std::string &network) {
  EntityKey key;
  key.kind = EntityKind::STATION;
  key.id = station_id;
  key.name = station_name;
  key.type = network;
  key.lat = lat;
  key.lon = lon;
  key.elevation_m = elevation_m;
  return key;
}

bool EntityKey::same_identity(const EntityKey &other) const {
  return kind == other.kind && grid_i == other.grid_i &&
         grid_j == other.grid_j && lat == other.lat && lon == other.lon &&
         id == other.id && type == other.type && name == other.name &&
         elevation_m == other.elevation_m;
}

std::string EntityKey::to_string() const {
  std::ostringstream oss;
  oss << entity_kind_to_string(kind) << "(";
  switch (kind) {
  case EntityKind::GRIDPOINT:
    oss << grid_i << "," << grid_j;
    break;
  case EntityKind::REGION:
    oss << type << "/" << id;
    break;
  case EntityKind::STATION:
    oss << id;
    break;
  }
  oss << ")";
  return oss.str();
}

bool operator<(const EntityKey &lhs, const EntityKey &rhs) {
  return std::tie(lhs.kind, lhs.grid_j, lhs.grid_i, lhs.type, lhs.id) <
         std::tie(rhs.kind, rhs.grid_j, rhs.grid_i, rhs.type, rhs.id);
}

bool operator==(const EntityKey &lhs, const EntityKey &rhs) {
  return !(lhs < rhs) && !(rhs < lhs);
}

std::string AccumulatorKey::to_string() const {
  return entity.to_string() + "[" + variable + "]";
}

} // namespace accumulation
