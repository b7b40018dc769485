#include <f1uc/observation.hpp>
#include <f1uc/csv.hpp>
#include <cmath>
#include <fstream>

namespace f1uc {

const char* family_name(Family f) {
  switch (f) {
    case Family::Degradation: return "degradation";
    case Family::PitLoss:     return "pit_loss";
    case Family::OutLap:      return "out_lap";
  }
  return "unknown";
}

std::optional<Family> parse_family(const std::string& s) {
  const auto k = circuit_key(s);
  if (k == "degradation" || k == "deg") return Family::Degradation;
  if (k == "pit_loss" || k == "pit")    return Family::PitLoss;
  if (k == "out_lap" || k == "outlap")  return Family::OutLap;
  return std::nullopt;
}

double value_cap(Family f) {
  switch (f) {
    case Family::Degradation: return 20.0;
    case Family::PitLoss:     return 120.0;
    case Family::OutLap:      return 10.0;
  }
  return 0.0;
}

bool is_usable(const Observation& o) {
  if (!std::isfinite(o.value_s)) return false;
  if (o.value_s < 0.0 || o.tire_age < 0) return false;
  // A zero-second stop is not a stop.
  if (o.family == Family::PitLoss && o.value_s <= 0.0) return false;
  return o.value_s <= value_cap(o.family);
}

std::vector<Observation> filter_usable(const std::vector<Observation>& in) {
  std::vector<Observation> out;
  out.reserve(in.size());
  for (const auto& o : in) {
    if (is_usable(o)) out.push_back(o);
  }
  return out;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return false;
  return circuit_key(cols[0]) == "family";
}

static std::optional<Observation> parse_observation_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  const auto family = parse_family(cols[0]);
  const auto circuit = circuit_key(cols[1]);
  const auto season = csv::to_int(cols[2]);
  const auto compound = parse_compound(cols[3]);
  const auto age = csv::to_int(cols[4]);
  const auto value = csv::to_double(cols[5]);
  if (!family || circuit.empty() || !season || !compound || !age || !value) {
    return std::nullopt;
  }
  return Observation{*family, circuit, *season, *compound, *age, *value};
}

std::vector<Observation> observations_from_csv_stream(std::istream& in) {
  std::vector<Observation> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (auto row = parse_observation_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Observation>> load_observations_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) return std::nullopt;
  return observations_from_csv_stream(f);
}

} // namespace f1uc
