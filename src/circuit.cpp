#include <f1uc/circuit.hpp>
#include <f1uc/compound.hpp>
#include <f1uc/csv.hpp>
#include <algorithm>
#include <fstream>

namespace f1uc {

double circuit_pit_loss(const Circuit& c) {
  const double stat = std::max(0.0, c.pit_stationary_s);
  const double lane = std::max(0.0, c.pit_lane_delta_s);
  return stat + lane;
}

static std::vector<Circuit> make_catalog_builtin() {
  return {
    {"bahrain",     2.5, 20.5},
    {"jeddah",      2.5, 17.5},
    {"melbourne",   2.5, 16.5},
    {"imola",       2.5, 25.0},
    {"monaco",      2.5, 19.0},
    {"barcelona",   2.5, 19.5},
    {"silverstone", 2.5, 18.5},
    {"spa",         2.5, 16.0},
    {"monza",       2.5, 21.5},
    {"singapore",   2.5, 26.0},
    {"suzuka",      2.5, 20.0},
  };
}

const std::vector<Circuit>& circuit_catalog() {
  static const std::vector<Circuit> cat = make_catalog_builtin();
  return cat;
}

std::optional<Circuit> circuit_by_key(const std::string& key) {
  return circuit_by_key_in(circuit_catalog(), key);
}

std::optional<Circuit> circuit_by_key_in(const std::vector<Circuit>& cat, const std::string& key) {
  const auto k = circuit_key(key);
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Circuit& c){ return c.key == k; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return false;
  return circuit_key(cols[0]) == "key";
}

static std::optional<Circuit> parse_circuit_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  const std::string key = circuit_key(cols[0]);
  if (key.empty()) return std::nullopt;
  const auto stat = csv::to_double(cols[1]);
  const auto lane = csv::to_double(cols[2]);
  if (!stat || !lane) return std::nullopt;
  return Circuit{key, std::max(0.0, *stat), std::max(0.0, *lane)};
}

std::vector<Circuit> circuit_catalog_from_csv_stream(std::istream& in) {
  std::vector<Circuit> out;
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
    if (auto row = parse_circuit_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Circuit>> load_circuit_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) return std::nullopt;
  return circuit_catalog_from_csv_stream(f);
}

} // namespace f1uc
