#include <f1uc/config.hpp>
#include <f1uc/compound.hpp>
#include <f1uc/csv.hpp>
#include <fstream>

namespace f1uc {

static std::optional<std::size_t> to_count(const std::string& s) {
  const auto v = csv::to_int(s);
  if (!v || *v < 1) return std::nullopt;
  return static_cast<std::size_t>(*v);
}

static std::optional<bool> to_bool(const std::string& s) {
  const auto k = circuit_key(s);
  if (k == "1" || k == "true" || k == "yes" || k == "on") return true;
  if (k == "0" || k == "false" || k == "no" || k == "off") return false;
  return std::nullopt;
}

bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value) {
  const auto k = circuit_key(key);
  const auto v = csv::trim(value);

  if (k == "min_degradation_observations") {
    if (auto n = to_count(v)) { cfg.fit.min_degradation = *n; return true; }
  } else if (k == "min_pit_loss_observations") {
    if (auto n = to_count(v)) { cfg.fit.min_pit_loss = *n; return true; }
  } else if (k == "min_out_lap_observations") {
    if (auto n = to_count(v)) { cfg.fit.min_out_lap = *n; return true; }
  } else if (k == "default_samples") {
    if (auto n = csv::to_int(v); n && *n >= 1) { cfg.default_samples = *n; return true; }
  } else if (k == "max_samples") {
    if (auto n = csv::to_int(v); n && *n >= 1) { cfg.max_samples = *n; return true; }
  } else if (k == "max_horizon") {
    if (auto n = csv::to_int(v); n && *n >= 1) { cfg.max_horizon = *n; return true; }
  } else if (k == "default_seed") {
    if (auto n = csv::to_int(v); n && *n >= 0) {
      cfg.default_seed = static_cast<std::uint64_t>(*n);
      return true;
    }
  } else if (k == "threads") {
    if (auto n = csv::to_int(v); n && *n >= 1) { cfg.threads = static_cast<unsigned>(*n); return true; }
  } else if (k == "cache_models") {
    if (auto b = to_bool(v)) { cfg.cache_models = *b; return true; }
  } else if (k == "log_level") {
    if (auto l = parse_log_level(v)) { cfg.log_level = *l; return true; }
  }
  return false;
}

EngineConfig engine_config_from_stream(std::istream& in, const EngineConfig& base) {
  EngineConfig cfg = base;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (cols.size() < 2 || circuit_key(cols[0]) == "key") continue;
    if (!apply_config_value(cfg, cols[0], cols[1])) {
      log_warn("config line ", line_no, ": ignoring '", raw, "'");
    }
  }
  return cfg;
}

std::optional<EngineConfig> load_engine_config(const std::string& path, const EngineConfig& base) {
  std::ifstream f(path);
  if (!f.is_open()) return std::nullopt;
  return engine_config_from_stream(f, base);
}

} // namespace f1uc
