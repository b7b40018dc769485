#include <f1uc/response_json.hpp>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace f1uc {

namespace {

std::string escaped(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

std::string num(double v) {
  if (!std::isfinite(v)) return "null";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6g", v);
  return buf;
}

const char* boolean(bool b) { return b ? "true" : "false"; }

void write_result_fields(std::ostringstream& os, const SimulationResult& r) {
  os << "\"p_undercut\":" << num(r.p_undercut)
     << ",\"pitLoss_s\":" << num(r.pit_loss_s)
     << ",\"outLapDelta_s\":" << num(r.out_lap_delta_s);
}

void write_model(std::ostringstream& os, const char* name, const ModelAssumption& m) {
  os << '"' << name << "\":{\"level\":\"" << context_level_name(m.level)
     << "\",\"n\":" << m.sample_count
     << ",\"distribution\":\"" << dist_kind_name(m.kind) << "\"}";
}

} // namespace

std::string to_json(const SimulationResponse& resp) {
  const auto& a = resp.assumptions;
  std::ostringstream os;
  os << '{';
  write_result_fields(os, resp.result);
  os << ",\"expected_margin_s\":" << num(resp.result.success_margin_s)
     << ",\"ci_low_s\":" << num(resp.result.ci_low_s)
     << ",\"ci_high_s\":" << num(resp.result.ci_high_s)
     << ",\"H_used\":" << a.h_laps_simulated;

  os << ",\"assumptions\":{"
     << "\"current_gap_s\":" << num(a.current_gap_s)
     << ",\"tire_age_driver_b\":" << a.tire_age_driver_b
     << ",\"H_laps_simulated\":" << a.h_laps_simulated
     << ",\"compound_a\":\"" << escaped(a.compound_a) << '"'
     << ",\"scenario_distribution\":{"
     << "\"b_stays_out\":" << a.scenario_distribution.b_stays_out
     << ",\"b_pits_lap1\":" << a.scenario_distribution.b_pits_lap1 << '}'
     << ",\"models_fitted\":{"
     << "\"deg_model\":" << boolean(!a.deg_model.used_backoff)
     << ",\"pit_model\":" << boolean(!a.pit_model.used_backoff)
     << ",\"outlap_model\":" << boolean(!a.outlap_model.used_backoff) << '}'
     << ",\"monte_carlo_samples\":" << a.monte_carlo_samples
     << ",\"p_pit_next\":" << num(a.p_pit_next)
     << ",\"seed\":" << a.seed
     << ",\"success_margin_s\":" << num(a.success_margin_s)
     << ",\"avg_degradation_penalty_s\":" << num(a.avg_degradation_penalty_s)
     << ",\"model_context\":{";
  write_model(os, "deg_model", a.deg_model);
  os << ',';
  write_model(os, "pit_model", a.pit_model);
  os << ',';
  write_model(os, "outlap_model", a.outlap_model);
  os << "}}";

  if (!resp.horizons.empty()) {
    os << ",\"horizons\":[";
    for (std::size_t i = 0; i < resp.horizons.size(); ++i) {
      const auto& h = resp.horizons[i];
      if (i) os << ',';
      os << "{\"lap\":" << h.lap << ',';
      write_result_fields(os, h);
      os << ",\"current_gap_s\":" << num(h.current_gap_s)
         << ",\"tire_age_driver_b\":" << h.tire_age_driver_b
         << ",\"success_margin_s\":" << num(h.success_margin_s)
         << ",\"ci_low_s\":" << num(h.ci_low_s)
         << ",\"ci_high_s\":" << num(h.ci_high_s) << '}';
    }
    os << ']';
  }
  if (resp.optimal_pit_lap) os << ",\"optimal_pit_lap\":" << *resp.optimal_pit_lap;
  os << '}';
  return os.str();
}

std::string to_json(const ServiceStatus& status) {
  std::ostringstream os;
  os << "{\"service\":\"" << escaped(status.service)
     << "\",\"version\":\"" << escaped(status.version)
     << "\",\"healthy\":" << boolean(status.healthy) << '}';
  return os.str();
}

} // namespace f1uc
