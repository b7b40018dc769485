#include <f1uc/circuit.hpp>
#include <f1uc/config.hpp>
#include <f1uc/csv.hpp>
#include <f1uc/data_provider.hpp>
#include <f1uc/errors.hpp>
#include <f1uc/log.hpp>
#include <f1uc/observation.hpp>
#include <f1uc/orchestrator.hpp>
#include <f1uc/race_state.hpp>
#include <f1uc/response_json.hpp>
#include <f1uc/version.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace f1uc;

namespace {

struct CliArgs {
  ScenarioRequest req;
  std::string data_path;
  std::string circuits_path;
  std::string config_path;
  std::optional<unsigned> threads;
  std::optional<LogLevel> log_level;
  RaceState state;
  bool status = false;
};

void usage() {
  std::cout << "undercut_cli --gp NAME --year N --driver-a X --driver-b Y --compound C --lap N\n"
               "             --gap SECONDS --tire-age-b LAPS [--gap-trend S_PER_LAP]\n"
               "             [--samples N] [--horizons H] [--p-pit-next P] [--seed N]\n"
               "             [--data observations.csv] [--circuits circuits.csv]\n"
               "             [--config engine.cfg] [--threads N] [--log-level LEVEL]\n"
               "undercut_cli --status\n";
}

bool parse_args(int argc, char** argv, CliArgs* args) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](const std::string& flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    auto need_int = [&](const std::string& flag, int* out) {
      const char* v = need(flag);
      if (!v) return false;
      auto n = csv::to_int(v);
      if (!n) { std::cerr << "Expected an integer for " << flag << "\n"; return false; }
      *out = *n;
      return true;
    };
    auto need_double = [&](const std::string& flag, double* out) {
      const char* v = need(flag);
      if (!v) return false;
      auto d = csv::to_double(v);
      if (!d) { std::cerr << "Expected a number for " << flag << "\n"; return false; }
      *out = *d;
      return true;
    };

    int n = 0;
    if (a == "--gp") {
      const char* v = need(a); if (!v) return false; args->req.gp = v;
    } else if (a == "--year") {
      if (!need_int(a, &args->req.year)) return false;
    } else if (a == "--driver-a") {
      const char* v = need(a); if (!v) return false; args->req.driver_a = v;
    } else if (a == "--driver-b") {
      const char* v = need(a); if (!v) return false; args->req.driver_b = v;
    } else if (a == "--compound") {
      const char* v = need(a); if (!v) return false; args->req.compound_a = v;
    } else if (a == "--lap") {
      if (!need_int(a, &args->req.lap_now)) return false;
    } else if (a == "--samples") {
      if (!need_int(a, &n)) return false; args->req.samples = n;
    } else if (a == "--horizons") {
      if (!need_int(a, &n)) return false; args->req.H = n;
    } else if (a == "--p-pit-next") {
      if (!need_double(a, &args->req.p_pit_next)) return false;
    } else if (a == "--seed") {
      if (!need_int(a, &n) || n < 0) return false;
      args->req.seed = static_cast<std::uint64_t>(n);
    } else if (a == "--gap") {
      if (!need_double(a, &args->state.gap_s)) return false;
    } else if (a == "--tire-age-b") {
      if (!need_int(a, &args->state.tire_age_b)) return false;
    } else if (a == "--gap-trend") {
      if (!need_double(a, &args->state.gap_trend_s_per_lap)) return false;
    } else if (a == "--data") {
      const char* v = need(a); if (!v) return false; args->data_path = v;
    } else if (a == "--circuits") {
      const char* v = need(a); if (!v) return false; args->circuits_path = v;
    } else if (a == "--config") {
      const char* v = need(a); if (!v) return false; args->config_path = v;
    } else if (a == "--threads") {
      if (!need_int(a, &n) || n < 1) return false;
      args->threads = static_cast<unsigned>(n);
    } else if (a == "--log-level") {
      const char* v = need(a); if (!v) return false;
      args->log_level = parse_log_level(v);
      if (!args->log_level) { std::cerr << "Unknown log level: " << v << "\n"; return false; }
    } else if (a == "--status") {
      args->status = true;
    } else if (a == "--help" || a == "-h") {
      usage();
      return false;
    } else {
      std::cerr << "Unknown argument: " << a << "\n";
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!parse_args(argc, argv, &args)) return kExitFailure;

  if (args.status) {
    std::cout << to_json(service_status()) << "\n";
    return 0;
  }

  try {
    EngineConfig cfg;
    if (!args.config_path.empty()) {
      auto loaded = load_engine_config(args.config_path);
      if (!loaded) {
        std::cerr << "Cannot open config: " << args.config_path << "\n";
        return kExitFailure;
      }
      cfg = *loaded;
    }
    if (args.threads) cfg.threads = *args.threads;
    if (args.log_level) cfg.log_level = *args.log_level;
    set_log_level(cfg.log_level);

    InMemoryDataProvider data;
    if (!args.data_path.empty()) {
      auto obs = load_observations_csv(args.data_path);
      if (!obs) {
        std::cerr << "Cannot open observations: " << args.data_path << "\n";
        return kExitFailure;
      }
      data.add_all(*obs);
      log_info("loaded ", obs->size(), " observations from ", args.data_path);
    }

    std::vector<Circuit> circuits = circuit_catalog();
    if (!args.circuits_path.empty()) {
      auto cat = load_circuit_catalog_csv(args.circuits_path);
      if (!cat) {
        std::cerr << "Cannot open circuits: " << args.circuits_path << "\n";
        return kExitFailure;
      }
      circuits = *cat;
    }

    const ProjectedRaceState race(args.req.lap_now, args.state);
    const SimulationOrchestrator engine(data, race, cfg, &circuits);

    const auto resp = engine.run(args.req);
    std::cout << to_json(resp) << "\n";
  } catch (const std::exception&) {
    return report_current_exception(std::cerr);
  }
  return 0;
}
