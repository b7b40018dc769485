#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <f1uc/log.hpp>
#include <f1uc/model_fitter.hpp>

namespace f1uc {

struct EngineConfig {
  FitPolicy fit;                  // per-family minimum observations
  int default_samples = 1000;
  std::uint64_t default_seed = 42;
  int max_samples = 100000;
  int max_horizon = 10;
  unsigned threads = 1;           // Monte Carlo workers per request
  bool cache_models = true;
  LogLevel log_level = LogLevel::Warn;
};

// Applies one key/value pair. Returns false for unknown keys or unparsable values
// (the config is left unchanged in that case).
bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value);

// Stream loader. Rows are "key,value"; '#' comments and blank lines are ignored,
// whitespace is trimmed and invalid rows are skipped. Starts from `base`.
EngineConfig engine_config_from_stream(std::istream& in, const EngineConfig& base = {});

// Filesystem wrapper; nullopt if the file cannot be opened.
std::optional<EngineConfig> load_engine_config(const std::string& path,
                                               const EngineConfig& base = {});

} // namespace f1uc
